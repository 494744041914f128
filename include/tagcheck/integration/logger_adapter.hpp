/**
 * @file logger_adapter.hpp
 * @brief Process-wide logging backed by logger_system
 *
 * One kcenon::logger instance, created from the logging section of the
 * engine configuration. The analysis layer reaches it through
 * di::LoggerService rather than calling this class directly.
 */

#pragma once

#include <tagcheck/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace tagcheck::integration {

// ─────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

[[nodiscard]] constexpr const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::trace: return "trace";
        case log_level::debug: return "debug";
        case log_level::info: return "info";
        case log_level::warn: return "warn";
        case log_level::error: return "error";
        case log_level::fatal: return "fatal";
        case log_level::off: return "off";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @brief The `logging:` section of the engine configuration
 */
struct logger_config {
    /// Directory receiving tagcheck.log when file output is on
    std::filesystem::path log_directory{"logs"};

    log_level min_level{log_level::info};

    bool enable_console{true};
    bool enable_file{false};

    /// Rotation threshold of tagcheck.log
    std::size_t max_file_size_mb{10};

    /// Rotated files kept besides the active one
    std::size_t max_files{5};

    bool async_mode{true};

    /// Queue capacity of the asynchronous writer thread
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter
// ─────────────────────────────────────────────────────

/**
 * @brief Owner of the process-wide logger_system instance
 *
 * Until initialize() succeeds, and again after shutdown(), every level is
 * disabled and log() discards its message.
 *
 * Thread Safety: All methods are thread-safe.
 */
class logger_adapter {
public:
    /**
     * @brief Create the writers named by @p config and start the logger
     *
     * @return logging_already_started when a logger is running,
     *         logging_start_failed when the log directory cannot be created
     */
    [[nodiscard]] static auto initialize(const logger_config& config) -> VoidResult;

    /// Drain queued messages and destroy the logger
    static void shutdown();

    [[nodiscard]] static auto is_initialized() -> bool;

    static void log(log_level level, std::string_view message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    logger_adapter() = delete;
};

}  // namespace tagcheck::integration
