/**
 * @file ilogger.hpp
 * @brief Logger interface injected into the validation runner
 *
 * Analyzers never log. validation_runner reports progress and fallbacks
 * through a std::shared_ptr<ILogger>, which is LoggerService in a
 * configured engine and NullLogger by default.
 */

#pragma once

#include <tagcheck/compat/format.hpp>
#include <tagcheck/integration/logger_adapter.hpp>

#include <memory>
#include <string_view>

namespace tagcheck::di {

using integration::log_level;

// =============================================================================
// Logger Interface
// =============================================================================

/**
 * @brief Sink for runner diagnostics
 *
 * Implementations may be called from pool workers concurrently.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(log_level level, std::string_view message) = 0;

    [[nodiscard]] virtual bool accepts(log_level level) const noexcept = 0;

    // Arguments are only formatted when the level is accepted.

    template <typename... Args>
    void debug_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (accepts(log_level::debug)) {
            write(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (accepts(log_level::info)) {
            write(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (accepts(log_level::warn)) {
            write(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
};

// =============================================================================
// Implementations
// =============================================================================

class NullLogger final : public ILogger {
public:
    void write(log_level /*level*/, std::string_view /*message*/) override {}

    [[nodiscard]] bool accepts(log_level /*level*/) const noexcept override { return false; }
};

/**
 * @brief Forwards to integration::logger_adapter
 *
 * Silent until the adapter has been initialized, see config::engine_session.
 */
class LoggerService final : public ILogger {
public:
    void write(log_level level, std::string_view message) override {
        integration::logger_adapter::log(level, message);
    }

    [[nodiscard]] bool accepts(log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }
};

/// Shared NullLogger, the runner's default
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace tagcheck::di
