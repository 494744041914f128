/**
 * @file logger_adapter.cpp
 * @brief logger_adapter on top of kcenon::logger
 */

#include <tagcheck/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace tagcheck::integration {

namespace {

constexpr std::size_t bytes_per_mb = 1024 * 1024;

auto to_backend(log_level level) -> kcenon::logger::log_level {
    using backend = kcenon::logger::log_level;
    switch (level) {
        case log_level::trace: return backend::trace;
        case log_level::debug: return backend::debug;
        case log_level::info: return backend::info;
        case log_level::warn: return backend::warn;
        case log_level::error: return backend::error;
        case log_level::fatal: return backend::fatal;
        case log_level::off: break;
    }
    return backend::off;
}

/// The running logger; threshold is off while there is none
struct logging_state {
    std::mutex mutex;
    std::unique_ptr<kcenon::logger::logger> backend;
    std::atomic<log_level> threshold{log_level::off};

    ~logging_state() {
        if (backend) {
            backend->flush();
            backend->stop();
        }
    }
};

auto state() -> logging_state& {
    static logging_state instance;
    return instance;
}

}  // namespace

auto logger_adapter::initialize(const logger_config& config) -> VoidResult {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (s.backend) {
        return tagcheck_void_error(error_codes::logging_already_started,
                                   "Logger is already running");
    }

    if (config.enable_file) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_directory, ec);
        if (ec) {
            return tagcheck_void_error(error_codes::logging_start_failed,
                                       "Cannot create log directory",
                                       config.log_directory.string() + ": " + ec.message());
        }
    }

    auto backend = std::make_unique<kcenon::logger::logger>(config.async_mode, config.buffer_size);
    backend->set_min_level(to_backend(config.min_level));
    if (config.enable_console) {
        backend->add_writer(std::make_unique<kcenon::logger::console_writer>());
    }
    if (config.enable_file) {
        backend->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
            (config.log_directory / "tagcheck.log").string(),
            config.max_file_size_mb * bytes_per_mb, config.max_files));
    }
    backend->start();

    s.backend = std::move(backend);
    s.threshold.store(config.min_level);
    return ok();
}

void logger_adapter::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    s.threshold.store(log_level::off);
    if (s.backend) {
        s.backend->flush();
        s.backend->stop();
        s.backend.reset();
    }
}

auto logger_adapter::is_initialized() -> bool {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.backend != nullptr;
}

void logger_adapter::log(log_level level, std::string_view message) {
    if (!is_level_enabled(level)) {
        return;
    }
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.backend) {
        s.backend->log(to_backend(level), std::string{message});
    }
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    const auto threshold = state().threshold.load();
    return level != log_level::off && threshold != log_level::off &&
           static_cast<int>(level) >= static_cast<int>(threshold);
}

void logger_adapter::flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.backend) {
        s.backend->flush();
    }
}

}  // namespace tagcheck::integration
