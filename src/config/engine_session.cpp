/**
 * @file engine_session.cpp
 * @brief Implementation of engine_session
 */

#include <tagcheck/config/engine_session.hpp>

#include <tagcheck/compat/format.hpp>
#include <tagcheck/config/config_loader.hpp>
#include <tagcheck/di/ilogger.hpp>

namespace tagcheck::config {

using session_result = Result<std::unique_ptr<engine_session>>;

auto engine_session::open(const engine_config& config) -> session_result {
    if (auto valid = config_loader::validate(config); valid.is_err()) {
        return session_result(valid.error());
    }
    if (auto started = integration::logger_adapter::initialize(config.logging);
        started.is_err()) {
        return session_result(started.error());
    }
    integration::thread_adapter::configure(config.threads);

    std::unique_ptr<engine_session> session(new engine_session(config));
    integration::logger_adapter::log(
        integration::log_level::info,
        compat::format("Engine started: log level {}, {} analysis",
                       integration::to_string(config.logging.min_level),
                       config.analysis.runner.parallel ? "parallel" : "sequential"));
    return session_result::ok(std::move(session));
}

auto engine_session::open_file(const std::filesystem::path& path) -> session_result {
    auto loaded = config_loader::load(path);
    if (loaded.is_err()) {
        return session_result(loaded.error());
    }
    return open(loaded.value());
}

engine_session::engine_session(const engine_config& config)
    : config_(config),
      runner_(config.analysis, std::make_shared<di::LoggerService>()) {}

engine_session::~engine_session() {
    integration::thread_adapter::shutdown(true);
    integration::logger_adapter::shutdown();
}

analysis::validation_report engine_session::run(const semantic::semantic_node& root,
                                                semantic::error_code_table* codes) const {
    return runner_.run(root, codes);
}

}  // namespace tagcheck::config
