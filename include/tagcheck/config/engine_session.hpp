/**
 * @file engine_session.hpp
 * @brief Validation engine brought up from an engine_config
 *
 * @code
 * auto session = engine_session::open_file("tagcheck.yaml");
 * if (session.is_err()) {
 *     std::cerr << session.error().message << "\n";
 *     return 1;
 * }
 * auto report = session.value()->run(*root);
 * @endcode
 */

#pragma once

#include <tagcheck/analysis/validation_runner.hpp>
#include <tagcheck/config/engine_config.hpp>
#include <tagcheck/core/result.hpp>

#include <filesystem>
#include <memory>

namespace tagcheck::config {

// =============================================================================
// Engine Session
// =============================================================================

/**
 * @brief Owns the process-wide logger and worker pool for its lifetime
 *
 * Opening starts logger_system from the logging section, hands the threads
 * section to thread_adapter and builds a runner that logs through
 * di::LoggerService. Destruction stops the pool and the logger. At most one
 * session can be open at a time.
 */
class engine_session {
public:
    /**
     * @brief Start an engine with @p config
     * @return config_out_of_range when the config fails validation,
     *         logging_already_started while another session is open,
     *         logging_start_failed when file logging cannot be set up
     */
    [[nodiscard]] static auto open(const engine_config& config)
        -> Result<std::unique_ptr<engine_session>>;

    /**
     * @brief Load @p path with config_loader and open() the result
     */
    [[nodiscard]] static auto open_file(const std::filesystem::path& path)
        -> Result<std::unique_ptr<engine_session>>;

    ~engine_session();

    engine_session(const engine_session&) = delete;
    engine_session& operator=(const engine_session&) = delete;

    [[nodiscard]] analysis::validation_report run(
        const semantic::semantic_node& root,
        semantic::error_code_table* codes = nullptr) const;

    [[nodiscard]] const engine_config& config() const noexcept { return config_; }

    [[nodiscard]] const analysis::validation_runner& runner() const noexcept { return runner_; }

private:
    explicit engine_session(const engine_config& config);

    engine_config config_;
    analysis::validation_runner runner_;
};

}  // namespace tagcheck::config
