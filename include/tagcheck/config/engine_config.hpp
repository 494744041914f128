/**
 * @file engine_config.hpp
 * @brief Complete configuration of the validation engine
 */

#pragma once

#include <tagcheck/analysis/validation_runner.hpp>
#include <tagcheck/integration/logger_adapter.hpp>
#include <tagcheck/integration/thread_adapter.hpp>

namespace tagcheck::config {

// =============================================================================
// Engine Configuration
// =============================================================================

/**
 * @brief Aggregates the analyzer, runner, logging and pool settings
 *
 * The analysis member is passed unchanged to analysis::validation_runner.
 */
struct engine_config {
    /// Analyzer and runner options
    analysis::validation_options analysis;

    /// Logging settings
    integration::logger_config logging;

    /// Worker pool settings, used when analysis.runner.parallel is set
    integration::thread_pool_config threads;
};

}  // namespace tagcheck::config
