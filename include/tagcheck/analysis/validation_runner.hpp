/**
 * @file validation_runner.hpp
 * @brief Runs the analyzers over one tree and aggregates their findings
 *
 * The analyzers are independent, so the runner may execute them
 * concurrently on the shared thread pool. Reports are identical whichever
 * mode is used: findings are always assembled in the order structure,
 * heading, reading order, table.
 */

#ifndef TAGCHECK_ANALYSIS_VALIDATION_RUNNER_HPP
#define TAGCHECK_ANALYSIS_VALIDATION_RUNNER_HPP

#include "tagcheck/analysis/finding.hpp"
#include "tagcheck/analysis/heading_hierarchy_checker.hpp"
#include "tagcheck/analysis/reading_order_validator.hpp"
#include "tagcheck/analysis/structure_analyzer.hpp"
#include "tagcheck/analysis/table_structure_validator.hpp"
#include "tagcheck/di/ilogger.hpp"
#include "tagcheck/semantic/error_code_table.hpp"
#include "tagcheck/semantic/semantic_node.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace tagcheck::analysis {

// =============================================================================
// Runner Options
// =============================================================================

/**
 * @brief Which analyzers run, and how
 */
struct runner_options {
    bool run_structure = true;
    bool run_headings = true;
    bool run_reading_order = true;
    bool run_tables = true;

    /// Run the analyzers on the thread pool
    bool parallel = false;
};

/**
 * @brief Options of every analyzer plus the runner itself
 */
struct validation_options {
    structure_analysis_options structure;
    heading_validation_options headings;
    reading_order_options reading_order;
    table_validation_options tables;
    runner_options runner;
};

// =============================================================================
// Validation Report
// =============================================================================

/**
 * @brief Typed results of each analyzer that ran, plus flat findings
 */
struct validation_report {
    std::optional<structure_analysis_result> structure;
    std::optional<heading_validation_result> headings;
    std::optional<reading_order_result> reading_order;
    std::vector<table_validation_result> tables;

    /// All findings in analyzer order
    std::vector<finding> findings;

    /// No critical or error finding
    [[nodiscard]] bool passed() const noexcept { return !has_blocking(findings); }

    [[nodiscard]] std::size_t count(finding_severity severity) const noexcept {
        return count_with_severity(findings, severity);
    }

    /// Findings without a severity (structure findings)
    [[nodiscard]] std::size_t unrated_count() const noexcept;

    [[nodiscard]] std::vector<finding> findings_in(finding_category category) const;
};

// =============================================================================
// Validation Runner
// =============================================================================

/**
 * @brief Runs the configured analyzers and builds a report
 *
 * @example
 * @code
 * validation_options options;
 * options.runner.parallel = true;
 * validation_runner runner{options, std::make_shared<di::LoggerService>()};
 *
 * semantic::error_code_table codes;
 * auto report = runner.run(*root, &codes);
 * if (!report.passed()) { ... }
 * @endcode
 */
class validation_runner {
public:
    explicit validation_runner(const validation_options& options = {},
                               std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Validate the tree rooted at @p root
     * @param codes Side table annotated by every analyzer, may be null
     */
    [[nodiscard]] validation_report run(const semantic::semantic_node& root,
                                        semantic::error_code_table* codes = nullptr) const;

    [[nodiscard]] const validation_options& options() const noexcept { return options_; }

    void set_options(const validation_options& options) { options_ = options; }

private:
    void run_sequential(const semantic::semantic_node& root, semantic::error_code_table* codes,
                        validation_report& report) const;
    void run_parallel(const semantic::semantic_node& root, semantic::error_code_table* codes,
                      validation_report& report) const;
    void collect_findings(validation_report& report) const;

    validation_options options_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace tagcheck::analysis

#endif  // TAGCHECK_ANALYSIS_VALIDATION_RUNNER_HPP
