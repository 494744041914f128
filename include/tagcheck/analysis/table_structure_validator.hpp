/**
 * @file table_structure_validator.hpp
 * @brief Table header, regularity and visual agreement checks
 *
 * ## Checks
 *
 * 1. **Headers**: a table with more than one row needs header cells
 *    (error); header cells outside a THead are noted (warning)
 * 2. **Regularity**: rows with differing cell counts (one error per
 *    table); rows without cells (error per row)
 * 3. **Visual agreement**: with a visual border attached, the border rows
 *    and columns should match the declared rows and widest row (warning)
 * 4. **Cell types**: row children other than TH/TD (error); rows mixing TH
 *    and TD (info)
 *
 * Row and column spans are not taken into account; a table using spans can
 * be reported as irregular.
 *
 * Severities are fixed per check. A table passes when no error-severity
 * finding exists.
 */

#ifndef TAGCHECK_ANALYSIS_TABLE_STRUCTURE_VALIDATOR_HPP
#define TAGCHECK_ANALYSIS_TABLE_STRUCTURE_VALIDATOR_HPP

#include "tagcheck/analysis/finding.hpp"
#include "tagcheck/semantic/error_code.hpp"
#include "tagcheck/semantic/error_code_table.hpp"
#include "tagcheck/semantic/table_node.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tagcheck::analysis {

// =============================================================================
// Table Validation Options
// =============================================================================

/**
 * @brief Options for table structure validation
 */
struct table_validation_options {
    /// Require header cells in multi-row tables
    bool require_headers = true;

    /// Note header cells outside a THead group
    bool recommend_header_group = true;

    /// Check consistent cell counts and empty rows
    bool validate_regularity = true;

    /// Compare against the visual border when one is attached
    bool validate_visual_match = true;

    /// Every check enabled
    [[nodiscard]] static table_validation_options strict() { return {}; }

    /// Cell type checks only
    [[nodiscard]] static table_validation_options lenient();

    /// Header requirement and cell type checks
    [[nodiscard]] static table_validation_options basic();
};

// =============================================================================
// Table Validation Result
// =============================================================================

/**
 * @brief Single table defect
 */
struct table_error {
    semantic::semantic_error_code code;
    finding_severity severity;
    semantic::node_id node_id;  ///< Table, row or cell
    semantic::semantic_type node_type;
    std::string message;
    std::optional<int> page_index;
    finding_context context;

    bool operator==(const table_error&) const = default;
};

/**
 * @brief Result of validating one table
 */
struct table_validation_result {
    semantic::node_id table_id;
    std::vector<table_error> errors;
    std::size_t row_count = 0;
    std::size_t max_cells_per_row = 0;

    /// No error-severity finding
    [[nodiscard]] bool passed() const noexcept;

    [[nodiscard]] std::size_t count_with_severity(finding_severity severity) const noexcept;

    [[nodiscard]] std::vector<table_error> errors_with_code(
        semantic::semantic_error_code code) const;
};

/**
 * @brief Convert to flat findings (category table)
 */
[[nodiscard]] std::vector<finding> to_findings(const table_validation_result& result);

// =============================================================================
// Table Structure Validator
// =============================================================================

/**
 * @brief Validates declared table structure
 *
 * @example
 * @code
 * table_structure_validator validator;
 * for (const auto& result : validator.validate_all(*root)) {
 *     if (!result.passed()) { ... }
 * }
 * @endcode
 */
class table_structure_validator {
public:
    table_structure_validator() = default;

    explicit table_structure_validator(const table_validation_options& options);

    [[nodiscard]] table_validation_result validate(
        const semantic::table_node& table,
        semantic::error_code_table* codes = nullptr) const;

    /**
     * @brief Validate every table node under @p root, in document order
     *
     * A Table-role node that is not a table_node gets a result holding a
     * single table_irregular_structure error.
     */
    [[nodiscard]] std::vector<table_validation_result> validate_all(
        const semantic::semantic_node& root,
        semantic::error_code_table* codes = nullptr) const;

    [[nodiscard]] const table_validation_options& options() const noexcept;

    void set_options(const table_validation_options& options);

private:
    using error_list = std::vector<table_error>;

    /// Result for a Table-role node built as some other variant
    [[nodiscard]] table_validation_result reject_non_table(
        const semantic::semantic_node& node, semantic::error_code_table* codes) const;

    void check_headers(const semantic::table_node& table, error_list& errors) const;
    void check_regularity(const semantic::table_node& table, error_list& errors) const;
    void check_visual_match(const semantic::table_node& table, error_list& errors) const;
    void check_cell_structure(const semantic::table_node& table, error_list& errors) const;

    table_validation_options options_;
};

}  // namespace tagcheck::analysis

#endif  // TAGCHECK_ANALYSIS_TABLE_STRUCTURE_VALIDATOR_HPP
