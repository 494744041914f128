/**
 * @file reading_order_validator.hpp
 * @brief Spatial reading order checks
 *
 * Nodes with a box are collected in document order and bucketed by page.
 * Only consecutive nodes on the same page are compared; pages never
 * influence each other.
 *
 * Coordinates are bottom-up: y grows toward the top of the page.
 *
 * ## Checks (per consecutive pair)
 *
 * 1. **Vertical order**: the next box's top lies above the current box's
 *    bottom by more than vertical_tolerance (critical)
 * 2. **Direction**: on the same visual line, the next box starts before the
 *    current one in the reading direction by more than
 *    horizontal_tolerance (warning)
 * 3. **Overlap**: overlap percentage strictly above overlap_threshold
 *    (warning)
 *
 * ## Column check (per page, three nodes or more)
 *
 * Left edges are sorted and split into columns wherever two neighbours are
 * more than column_gap apart. A pair whose next node sits in an earlier
 * column than the current one is a column jump (warning).
 */

#ifndef TAGCHECK_ANALYSIS_READING_ORDER_VALIDATOR_HPP
#define TAGCHECK_ANALYSIS_READING_ORDER_VALIDATOR_HPP

#include "tagcheck/analysis/finding.hpp"
#include "tagcheck/geometry/bounding_box.hpp"
#include "tagcheck/semantic/error_code_table.hpp"
#include "tagcheck/semantic/semantic_node.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tagcheck::analysis {

// =============================================================================
// Reading Order Options
// =============================================================================

/**
 * @brief Horizontal reading direction
 */
enum class reading_direction {
    left_to_right,
    right_to_left
};

[[nodiscard]] constexpr const char* to_string(reading_direction direction) noexcept {
    switch (direction) {
        case reading_direction::left_to_right: return "left_to_right";
        case reading_direction::right_to_left: return "right_to_left";
        default: return "unknown";
    }
}

/**
 * @brief Options for reading order validation
 */
struct reading_order_options {
    /// Points the next node may start above the current bottom
    double vertical_tolerance = 5.0;

    /// Points the next node may start before the current one on a line
    double horizontal_tolerance = 10.0;

    /// Report overlapping consecutive nodes
    bool check_overlaps = true;

    /// Overlap fraction (0-1) above which nodes overlap
    double overlap_threshold = 0.1;

    /// Detect columns and report backward jumps
    bool validate_columns = true;

    /// Minimum horizontal gap between column starts
    double column_gap = 50.0;

    reading_direction direction = reading_direction::left_to_right;

    /// Default tolerances
    [[nodiscard]] static reading_order_options standard() { return {}; }

    /// Vertical 2, horizontal 5, overlap 0.05
    [[nodiscard]] static reading_order_options strict();

    /// Default tolerances, right-to-left lines
    [[nodiscard]] static reading_order_options right_to_left();
};

// =============================================================================
// Reading Order Result
// =============================================================================

/**
 * @brief Kind of reading order defect
 */
enum class reading_order_issue_type {
    out_of_order,
    reverse_direction,
    overlapping,
    column_jump
};

[[nodiscard]] constexpr const char* to_string(reading_order_issue_type type) noexcept {
    switch (type) {
        case reading_order_issue_type::out_of_order: return "out_of_order";
        case reading_order_issue_type::reverse_direction: return "reverse_direction";
        case reading_order_issue_type::overlapping: return "overlapping";
        case reading_order_issue_type::column_jump: return "column_jump";
        default: return "unknown";
    }
}

/**
 * @brief Defect between two consecutive nodes
 */
struct reading_order_issue {
    reading_order_issue_type type;
    finding_severity severity;
    semantic::node_id node_id1;                 ///< Current node
    std::optional<semantic::node_id> node_id2;  ///< Next node
    std::string message;
    int page_index = 0;
    finding_context context;

    bool operator==(const reading_order_issue&) const = default;
};

/**
 * @brief Result of reading order validation
 */
struct reading_order_result {
    std::vector<reading_order_issue> issues;
    std::size_t total_node_count = 0;  ///< Nodes with a box
    std::size_t page_count = 0;

    [[nodiscard]] bool is_valid() const noexcept { return issues.empty(); }
    [[nodiscard]] std::size_t critical_issue_count() const noexcept;
    [[nodiscard]] std::size_t warning_issue_count() const noexcept;
    [[nodiscard]] std::vector<reading_order_issue> issues_on_page(int page_index) const;
};

/**
 * @brief Convert to flat findings (category reading_order)
 */
[[nodiscard]] std::vector<finding> to_findings(const reading_order_result& result);

// =============================================================================
// Column Detection
// =============================================================================

/**
 * @brief Start x of each column
 *
 * Sorted left edges are split wherever neighbours are more than @p gap
 * apart; each column is represented by its smallest left edge.
 */
[[nodiscard]] std::vector<double> detect_columns(std::vector<double> left_edges, double gap);

/**
 * @brief Column index of a left edge
 *
 * The nearest column start closer than @p gap, otherwise the last column
 * starting at or before @p x. nullopt without columns.
 */
[[nodiscard]] std::optional<std::size_t> find_column(double x, const std::vector<double>& columns,
                                                     double gap);

// =============================================================================
// Reading Order Validator
// =============================================================================

/**
 * @brief Validates spatial plausibility of the document order
 *
 * @example
 * @code
 * reading_order_validator validator{reading_order_options::strict()};
 * auto result = validator.validate(*root);
 * @endcode
 */
class reading_order_validator {
public:
    reading_order_validator() = default;

    explicit reading_order_validator(const reading_order_options& options);

    [[nodiscard]] reading_order_result validate(const semantic::semantic_node& root,
                                                semantic::error_code_table* codes = nullptr) const;

    [[nodiscard]] const reading_order_options& options() const noexcept;

    void set_options(const reading_order_options& options);

private:
    struct placed_node {
        const semantic::semantic_node* node;
        geometry::bounding_box box;
    };

    using issue_list = std::vector<reading_order_issue>;

    void validate_page(const std::vector<placed_node>& nodes, int page_index,
                       issue_list& issues) const;
    void check_spatial_order(const placed_node& current, const placed_node& next, int page_index,
                             issue_list& issues) const;
    void check_overlap(const placed_node& current, const placed_node& next, int page_index,
                       issue_list& issues) const;
    void check_columns(const std::vector<placed_node>& nodes, int page_index,
                       issue_list& issues) const;

    reading_order_options options_;
};

}  // namespace tagcheck::analysis

#endif  // TAGCHECK_ANALYSIS_READING_ORDER_VALIDATOR_HPP
