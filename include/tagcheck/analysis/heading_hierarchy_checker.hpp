/**
 * @file heading_hierarchy_checker.hpp
 * @brief Heading level sequencing checks
 *
 * Headings are collected in document order. A generic H without a level
 * role takes its level from the Level attribute, else level 1.
 *
 * ## Checks
 *
 * 1. **Single H1**: several H1 headings are each reported (critical); no H1
 *    at all is reported on the first heading (critical)
 * 2. **First heading**: the first heading should be H1 (warning)
 * 3. **Empty headings**: no children, no text alternative, no text (critical)
 * 4. **Meaningful text**: too short, or a generic phrase such as
 *    "Untitled" (warning)
 * 5. **Skipped levels**: a level more than one below the previous heading
 *    (critical)
 * 6. **Maximum level**: levels above the configured ceiling (warning)
 *
 * The previous level is updated after every heading, so one bad heading
 * does not cascade into the following ones.
 */

#ifndef TAGCHECK_ANALYSIS_HEADING_HIERARCHY_CHECKER_HPP
#define TAGCHECK_ANALYSIS_HEADING_HIERARCHY_CHECKER_HPP

#include "tagcheck/analysis/finding.hpp"
#include "tagcheck/semantic/error_code_table.hpp"
#include "tagcheck/semantic/semantic_node.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::analysis {

// =============================================================================
// Heading Validation Options
// =============================================================================

/**
 * @brief Options for heading hierarchy validation
 */
struct heading_validation_options {
    /// Require exactly one H1
    bool require_single_h1 = true;

    /// Report levels skipped between consecutive headings
    bool check_skipped_levels = true;

    /// Report headings without content
    bool check_empty_headings = true;

    /// Report short or generic heading text
    bool validate_heading_text = true;

    /// Warn when the first heading is not H1
    bool require_first_h1 = true;

    /// Highest acceptable heading level
    int max_heading_level = 6;

    /// Minimum trimmed heading text length, in characters
    std::size_t min_heading_text_length = 1;

    /// Every check enabled
    [[nodiscard]] static heading_validation_options all() { return {}; }

    /// Skipped levels, empty headings and the level ceiling only
    [[nodiscard]] static heading_validation_options basic();

    /// Every check enabled
    [[nodiscard]] static heading_validation_options strict() { return {}; }
};

// =============================================================================
// Heading Validation Result
// =============================================================================

/**
 * @brief Kind of heading defect
 */
enum class heading_issue_type {
    multiple_h1,
    no_h1,
    first_heading_not_h1,
    empty_heading,
    non_meaningful_text,
    level_skipped,
    level_exceeds_maximum
};

[[nodiscard]] constexpr const char* to_string(heading_issue_type type) noexcept {
    switch (type) {
        case heading_issue_type::multiple_h1: return "multiple_h1";
        case heading_issue_type::no_h1: return "no_h1";
        case heading_issue_type::first_heading_not_h1: return "first_heading_not_h1";
        case heading_issue_type::empty_heading: return "empty_heading";
        case heading_issue_type::non_meaningful_text: return "non_meaningful_text";
        case heading_issue_type::level_skipped: return "level_skipped";
        case heading_issue_type::level_exceeds_maximum: return "level_exceeds_maximum";
        default: return "unknown";
    }
}

/**
 * @brief Single heading defect
 */
struct heading_issue {
    heading_issue_type type;
    finding_severity severity;
    semantic::node_id node_id;
    int heading_level = 0;
    std::string message;
    std::optional<int> page_index;
    finding_context context;

    bool operator==(const heading_issue&) const = default;
};

/**
 * @brief Result of heading hierarchy validation
 */
struct heading_validation_result {
    std::vector<heading_issue> issues;
    std::size_t total_heading_count = 0;
    std::map<int, std::size_t> headings_by_level;

    /// No issue of any severity
    [[nodiscard]] bool is_valid() const noexcept { return issues.empty(); }

    [[nodiscard]] std::size_t critical_issue_count() const noexcept;

    /// Highest level present, 0 without headings
    [[nodiscard]] int max_heading_level() const noexcept;

    [[nodiscard]] bool has_single_h1() const noexcept;

    [[nodiscard]] std::vector<heading_issue> issues_of_type(heading_issue_type type) const;
};

/**
 * @brief Convert to flat findings (category heading)
 */
[[nodiscard]] std::vector<finding> to_findings(const heading_validation_result& result);

/**
 * @brief Whether @p text is a generic placeholder phrase
 *
 * Case-insensitive exact match against "heading", "title", "section",
 * "chapter", "untitled", "new heading" and "click here".
 */
[[nodiscard]] bool is_generic_heading_text(std::string_view text);

/**
 * @brief Level of a heading node
 *
 * H1-H6 map directly; a generic H uses its Level attribute, else 1.
 * A Level outside [1, INT_MAX] counts as absent. Non-heading roles give
 * nullopt.
 */
[[nodiscard]] std::optional<int> resolve_heading_level(const semantic::semantic_node& node);

// =============================================================================
// Heading Hierarchy Checker
// =============================================================================

/**
 * @brief Validates heading level sequencing
 *
 * @example
 * @code
 * heading_hierarchy_checker checker{heading_validation_options::basic()};
 * auto result = checker.validate(*root);
 * if (!result.is_valid()) { ... }
 * @endcode
 */
class heading_hierarchy_checker {
public:
    heading_hierarchy_checker() = default;

    explicit heading_hierarchy_checker(const heading_validation_options& options);

    [[nodiscard]] heading_validation_result validate(
        const semantic::semantic_node& root,
        semantic::error_code_table* codes = nullptr) const;

    [[nodiscard]] const heading_validation_options& options() const noexcept;

    void set_options(const heading_validation_options& options);

private:
    struct heading_entry {
        const semantic::semantic_node* node;
        int level;
    };

    using issue_list = std::vector<heading_issue>;

    void check_h1_count(const std::vector<heading_entry>& headings, issue_list& issues) const;
    void check_first_heading(const std::vector<heading_entry>& headings,
                             issue_list& issues) const;
    void check_heading_text(const heading_entry& heading, issue_list& issues) const;

    heading_validation_options options_;
};

}  // namespace tagcheck::analysis

#endif  // TAGCHECK_ANALYSIS_HEADING_HIERARCHY_CHECKER_HPP
