/**
 * @file finding.hpp
 * @brief Flat finding record shared by all analyzers
 *
 * Each analyzer reports its own typed issues; to_findings() overloads in
 * the analyzer headers convert them into this record for aggregation.
 */

#ifndef TAGCHECK_ANALYSIS_FINDING_HPP
#define TAGCHECK_ANALYSIS_FINDING_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tagcheck::analysis {

// =============================================================================
// Severity and Category
// =============================================================================

/**
 * @brief Severity of a finding
 */
enum class finding_severity {
    critical,  ///< Blocks accessibility
    error,     ///< Non-compliant
    warning,   ///< Likely problem
    info       ///< Suggestion
};

[[nodiscard]] constexpr const char* to_string(finding_severity severity) noexcept {
    switch (severity) {
        case finding_severity::critical: return "critical";
        case finding_severity::error: return "error";
        case finding_severity::warning: return "warning";
        case finding_severity::info: return "info";
        default: return "unknown";
    }
}

/// Critical and error findings fail a validation
[[nodiscard]] constexpr bool is_blocking(finding_severity severity) noexcept {
    return severity == finding_severity::critical || severity == finding_severity::error;
}

/**
 * @brief Analyzer that produced a finding
 */
enum class finding_category {
    structure,
    heading,
    reading_order,
    table
};

[[nodiscard]] constexpr const char* to_string(finding_category category) noexcept {
    switch (category) {
        case finding_category::structure: return "structure";
        case finding_category::heading: return "heading";
        case finding_category::reading_order: return "reading_order";
        case finding_category::table: return "table";
        default: return "unknown";
    }
}

/// Key/value details of a finding, ordered by key
using finding_context = std::map<std::string, std::string>;

// =============================================================================
// Finding
// =============================================================================

/**
 * @brief Single reported defect
 */
struct finding {
    std::string code;                            ///< Machine-readable code
    finding_category category;                   ///< Producing analyzer
    std::optional<finding_severity> severity;    ///< Unset for raw structure facts
    std::string node_id;                         ///< Affected node
    std::optional<std::string> related_node_id;  ///< Second node of a pair check
    std::string message;                         ///< Human-readable description
    std::optional<int> page_index;               ///< Page of the affected node
    finding_context context;                     ///< Details

    bool operator==(const finding&) const = default;
};

/**
 * @brief Count findings with @p severity
 */
[[nodiscard]] std::size_t count_with_severity(const std::vector<finding>& findings,
                                              finding_severity severity) noexcept;

/**
 * @brief True when some finding has a blocking severity
 */
[[nodiscard]] bool has_blocking(const std::vector<finding>& findings) noexcept;

/**
 * @brief One-line rendering, e.g. "[critical] heading/level_skipped h3: ..."
 */
[[nodiscard]] std::string to_string(const finding& f);

/**
 * @brief Format a value with two decimals, as used in finding contexts
 */
[[nodiscard]] std::string format_decimal(double value, int precision = 2);

}  // namespace tagcheck::analysis

#endif  // TAGCHECK_ANALYSIS_FINDING_HPP
