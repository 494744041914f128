/**
 * @file finding.cpp
 * @brief Implementation of finding helpers
 */

#include "tagcheck/analysis/finding.hpp"

#include "tagcheck/compat/format.hpp"

#include <algorithm>

namespace tagcheck::analysis {

std::size_t count_with_severity(const std::vector<finding>& findings,
                                finding_severity severity) noexcept {
    return static_cast<std::size_t>(
        std::count_if(findings.begin(), findings.end(),
                      [severity](const finding& f) { return f.severity == severity; }));
}

bool has_blocking(const std::vector<finding>& findings) noexcept {
    return std::any_of(findings.begin(), findings.end(), [](const finding& f) {
        return f.severity.has_value() && is_blocking(*f.severity);
    });
}

std::string to_string(const finding& f) {
    const char* severity = f.severity ? to_string(*f.severity) : "unrated";
    return compat::format("[{}] {}/{} {}: {}", severity, to_string(f.category), f.code,
                          f.node_id, f.message);
}

std::string format_decimal(double value, int precision) {
    return compat::format("{:.{}f}", value, precision);
}

}  // namespace tagcheck::analysis
