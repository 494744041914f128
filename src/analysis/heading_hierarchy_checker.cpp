/**
 * @file heading_hierarchy_checker.cpp
 * @brief Implementation of the heading hierarchy checker
 */

#include "tagcheck/analysis/heading_hierarchy_checker.hpp"

#include "tagcheck/compat/format.hpp"
#include "tagcheck/semantic/node_tree.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <limits>

namespace tagcheck::analysis {

using semantic::semantic_error_code;
using semantic::semantic_node;

namespace {

constexpr std::array<std::string_view, 7> generic_heading_phrases = {
    "heading", "title", "section", "chapter", "untitled", "new heading", "click here"};

std::string trim(std::string_view text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), is_space);
    auto last = std::find_if_not(text.rbegin(), std::make_reverse_iterator(first), is_space);
    return std::string(first, last.base());
}

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

// UTF-8 code points: every byte that is not a continuation byte
std::size_t character_count(std::string_view text) noexcept {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

semantic_error_code error_code_for(heading_issue_type type) noexcept {
    switch (type) {
        case heading_issue_type::multiple_h1: return semantic_error_code::multiple_h1_headings;
        case heading_issue_type::no_h1: return semantic_error_code::heading_missing_h1;
        case heading_issue_type::first_heading_not_h1:
            return semantic_error_code::heading_first_not_h1;
        case heading_issue_type::empty_heading: return semantic_error_code::empty_heading;
        case heading_issue_type::non_meaningful_text:
            return semantic_error_code::heading_text_not_meaningful;
        case heading_issue_type::level_skipped: return semantic_error_code::heading_level_skipped;
        case heading_issue_type::level_exceeds_maximum:
        default:
            return semantic_error_code::heading_level_exceeds_maximum;
    }
}

heading_issue make_issue(heading_issue_type type, finding_severity severity,
                         const semantic_node& node, int level, std::string message,
                         finding_context context = {}) {
    return heading_issue{type,  severity, node.id(), level, std::move(message),
                         node.page_index(), std::move(context)};
}

}  // namespace

// =============================================================================
// Options and Result
// =============================================================================

heading_validation_options heading_validation_options::basic() {
    heading_validation_options opts;
    opts.require_single_h1 = false;
    opts.validate_heading_text = false;
    opts.require_first_h1 = false;
    return opts;
}

std::size_t heading_validation_result::critical_issue_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(issues.begin(), issues.end(), [](const heading_issue& i) {
            return i.severity == finding_severity::critical;
        }));
}

int heading_validation_result::max_heading_level() const noexcept {
    return headings_by_level.empty() ? 0 : headings_by_level.rbegin()->first;
}

bool heading_validation_result::has_single_h1() const noexcept {
    auto it = headings_by_level.find(1);
    return it != headings_by_level.end() && it->second == 1;
}

std::vector<heading_issue> heading_validation_result::issues_of_type(
    heading_issue_type type) const {
    std::vector<heading_issue> matching;
    std::copy_if(issues.begin(), issues.end(), std::back_inserter(matching),
                 [type](const heading_issue& i) { return i.type == type; });
    return matching;
}

std::vector<finding> to_findings(const heading_validation_result& result) {
    std::vector<finding> findings;
    findings.reserve(result.issues.size());
    for (const auto& i : result.issues) {
        findings.push_back(finding{to_string(i.type), finding_category::heading, i.severity,
                                   i.node_id, std::nullopt, i.message, i.page_index,
                                   i.context});
    }
    return findings;
}

bool is_generic_heading_text(std::string_view text) {
    const auto lowered = to_lower(text);
    return std::find(generic_heading_phrases.begin(), generic_heading_phrases.end(), lowered) !=
           generic_heading_phrases.end();
}

std::optional<int> resolve_heading_level(const semantic_node& node) {
    if (!semantic::is_heading(node.type())) {
        return std::nullopt;
    }
    if (auto level = semantic::heading_level(node.type())) {
        return level;
    }
    if (const auto* attr = node.attribute(semantic::attribute_keys::level)) {
        auto value = attr->to_integer();
        if (value && *value >= 1 && *value <= std::numeric_limits<int>::max()) {
            return static_cast<int>(*value);
        }
    }
    return 1;
}

// =============================================================================
// Checker
// =============================================================================

heading_hierarchy_checker::heading_hierarchy_checker(const heading_validation_options& options)
    : options_(options) {}

const heading_validation_options& heading_hierarchy_checker::options() const noexcept {
    return options_;
}

void heading_hierarchy_checker::set_options(const heading_validation_options& options) {
    options_ = options;
}

heading_validation_result heading_hierarchy_checker::validate(
    const semantic_node& root, semantic::error_code_table* codes) const {
    std::vector<heading_entry> headings;
    for (const auto* node : root.all_descendants()) {
        if (auto level = resolve_heading_level(*node)) {
            headings.push_back(heading_entry{node, *level});
        }
    }

    heading_validation_result result;
    result.total_heading_count = headings.size();
    for (const auto& h : headings) {
        ++result.headings_by_level[h.level];
    }

    if (!headings.empty()) {
        if (options_.require_single_h1) {
            check_h1_count(headings, result.issues);
        }
        if (options_.require_first_h1) {
            check_first_heading(headings, result.issues);
        }
    }

    std::optional<int> previous_level;
    for (const auto& heading : headings) {
        const auto& node = *heading.node;
        const int level = heading.level;

        if (options_.check_empty_headings && !semantic::has_content(node)) {
            result.issues.push_back(make_issue(heading_issue_type::empty_heading,
                                               finding_severity::critical, node, level,
                                               compat::format("Heading H{} is empty", level)));
        }

        if (options_.validate_heading_text) {
            check_heading_text(heading, result.issues);
        }

        if (options_.check_skipped_levels && previous_level && level > *previous_level + 1) {
            result.issues.push_back(make_issue(
                heading_issue_type::level_skipped, finding_severity::critical, node, level,
                compat::format("Heading level skipped from H{} to H{}", *previous_level, level),
                {{"previous_level", std::to_string(*previous_level)},
                 {"current_level", std::to_string(level)},
                 {"skipped_levels", std::to_string(level - *previous_level - 1)}}));
        }

        if (level > options_.max_heading_level) {
            result.issues.push_back(make_issue(
                heading_issue_type::level_exceeds_maximum, finding_severity::warning, node, level,
                compat::format("Heading level H{} exceeds maximum of H{}", level,
                               options_.max_heading_level),
                {{"actual_level", std::to_string(level)},
                 {"max_level", std::to_string(options_.max_heading_level)}}));
        }

        previous_level = level;
    }

    for (const auto& issue : result.issues) {
        semantic::annotate(codes, issue.node_id, error_code_for(issue.type));
    }
    return result;
}

void heading_hierarchy_checker::check_h1_count(const std::vector<heading_entry>& headings,
                                               issue_list& issues) const {
    const auto h1_count = std::count_if(headings.begin(), headings.end(),
                                        [](const heading_entry& h) { return h.level == 1; });

    if (h1_count > 1) {
        for (const auto& h : headings) {
            if (h.level != 1) {
                continue;
            }
            issues.push_back(make_issue(
                heading_issue_type::multiple_h1, finding_severity::critical, *h.node, 1,
                compat::format("Document contains multiple H1 headings (found {})", h1_count),
                {{"h1_count", std::to_string(h1_count)}}));
        }
    } else if (h1_count == 0) {
        const auto& first = headings.front();
        issues.push_back(make_issue(heading_issue_type::no_h1, finding_severity::critical,
                                    *first.node, first.level, "Document has no H1 heading"));
    }
}

void heading_hierarchy_checker::check_first_heading(const std::vector<heading_entry>& headings,
                                                    issue_list& issues) const {
    const auto& first = headings.front();
    if (first.level == 1) {
        return;
    }
    issues.push_back(make_issue(
        heading_issue_type::first_heading_not_h1, finding_severity::warning, *first.node,
        first.level, compat::format("First heading is H{}, should be H1", first.level),
        {{"actual_level", std::to_string(first.level)}}));
}

void heading_hierarchy_checker::check_heading_text(const heading_entry& heading,
                                                   issue_list& issues) const {
    const auto& node = *heading.node;
    const auto text = trim(node.text_description().value_or(node.collected_text()));

    const auto length = character_count(text);
    if (length < options_.min_heading_text_length) {
        issues.push_back(make_issue(
            heading_issue_type::non_meaningful_text, finding_severity::warning, node,
            heading.level,
            compat::format("Heading H{} text is too short to be meaningful", heading.level),
            {{"text_length", std::to_string(length)},
             {"min_length", std::to_string(options_.min_heading_text_length)}}));
        return;
    }

    if (is_generic_heading_text(text)) {
        issues.push_back(make_issue(
            heading_issue_type::non_meaningful_text, finding_severity::warning, node,
            heading.level,
            compat::format("Heading H{} text '{}' is not meaningful", heading.level, text),
            {{"heading_text", text}}));
    }
}

}  // namespace tagcheck::analysis
