/**
 * @file structure_analyzer.cpp
 * @brief Implementation of the structure analyzer
 */

#include "tagcheck/analysis/structure_analyzer.hpp"

#include "tagcheck/compat/format.hpp"
#include "tagcheck/semantic/node_tree.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace tagcheck::analysis {

using semantic::semantic_error_code;
using semantic::semantic_node;
using semantic::semantic_type;

// =============================================================================
// Options
// =============================================================================

structure_analysis_options structure_analysis_options::nesting_only() {
    structure_analysis_options opts;
    opts.validate_required_children = false;
    opts.validate_attributes = false;
    opts.check_empty_elements = false;
    opts.check_duplicate_ids = false;
    return opts;
}

structure_analysis_options structure_analysis_options::attributes_only() {
    structure_analysis_options opts;
    opts.validate_nesting = false;
    opts.validate_required_children = false;
    opts.check_empty_elements = false;
    opts.check_duplicate_ids = false;
    return opts;
}

// =============================================================================
// Result
// =============================================================================

std::vector<structure_error> structure_analysis_result::errors_with_code(
    semantic_error_code code) const {
    std::vector<structure_error> matching;
    std::copy_if(errors.begin(), errors.end(), std::back_inserter(matching),
                 [code](const structure_error& e) { return e.code == code; });
    return matching;
}

std::map<semantic_error_code, std::size_t> structure_analysis_result::errors_by_code() const {
    std::map<semantic_error_code, std::size_t> counts;
    for (const auto& e : errors) {
        ++counts[e.code];
    }
    return counts;
}

std::vector<finding> to_findings(const structure_analysis_result& result) {
    std::vector<finding> findings;
    findings.reserve(result.errors.size());
    for (const auto& e : result.errors) {
        findings.push_back(finding{std::string(semantic::to_string(e.code)),
                                   finding_category::structure, std::nullopt, e.node_id,
                                   std::nullopt, e.message, e.page_index, e.context});
    }
    return findings;
}

// =============================================================================
// Nesting Rules
// =============================================================================

bool is_valid_child(semantic_type parent, semantic_type child) noexcept {
    switch (parent) {
        case semantic_type::document:
            return child != semantic_type::list_label && child != semantic_type::list_body;
        case semantic_type::list:
            return child == semantic_type::list_item;
        case semantic_type::list_item:
            return child == semantic_type::list_label || child == semantic_type::list_body ||
                   child == semantic_type::list;
        case semantic_type::table:
            return child == semantic_type::table_row || semantic::is_table_row_group(child);
        case semantic_type::table_row:
            return semantic::is_table_cell(child);
        case semantic_type::table_head:
        case semantic_type::table_body:
        case semantic_type::table_foot:
            return child == semantic_type::table_row;
        case semantic_type::toc:
            return child == semantic_type::toc_item;
        default:
            return true;
    }
}

bool may_be_empty(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::artifact:
        case semantic_type::document_header:
        case semantic_type::document_footer:
        case semantic_type::note:
        case semantic_type::document:
        case semantic_type::part:
        case semantic_type::article:
        case semantic_type::section:
        case semantic_type::div:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Analyzer
// =============================================================================

struct structure_analyzer::traversal_state {
    structure_analysis_result& result;
    semantic::error_code_table* codes;
    std::set<semantic::node_id> seen_ids;

    void report(const semantic_node& node, semantic_error_code code, std::string message,
                finding_context context = {}) {
        result.errors.push_back(structure_error{code, node.id(), node.type(), std::move(message),
                                                node.page_index(), std::move(context)});
        semantic::annotate(codes, node.id(), code);
    }
};

structure_analyzer::structure_analyzer(const structure_analysis_options& options)
    : options_(options) {}

const structure_analysis_options& structure_analyzer::options() const noexcept {
    return options_;
}

void structure_analyzer::set_options(const structure_analysis_options& options) {
    options_ = options;
}

structure_analysis_result structure_analyzer::analyze(const semantic_node& root,
                                                      semantic::error_code_table* codes) const {
    structure_analysis_result result;
    traversal_state state{result, codes, {}};
    visit(root, state);
    return result;
}

void structure_analyzer::visit(const semantic_node& node, traversal_state& state) const {
    ++state.result.total_node_count;
    state.result.max_depth = std::max(state.result.max_depth, node.depth());

    check_depth(node, state);
    if (options_.check_duplicate_ids) {
        check_duplicate_id(node, state);
    }
    if (options_.check_empty_elements) {
        check_empty(node, state);
    }
    if (options_.validate_nesting) {
        check_nesting(node, state);
    }
    if (options_.validate_required_children) {
        check_required_children(node, state);
    }
    if (options_.validate_attributes) {
        check_attributes(node, state);
    }

    for (const auto& child : node.children()) {
        visit(*child, state);
    }
}

void structure_analyzer::check_depth(const semantic_node& node, traversal_state& state) const {
    if (options_.max_depth <= 0 || node.depth() <= options_.max_depth) {
        return;
    }
    state.report(node, semantic_error_code::invalid_nesting,
                 compat::format("Node exceeds maximum depth of {}", options_.max_depth),
                 {{"depth", std::to_string(node.depth())},
                  {"max_depth", std::to_string(options_.max_depth)}});
}

void structure_analyzer::check_duplicate_id(const semantic_node& node,
                                             traversal_state& state) const {
    if (!state.seen_ids.insert(node.id()).second) {
        state.report(node, semantic_error_code::duplicate_id, "Duplicate node ID detected",
                     {{"id", node.id()}});
    }
}

void structure_analyzer::check_empty(const semantic_node& node, traversal_state& state) const {
    if (may_be_empty(node.type()) || semantic::has_content(node)) {
        return;
    }
    state.report(node, semantic_error_code::empty_element,
                 "Element is empty (no children or text alternative)");
}

void structure_analyzer::check_nesting(const semantic_node& node, traversal_state& state) const {
    for (const auto& child : node.children()) {
        if (is_valid_child(node.type(), child->type())) {
            continue;
        }
        state.report(*child, semantic_error_code::unexpected_child,
                     compat::format("Invalid child type '{}' for parent '{}'",
                                    semantic::to_string(child->type()),
                                    semantic::to_string(node.type())),
                     {{"parent_type", std::string(semantic::to_string(node.type()))},
                      {"child_type", std::string(semantic::to_string(child->type()))}});
    }
}

void structure_analyzer::check_required_children(const semantic_node& node,
                                                 traversal_state& state) const {
    switch (node.type()) {
        case semantic_type::list_item:
            if (node.first_child_of_type(semantic_type::list_body) == nullptr) {
                state.report(node, semantic_error_code::missing_required_child,
                             "List item missing LBody child", {{"missing_child", "LBody"}});
            }
            break;
        case semantic_type::table:
            if (!node.has_children()) {
                state.report(node, semantic_error_code::missing_required_child,
                             "Table has no rows", {{"missing_child", "TR"}});
            }
            break;
        case semantic_type::table_row:
            if (!node.has_children()) {
                state.report(node, semantic_error_code::missing_required_child,
                             "Table row has no cells", {{"missing_child", "TD or TH"}});
            }
            break;
        default:
            break;
    }
}

void structure_analyzer::check_attributes(const semantic_node& node,
                                          traversal_state& state) const {
    if (node.type() == semantic_type::figure && !node.has_text_alternative()) {
        state.report(node, semantic_error_code::missing_attribute,
                     "Figure missing Alt or ActualText attribute",
                     {{"required_attribute", "Alt or ActualText"}});
    }
    if (node.type() == semantic_type::link && !node.has_children() &&
        !node.has_text_alternative()) {
        state.report(node, semantic_error_code::missing_attribute,
                     "Link has no content or Alt text",
                     {{"required_attribute", "Alt or content"}});
    }
}

}  // namespace tagcheck::analysis
