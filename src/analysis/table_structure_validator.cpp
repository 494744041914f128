/**
 * @file table_structure_validator.cpp
 * @brief Implementation of the table structure validator
 */

#include "tagcheck/analysis/table_structure_validator.hpp"

#include "tagcheck/compat/format.hpp"
#include "tagcheck/semantic/node_tree.hpp"

#include <algorithm>
#include <iterator>

namespace tagcheck::analysis {

using semantic::semantic_error_code;
using semantic::semantic_node;
using semantic::semantic_type;
using semantic::table_node;

namespace {

table_error make_table_error(semantic_error_code code, finding_severity severity,
                             const semantic_node& node, std::string message,
                             finding_context context = {}) {
    return table_error{code,     severity,           node.id(), node.type(), std::move(message),
                       node.page_index(), std::move(context)};
}

}  // namespace

// =============================================================================
// Options and Result
// =============================================================================

table_validation_options table_validation_options::lenient() {
    table_validation_options opts;
    opts.require_headers = false;
    opts.recommend_header_group = false;
    opts.validate_regularity = false;
    opts.validate_visual_match = false;
    return opts;
}

table_validation_options table_validation_options::basic() {
    table_validation_options opts;
    opts.recommend_header_group = false;
    opts.validate_regularity = false;
    opts.validate_visual_match = false;
    return opts;
}

bool table_validation_result::passed() const noexcept {
    return std::none_of(errors.begin(), errors.end(), [](const table_error& e) {
        return e.severity == finding_severity::error;
    });
}

std::size_t table_validation_result::count_with_severity(
    finding_severity severity) const noexcept {
    return static_cast<std::size_t>(
        std::count_if(errors.begin(), errors.end(),
                      [severity](const table_error& e) { return e.severity == severity; }));
}

std::vector<table_error> table_validation_result::errors_with_code(
    semantic_error_code code) const {
    std::vector<table_error> matching;
    std::copy_if(errors.begin(), errors.end(), std::back_inserter(matching),
                 [code](const table_error& e) { return e.code == code; });
    return matching;
}

std::vector<finding> to_findings(const table_validation_result& result) {
    std::vector<finding> findings;
    findings.reserve(result.errors.size());
    for (const auto& e : result.errors) {
        std::optional<std::string> related;
        if (e.node_id != result.table_id) {
            related = result.table_id;
        }
        findings.push_back(finding{std::string(semantic::to_string(e.code)),
                                   finding_category::table, e.severity, e.node_id,
                                   std::move(related), e.message, e.page_index, e.context});
    }
    return findings;
}

// =============================================================================
// Validator
// =============================================================================

table_structure_validator::table_structure_validator(const table_validation_options& options)
    : options_(options) {}

const table_validation_options& table_structure_validator::options() const noexcept {
    return options_;
}

void table_structure_validator::set_options(const table_validation_options& options) {
    options_ = options;
}

table_validation_result table_structure_validator::validate(
    const table_node& table, semantic::error_code_table* codes) const {
    table_validation_result result;
    result.table_id = table.id();
    result.row_count = table.row_count();
    result.max_cells_per_row = table.max_cells_per_row();

    check_headers(table, result.errors);
    if (options_.validate_regularity) {
        check_regularity(table, result.errors);
    }
    if (options_.validate_visual_match && table.has_visual_border()) {
        check_visual_match(table, result.errors);
    }
    check_cell_structure(table, result.errors);

    for (const auto& e : result.errors) {
        semantic::annotate(codes, e.node_id, e.code);
    }
    return result;
}

std::vector<table_validation_result> table_structure_validator::validate_all(
    const semantic_node& root, semantic::error_code_table* codes) const {
    std::vector<table_validation_result> results;
    for (const auto* node : root.all_descendants()) {
        if (const auto* table = semantic::as_table(*node)) {
            results.push_back(validate(*table, codes));
        } else if (node->type() == semantic_type::table) {
            results.push_back(reject_non_table(*node, codes));
        }
    }
    return results;
}

table_validation_result table_structure_validator::reject_non_table(
    const semantic_node& node, semantic::error_code_table* codes) const {
    table_validation_result result;
    result.table_id = node.id();
    result.errors.push_back(make_table_error(
        semantic_error_code::table_irregular_structure, finding_severity::error, node,
        "Table element is not a table node; its structure cannot be validated",
        {{"node_kind", semantic::to_string(node.kind())}}));
    semantic::annotate(codes, node.id(), semantic_error_code::table_irregular_structure);
    return result;
}

void table_structure_validator::check_headers(const table_node& table,
                                              error_list& errors) const {
    const auto rows = table.row_count();
    const bool has_headers = table.has_headers();

    if (options_.require_headers && rows > 1 && !has_headers) {
        errors.push_back(make_table_error(
            semantic_error_code::table_missing_headers, finding_severity::error, table,
            compat::format("Table with {} rows has no header cells", rows),
            {{"row_count", std::to_string(rows)}}));
    }

    if (options_.recommend_header_group && has_headers && table.head() == nullptr) {
        errors.push_back(make_table_error(
            semantic_error_code::table_header_group_missing, finding_severity::warning, table,
            "Table has header cells but no THead element"));
    }
}

void table_structure_validator::check_regularity(const table_node& table,
                                                 error_list& errors) const {
    const auto rows = table.rows();

    if (!table.has_consistent_column_count()) {
        std::string counts;
        for (const auto* row : rows) {
            if (!counts.empty()) {
                counts += ",";
            }
            counts += std::to_string(table_node::cells_in_row(*row).size());
        }
        errors.push_back(make_table_error(
            semantic_error_code::table_irregular_structure, finding_severity::error, table,
            "Table has inconsistent column counts across rows",
            {{"cell_counts", counts}}));
    }

    for (const auto* row : rows) {
        if (table_node::cells_in_row(*row).empty()) {
            errors.push_back(make_table_error(semantic_error_code::table_empty_row,
                                              finding_severity::error, *row,
                                              "Table row has no cells"));
        }
    }
}

void table_structure_validator::check_visual_match(const table_node& table,
                                                   error_list& errors) const {
    const auto& border = *table.border();
    const auto declared_rows = table.row_count();
    const auto declared_columns = table.max_cells_per_row();

    if (!border.y_coordinates.empty() && table.visual_row_count() != declared_rows) {
        errors.push_back(make_table_error(
            semantic_error_code::table_row_count_mismatch, finding_severity::warning, table,
            compat::format("Visual table has {} rows but semantic table has {} rows",
                           table.visual_row_count(), declared_rows),
            {{"visual_rows", std::to_string(table.visual_row_count())},
             {"semantic_rows", std::to_string(declared_rows)}}));
    }

    if (!border.x_coordinates.empty() && declared_columns > 0 &&
        table.visual_column_count() != declared_columns) {
        errors.push_back(make_table_error(
            semantic_error_code::table_column_count_mismatch, finding_severity::warning, table,
            compat::format("Visual table has {} columns but semantic table has {} columns",
                           table.visual_column_count(), declared_columns),
            {{"visual_columns", std::to_string(table.visual_column_count())},
             {"semantic_columns", std::to_string(declared_columns)}}));
    }
}

void table_structure_validator::check_cell_structure(const table_node& table,
                                                     error_list& errors) const {
    for (const auto* row : table.rows()) {
        const auto cells = table_node::cells_in_row(*row);
        const bool has_th = std::any_of(cells.begin(), cells.end(), [](const semantic_node* c) {
            return c->type() == semantic_type::table_header;
        });
        const bool has_td = std::any_of(cells.begin(), cells.end(), [](const semantic_node* c) {
            return c->type() == semantic_type::table_cell;
        });

        if (has_th && has_td) {
            errors.push_back(make_table_error(semantic_error_code::table_mixed_cell_types,
                                              finding_severity::info, *row,
                                              "Table row contains both TH and TD cells"));
        }

        for (const auto& child : row->children()) {
            if (semantic::is_table_cell(child->type())) {
                continue;
            }
            const std::string type_name(semantic::to_string(child->type()));
            errors.push_back(make_table_error(
                semantic_error_code::table_invalid_cell_type, finding_severity::error, *child,
                compat::format("Invalid cell type '{}' in table row (expected TH or TD)",
                               type_name),
                {{"cell_type", type_name}, {"row_id", row->id()}}));
        }
    }
}

}  // namespace tagcheck::analysis
