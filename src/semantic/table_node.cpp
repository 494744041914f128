/**
 * @file table_node.cpp
 * @brief Implementation of the table node
 */

#include "tagcheck/semantic/table_node.hpp"

#include <algorithm>
#include <utility>

namespace tagcheck::semantic {

namespace {

void sort_border(visual_border& border) {
    std::sort(border.x_coordinates.begin(), border.x_coordinates.end());
    std::sort(border.y_coordinates.begin(), border.y_coordinates.end());
}

void append_rows(const semantic_node& group, table_node::row_list& rows) {
    for (const auto& child : group.children()) {
        if (child->type() == semantic_type::table_row) {
            rows.push_back(child.get());
        }
    }
}

}  // namespace

table_node::table_node(node_fields fields, std::optional<visual_border> border)
    : semantic_node(semantic_type::table, std::move(fields)), border_(std::move(border)) {
    if (border_) {
        sort_border(*border_);
    }
}

const semantic_node* table_node::head() const {
    return first_child_of_type(semantic_type::table_head);
}

table_node::row_list table_node::bodies() const {
    row_list result;
    for (const auto& child : children()) {
        if (child->type() == semantic_type::table_body) {
            result.push_back(child.get());
        }
    }
    return result;
}

const semantic_node* table_node::foot() const {
    return first_child_of_type(semantic_type::table_foot);
}

bool table_node::has_explicit_row_groups() const {
    return std::any_of(children().begin(), children().end(), [](const node_ptr& child) {
        return is_table_row_group(child->type());
    });
}

table_node::row_list table_node::rows() const {
    row_list result;
    if (const auto* h = head()) {
        append_rows(*h, result);
    }
    for (const auto* body : bodies()) {
        append_rows(*body, result);
    }
    if (const auto* f = foot()) {
        append_rows(*f, result);
    }
    append_rows(*this, result);
    return result;
}

table_node::row_list table_node::cells_in_row(const semantic_node& row) {
    row_list result;
    for (const auto& child : row.children()) {
        if (is_table_cell(child->type())) {
            result.push_back(child.get());
        }
    }
    return result;
}

table_node::row_list table_node::all_cells() const {
    row_list result;
    for (const auto* row : rows()) {
        auto cells = cells_in_row(*row);
        result.insert(result.end(), cells.begin(), cells.end());
    }
    return result;
}

table_node::row_list table_node::header_cells() const {
    auto cells = all_cells();
    std::erase_if(cells, [](const semantic_node* c) {
        return c->type() != semantic_type::table_header;
    });
    return cells;
}

table_node::row_list table_node::data_cells() const {
    auto cells = all_cells();
    std::erase_if(cells, [](const semantic_node* c) {
        return c->type() != semantic_type::table_cell;
    });
    return cells;
}

table_node::row_list table_node::header_rows() const {
    row_list result;
    if (const auto* h = head()) {
        append_rows(*h, result);
        return result;
    }
    for (const auto* row : rows()) {
        auto cells = cells_in_row(*row);
        bool all_headers = !cells.empty() &&
                           std::all_of(cells.begin(), cells.end(), [](const semantic_node* c) {
                               return c->type() == semantic_type::table_header;
                           });
        if (all_headers) {
            result.push_back(row);
        }
    }
    return result;
}

bool table_node::has_headers() const {
    return !header_cells().empty();
}

std::size_t table_node::max_cells_per_row() const {
    std::size_t max_cells = 0;
    for (const auto* row : rows()) {
        max_cells = std::max(max_cells, cells_in_row(*row).size());
    }
    return max_cells;
}

bool table_node::has_consistent_column_count() const {
    auto all_rows = rows();
    if (all_rows.empty()) {
        return true;
    }
    const auto expected = cells_in_row(*all_rows.front()).size();
    return std::all_of(all_rows.begin(), all_rows.end(), [expected](const semantic_node* r) {
        return cells_in_row(*r).size() == expected;
    });
}

std::optional<std::string> table_node::summary() const {
    return string_attribute(attribute_keys::summary);
}

void table_node::set_visual_border(visual_border border) {
    sort_border(border);
    border_ = std::move(border);
}

std::shared_ptr<const table_node> table_node::with_visual_border(visual_border border) const {
    auto copy = std::make_shared<table_node>(*this);
    copy->set_visual_border(std::move(border));
    return copy;
}

}  // namespace tagcheck::semantic
