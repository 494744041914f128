/**
 * @file list_node.cpp
 * @brief Implementation of the list node
 */

#include "tagcheck/semantic/list_node.hpp"

#include <algorithm>
#include <utility>

namespace tagcheck::semantic {

list_node::list_node(node_fields fields, list_kind kind, std::optional<int> start_number,
                     int nesting_level)
    : semantic_node(semantic_type::list, std::move(fields)),
      numbering_(kind),
      start_number_(start_number),
      nesting_level_(nesting_level) {}

list_node::item_list list_node::items() const {
    item_list result;
    for (const auto& child : children()) {
        if (child->type() == semantic_type::list_item) {
            result.push_back(child.get());
        }
    }
    return result;
}

const semantic_node* list_node::label(const semantic_node& item) {
    return item.first_child_of_type(semantic_type::list_label);
}

const semantic_node* list_node::body(const semantic_node& item) {
    return item.first_child_of_type(semantic_type::list_body);
}

list_node::item_list list_node::labels() const {
    item_list result;
    for (const auto* item : items()) {
        if (const auto* l = label(*item)) {
            result.push_back(l);
        }
    }
    return result;
}

list_node::item_list list_node::bodies() const {
    item_list result;
    for (const auto* item : items()) {
        if (const auto* b = body(*item)) {
            result.push_back(b);
        }
    }
    return result;
}

list_node::item_list list_node::items_missing_labels() const {
    auto result = items();
    std::erase_if(result, [](const semantic_node* item) { return label(*item) != nullptr; });
    return result;
}

list_node::item_list list_node::items_missing_bodies() const {
    auto result = items();
    std::erase_if(result, [](const semantic_node* item) { return body(*item) != nullptr; });
    return result;
}

bool list_node::all_items_have_labels() const {
    return items_missing_labels().empty();
}

bool list_node::all_items_have_bodies() const {
    return items_missing_bodies().empty();
}

std::vector<const list_node*> list_node::nested_lists() const {
    std::vector<const list_node*> result;
    for (const auto* b : bodies()) {
        for (const auto& child : b->children()) {
            if (child->kind() == node_kind::list) {
                result.push_back(static_cast<const list_node*>(child.get()));
            }
        }
    }
    return result;
}

int list_node::max_nested_depth() const {
    int deepest = nesting_level_;
    for (const auto* nested : nested_lists()) {
        deepest = std::max(deepest, nested->max_nested_depth());
    }
    return deepest;
}

std::set<semantic_error_code> list_node::validate_structure() const {
    std::set<semantic_error_code> codes;
    if (!all_items_have_labels()) {
        codes.insert(semantic_error_code::list_item_missing_label);
    }
    if (!all_items_have_bodies()) {
        codes.insert(semantic_error_code::list_item_missing_body);
    }
    if (nesting_level_ > max_list_nesting_level) {
        codes.insert(semantic_error_code::list_nesting_too_deep);
    }
    return codes;
}

}  // namespace tagcheck::semantic
