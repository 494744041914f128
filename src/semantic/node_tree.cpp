/**
 * @file node_tree.cpp
 * @brief Implementation of tree traversal helpers and factories
 */

#include "tagcheck/semantic/node_tree.hpp"

namespace tagcheck::semantic {

namespace {

void walk(const semantic_node& node, node_path& path, const path_visitor& visitor) {
    visitor(node, path);
    path.push_back(&node);
    for (const auto& child : node.children()) {
        walk(*child, path, visitor);
    }
    path.pop_back();
}

bool search(const semantic_node& node, std::string_view id, node_path& path) {
    if (node.id() == id) {
        return true;
    }
    path.push_back(&node);
    for (const auto& child : node.children()) {
        if (search(*child, id, path)) {
            return true;
        }
    }
    path.pop_back();
    return false;
}

}  // namespace

// =============================================================================
// Variant Dispatch
// =============================================================================

const table_node* as_table(const semantic_node& node) noexcept {
    return node.kind() == node_kind::table ? static_cast<const table_node*>(&node) : nullptr;
}

const list_node* as_list(const semantic_node& node) noexcept {
    return node.kind() == node_kind::list ? static_cast<const list_node*>(&node) : nullptr;
}

const figure_node* as_figure(const semantic_node& node) noexcept {
    return node.kind() == node_kind::figure ? static_cast<const figure_node*>(&node) : nullptr;
}

const content_node* as_content(const semantic_node& node) noexcept {
    return node.kind() == node_kind::content ? static_cast<const content_node*>(&node)
                                             : nullptr;
}

bool has_content(const semantic_node& node) {
    if (node.has_children() || node.has_text_alternative()) {
        return true;
    }
    if (const auto* figure = as_figure(node)) {
        return figure->has_visual_content();
    }
    return !node.own_text().empty();
}

// =============================================================================
// Path Traversal
// =============================================================================

void walk_with_path(const semantic_node& root, const path_visitor& visitor) {
    node_path path;
    walk(root, path, visitor);
}

std::optional<node_path> find_path(const semantic_node& root, std::string_view id) {
    node_path path;
    if (search(root, id, path)) {
        return path;
    }
    return std::nullopt;
}

const semantic_node* find_parent(const semantic_node& root, std::string_view id) {
    auto path = find_path(root, id);
    if (!path || path->empty()) {
        return nullptr;
    }
    return path->back();
}

// =============================================================================
// Factories
// =============================================================================

node_ptr make_node(semantic_type type, node_fields fields) {
    switch (type) {
        case semantic_type::table:
            return make_table(std::move(fields));
        case semantic_type::list:
            return make_list(std::move(fields));
        case semantic_type::figure:
            return make_figure(std::move(fields));
        default:
            return std::make_shared<content_node>(type, std::move(fields));
    }
}

node_ptr make_document(node_fields fields) {
    return make_node(semantic_type::document, std::move(fields));
}

node_ptr make_text_node(semantic_type type, node_fields fields, std::string text,
                        double font_size, double font_weight) {
    std::vector<text::text_block> blocks;
    if (!text.empty()) {
        auto block_box = fields.box.value_or(geometry::bounding_box{});
        blocks.push_back(text::make_text_block(block_box, std::move(text), font_size, font_weight));
    }
    return std::make_shared<content_node>(type, std::move(fields), std::move(blocks));
}

node_ptr make_paragraph(node_fields fields, std::string text) {
    return make_text_node(semantic_type::paragraph, std::move(fields), std::move(text));
}

node_ptr make_span(node_fields fields, std::string text) {
    return make_text_node(semantic_type::span, std::move(fields), std::move(text));
}

node_ptr make_caption(node_fields fields, std::string text) {
    return make_text_node(semantic_type::caption, std::move(fields), std::move(text));
}

node_ptr make_heading(int level, node_fields fields, std::string text) {
    return make_text_node(heading_type_for_level(level), std::move(fields), std::move(text));
}

node_ptr make_figure(node_fields fields, std::vector<image_chunk> images,
                     std::vector<line_art_chunk> line_art) {
    return std::make_shared<figure_node>(std::move(fields), std::move(images),
                                         std::move(line_art));
}

std::shared_ptr<const table_node> make_table(node_fields fields,
                                             std::optional<visual_border> border) {
    return std::make_shared<table_node>(std::move(fields), std::move(border));
}

std::shared_ptr<const list_node> make_list(node_fields fields, list_kind kind,
                                           std::optional<int> start_number, int nesting_level) {
    return std::make_shared<list_node>(std::move(fields), kind, start_number, nesting_level);
}

}  // namespace tagcheck::semantic
