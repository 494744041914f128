/**
 * @file node_tree.hpp
 * @brief Tree building and traversal helpers
 *
 * Provides:
 *  - kind-based dispatch to the concrete node variants
 *  - pre-order traversal carrying the ancestor path
 *  - factories for building trees by hand (tests, ingestion glue)
 *
 * @code
 * auto root = make_document({.id = "doc", .children = {
 *     make_heading(1, {.id = "h1", .depth = 1}, "Title"),
 *     make_paragraph({.id = "p1", .depth = 1}, "Body text")}});
 *
 * walk_with_path(*root, [](const semantic_node& node, const node_path& path) {
 *     // path.back() is the parent, empty for the root
 * });
 * @endcode
 */

#ifndef TAGCHECK_SEMANTIC_NODE_TREE_HPP
#define TAGCHECK_SEMANTIC_NODE_TREE_HPP

#include "tagcheck/semantic/content_node.hpp"
#include "tagcheck/semantic/figure_node.hpp"
#include "tagcheck/semantic/list_node.hpp"
#include "tagcheck/semantic/table_node.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::semantic {

// =============================================================================
// Variant Dispatch
// =============================================================================

/**
 * @brief Invoke @p visitor with the concrete type of @p node
 *
 * The visitor must accept content_node, figure_node, table_node and
 * list_node, and return the same type for each.
 */
template <typename Visitor>
decltype(auto) visit_node(const semantic_node& node, Visitor&& visitor) {
    switch (node.kind()) {
        case node_kind::figure:
            return std::forward<Visitor>(visitor)(static_cast<const figure_node&>(node));
        case node_kind::table:
            return std::forward<Visitor>(visitor)(static_cast<const table_node&>(node));
        case node_kind::list:
            return std::forward<Visitor>(visitor)(static_cast<const list_node&>(node));
        case node_kind::content:
        default:
            return std::forward<Visitor>(visitor)(static_cast<const content_node&>(node));
    }
}

/// @p node as a table, nullptr for other variants
[[nodiscard]] const table_node* as_table(const semantic_node& node) noexcept;

/// @p node as a list, nullptr for other variants
[[nodiscard]] const list_node* as_list(const semantic_node& node) noexcept;

/// @p node as a figure, nullptr for other variants
[[nodiscard]] const figure_node* as_figure(const semantic_node& node) noexcept;

/// @p node as a content node, nullptr for other variants
[[nodiscard]] const content_node* as_content(const semantic_node& node) noexcept;

/**
 * @brief Whether @p node carries any content
 *
 * True with children, a text alternative, own text, or image/line-art
 * content for figures.
 */
[[nodiscard]] bool has_content(const semantic_node& node);

// =============================================================================
// Path Traversal
// =============================================================================

/// Ancestors of a node, root first
using node_path = std::vector<const semantic_node*>;

using path_visitor = std::function<void(const semantic_node&, const node_path&)>;

/**
 * @brief Pre-order traversal passing each node with its ancestor path
 */
void walk_with_path(const semantic_node& root, const path_visitor& visitor);

/**
 * @brief Ancestor path of the first node with @p id
 * @return nullopt when no node has that id
 */
[[nodiscard]] std::optional<node_path> find_path(const semantic_node& root, std::string_view id);

/// Parent of the first node with @p id, nullptr for the root or an unknown id
[[nodiscard]] const semantic_node* find_parent(const semantic_node& root, std::string_view id);

// =============================================================================
// Factories
// =============================================================================

/// Table, L and Figure roles yield their dedicated variant, every other role a content node
[[nodiscard]] node_ptr make_node(semantic_type type, node_fields fields);

[[nodiscard]] node_ptr make_document(node_fields fields);

/**
 * @brief Content node carrying one single-line text block
 *
 * The block uses the node box, or an empty box when the node has none.
 */
[[nodiscard]] node_ptr make_text_node(semantic_type type, node_fields fields, std::string text,
                                      double font_size = 12.0, double font_weight = 400.0);

[[nodiscard]] node_ptr make_paragraph(node_fields fields, std::string text);
[[nodiscard]] node_ptr make_span(node_fields fields, std::string text);
[[nodiscard]] node_ptr make_caption(node_fields fields, std::string text);

/// H1-H6 for levels 1-6, generic H otherwise
[[nodiscard]] node_ptr make_heading(int level, node_fields fields, std::string text = {});

[[nodiscard]] node_ptr make_figure(node_fields fields, std::vector<image_chunk> images = {},
                                   std::vector<line_art_chunk> line_art = {});

[[nodiscard]] std::shared_ptr<const table_node>
make_table(node_fields fields, std::optional<visual_border> border = std::nullopt);

[[nodiscard]] std::shared_ptr<const list_node> make_list(node_fields fields,
                                                         list_kind kind = list_kind::unknown,
                                                         std::optional<int> start_number = std::nullopt,
                                                         int nesting_level = 0);

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_NODE_TREE_HPP
