/**
 * @file semantic_node.hpp
 * @brief Common interface of the document structure tree
 *
 * The tree is built once by the ingestion stage and then only read. Nodes
 * hold their children through shared pointers to const and keep no
 * reference to their parent; callers needing ancestor context carry a
 * path while traversing (see node_tree.hpp).
 *
 * Exactly four node variants exist, distinguished by node_kind:
 *  - content_node: any role, optionally carrying text
 *  - figure_node: Figure role with image and vector content
 *  - table_node: Table role with row/cell accessors and a visual border
 *  - list_node: L role with list numbering metadata
 *
 * Defect codes found by the analyzers are not stored on the nodes; they go
 * to an error_code_table keyed by node id.
 */

#ifndef TAGCHECK_SEMANTIC_SEMANTIC_NODE_HPP
#define TAGCHECK_SEMANTIC_SEMANTIC_NODE_HPP

#include "tagcheck/geometry/bounding_box.hpp"
#include "tagcheck/semantic/attribute_value.hpp"
#include "tagcheck/semantic/semantic_type.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::semantic {

class semantic_node;

/// Node identifier, unique within one tree
using node_id = std::string;

/// Shared handle to an immutable node
using node_ptr = std::shared_ptr<const semantic_node>;

/// Ordered children of a node
using node_list = std::vector<node_ptr>;

/**
 * @brief Discriminant of the four node variants
 */
enum class node_kind {
    content,  ///< content_node
    figure,   ///< figure_node
    table,    ///< table_node
    list      ///< list_node
};

[[nodiscard]] constexpr const char* to_string(node_kind kind) noexcept {
    switch (kind) {
        case node_kind::content: return "content";
        case node_kind::figure: return "figure";
        case node_kind::table: return "table";
        case node_kind::list: return "list";
        default: return "unknown";
    }
}

/**
 * @brief Fields shared by every node variant
 *
 * An empty id is replaced by a generated, process-unique id.
 *
 * @code
 * auto p = make_paragraph({.id = "p1", .box = box, .depth = 1}, "Hello");
 * @endcode
 */
struct node_fields {
    node_id id;
    std::optional<geometry::bounding_box> box;
    node_list children;
    attribute_map attributes;
    int depth = 0;
};

/**
 * @brief Abstract structure tree node
 *
 * Thread Safety: nodes are immutable once shared, so any number of
 * analyzers may traverse one tree concurrently.
 */
class semantic_node {
public:
    virtual ~semantic_node() = default;

    semantic_node(const semantic_node&) = default;
    semantic_node& operator=(const semantic_node&) = delete;

    // =========================================================================
    // Identity
    // =========================================================================

    [[nodiscard]] virtual node_kind kind() const noexcept = 0;

    [[nodiscard]] const node_id& id() const noexcept { return id_; }
    [[nodiscard]] semantic_type type() const noexcept { return type_; }
    [[nodiscard]] int depth() const noexcept { return depth_; }

    // =========================================================================
    // Geometry
    // =========================================================================

    [[nodiscard]] const std::optional<geometry::bounding_box>& box() const noexcept {
        return box_;
    }

    /// Page of the bounding box, if any
    [[nodiscard]] std::optional<int> page_index() const noexcept;

    // =========================================================================
    // Children
    // =========================================================================

    [[nodiscard]] const node_list& children() const noexcept { return children_; }
    [[nodiscard]] bool has_children() const noexcept { return !children_.empty(); }
    [[nodiscard]] std::size_t child_count() const noexcept { return children_.size(); }

    // =========================================================================
    // Attributes
    // =========================================================================

    [[nodiscard]] const attribute_map& attributes() const noexcept { return attributes_; }

    /**
     * @brief Look up an attribute
     * @return Pointer into the attribute map, or nullptr when absent
     */
    [[nodiscard]] const attribute_value* attribute(std::string_view key) const;

    /// Non-empty string attribute value
    [[nodiscard]] std::optional<std::string> string_attribute(std::string_view key) const;

    [[nodiscard]] std::optional<std::string> alt_text() const;
    [[nodiscard]] std::optional<std::string> actual_text() const;
    [[nodiscard]] std::optional<std::string> language() const;
    [[nodiscard]] std::optional<std::string> title() const;

    /// Non-empty Alt or ActualText
    [[nodiscard]] bool has_text_alternative() const;

    /// Alt, else ActualText, else Title
    [[nodiscard]] std::optional<std::string> text_description() const;

    // =========================================================================
    // Text
    // =========================================================================

    /**
     * @brief Text carried by this node itself
     *
     * Empty for variants that carry no text payload.
     */
    [[nodiscard]] virtual std::string own_text() const;

    /**
     * @brief Own text of this node and all descendants in document order,
     *        separated by single spaces
     */
    [[nodiscard]] std::string collected_text() const;

    // =========================================================================
    // Traversal
    // =========================================================================

    /// Number of nodes below this one
    [[nodiscard]] std::size_t descendant_count() const;

    /// Deepest depth value found in this subtree
    [[nodiscard]] int max_depth() const;

    /// This node and all descendants in pre-order
    [[nodiscard]] std::vector<const semantic_node*> all_descendants() const;

    /// Nodes of @p type in this subtree, this node included, in pre-order
    [[nodiscard]] std::vector<const semantic_node*> descendants_of_type(semantic_type type) const;

    /// First node in pre-order, this node included, matching @p predicate
    [[nodiscard]] const semantic_node*
    first_descendant(const std::function<bool(const semantic_node&)>& predicate) const;

    /// First direct child with role @p type
    [[nodiscard]] const semantic_node* first_child_of_type(semantic_type type) const;

protected:
    semantic_node(semantic_type type, node_fields fields);

private:
    node_id id_;
    semantic_type type_;
    std::optional<geometry::bounding_box> box_;
    node_list children_;
    attribute_map attributes_;
    int depth_;
};

/**
 * @brief Generate a process-unique node id
 */
[[nodiscard]] node_id generate_node_id();

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_SEMANTIC_NODE_HPP
