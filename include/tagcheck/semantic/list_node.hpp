/**
 * @file list_node.hpp
 * @brief List structure element with numbering metadata
 */

#ifndef TAGCHECK_SEMANTIC_LIST_NODE_HPP
#define TAGCHECK_SEMANTIC_LIST_NODE_HPP

#include "tagcheck/semantic/error_code.hpp"
#include "tagcheck/semantic/semantic_node.hpp"

#include <optional>
#include <set>
#include <vector>

namespace tagcheck::semantic {

/**
 * @brief Numbering style detected for a list
 */
enum class list_kind {
    unordered,            ///< bullets
    ordered_arabic,       ///< 1, 2, 3
    ordered_roman_upper,  ///< I, II, III
    ordered_roman_lower,  ///< i, ii, iii
    ordered_alpha_upper,  ///< A, B, C
    ordered_alpha_lower,  ///< a, b, c
    ordered_circled,      ///< circled digits
    unknown
};

[[nodiscard]] constexpr const char* to_string(list_kind kind) noexcept {
    switch (kind) {
        case list_kind::unordered: return "unordered";
        case list_kind::ordered_arabic: return "ordered_arabic";
        case list_kind::ordered_roman_upper: return "ordered_roman_upper";
        case list_kind::ordered_roman_lower: return "ordered_roman_lower";
        case list_kind::ordered_alpha_upper: return "ordered_alpha_upper";
        case list_kind::ordered_alpha_lower: return "ordered_alpha_lower";
        case list_kind::ordered_circled: return "ordered_circled";
        case list_kind::unknown: return "unknown";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr bool is_ordered(list_kind kind) noexcept {
    return kind != list_kind::unordered && kind != list_kind::unknown;
}

/// Nesting levels beyond this are reported as too deep
inline constexpr int max_list_nesting_level = 5;

/**
 * @brief List node
 *
 * Items are the LI children. Nested lists are the L children of an item's
 * LBody.
 */
class list_node final : public semantic_node {
public:
    using item_list = std::vector<const semantic_node*>;

    explicit list_node(node_fields fields, list_kind kind = list_kind::unknown,
                       std::optional<int> start_number = std::nullopt, int nesting_level = 0);

    [[nodiscard]] node_kind kind() const noexcept override { return node_kind::list; }

    [[nodiscard]] list_kind numbering() const noexcept { return numbering_; }
    [[nodiscard]] bool is_ordered() const noexcept { return semantic::is_ordered(numbering_); }
    [[nodiscard]] std::optional<int> start_number() const noexcept { return start_number_; }
    [[nodiscard]] int nesting_level() const noexcept { return nesting_level_; }

    [[nodiscard]] item_list items() const;
    [[nodiscard]] std::size_t item_count() const { return items().size(); }

    /// First Lbl child of @p item
    [[nodiscard]] static const semantic_node* label(const semantic_node& item);

    /// First LBody child of @p item
    [[nodiscard]] static const semantic_node* body(const semantic_node& item);

    [[nodiscard]] item_list labels() const;
    [[nodiscard]] item_list bodies() const;
    [[nodiscard]] item_list items_missing_labels() const;
    [[nodiscard]] item_list items_missing_bodies() const;
    [[nodiscard]] bool all_items_have_labels() const;
    [[nodiscard]] bool all_items_have_bodies() const;

    [[nodiscard]] std::vector<const list_node*> nested_lists() const;

    /// Deepest nesting level in this list and its nested lists
    [[nodiscard]] int max_nested_depth() const;

    /**
     * @brief Structural defects of this list
     *
     * Missing labels, missing bodies, and nesting deeper than
     * max_list_nesting_level.
     */
    [[nodiscard]] std::set<semantic_error_code> validate_structure() const;

private:
    list_kind numbering_;
    std::optional<int> start_number_;
    int nesting_level_;
};

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_LIST_NODE_HPP
