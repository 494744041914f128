/**
 * @file table_node.hpp
 * @brief Table structure element with row/cell accessors and visual border
 *
 * Rows are recovered from the children: rows of THead, then of each TBody,
 * then of TFoot, then any TR directly under the table.
 */

#ifndef TAGCHECK_SEMANTIC_TABLE_NODE_HPP
#define TAGCHECK_SEMANTIC_TABLE_NODE_HPP

#include "tagcheck/semantic/semantic_node.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tagcheck::semantic {

/**
 * @brief Table grid inferred from drawn border lines
 *
 * Coordinates are sorted ascending on assignment.
 */
struct visual_border {
    std::vector<double> x_coordinates;
    std::vector<double> y_coordinates;

    /// max(0, |y| - 1)
    [[nodiscard]] std::size_t row_count() const noexcept {
        return y_coordinates.size() > 1 ? y_coordinates.size() - 1 : 0;
    }

    /// max(0, |x| - 1)
    [[nodiscard]] std::size_t column_count() const noexcept {
        return x_coordinates.size() > 1 ? x_coordinates.size() - 1 : 0;
    }
};

/**
 * @brief Table node
 *
 * The visual border is the only field that can change after construction.
 * It is attached by the border detection stage before the tree is shared
 * with analyzers.
 */
class table_node final : public semantic_node {
public:
    using row_list = std::vector<const semantic_node*>;

    explicit table_node(node_fields fields,
                        std::optional<visual_border> border = std::nullopt);

    [[nodiscard]] node_kind kind() const noexcept override { return node_kind::table; }

    // =========================================================================
    // Row groups
    // =========================================================================

    [[nodiscard]] const semantic_node* head() const;
    [[nodiscard]] row_list bodies() const;
    [[nodiscard]] const semantic_node* foot() const;
    [[nodiscard]] bool has_explicit_row_groups() const;

    // =========================================================================
    // Rows and cells
    // =========================================================================

    [[nodiscard]] row_list rows() const;
    [[nodiscard]] std::size_t row_count() const { return rows().size(); }

    /// TH and TD children of @p row, other children excluded
    [[nodiscard]] static row_list cells_in_row(const semantic_node& row);

    [[nodiscard]] row_list all_cells() const;
    [[nodiscard]] row_list header_cells() const;
    [[nodiscard]] row_list data_cells() const;

    /// Rows of THead, else rows made only of TH cells
    [[nodiscard]] row_list header_rows() const;

    [[nodiscard]] bool has_headers() const;
    [[nodiscard]] std::size_t max_cells_per_row() const;
    [[nodiscard]] bool has_consistent_column_count() const;

    /// Summary attribute
    [[nodiscard]] std::optional<std::string> summary() const;

    // =========================================================================
    // Visual border
    // =========================================================================

    [[nodiscard]] const std::optional<visual_border>& border() const noexcept {
        return border_;
    }

    [[nodiscard]] bool has_visual_border() const noexcept { return border_.has_value(); }

    [[nodiscard]] std::size_t visual_row_count() const noexcept {
        return border_ ? border_->row_count() : 0;
    }

    [[nodiscard]] std::size_t visual_column_count() const noexcept {
        return border_ ? border_->column_count() : 0;
    }

    /**
     * @brief Attach the border detected for this table
     *
     * Only valid before the node is shared with readers.
     */
    void set_visual_border(visual_border border);

    /// Copy of this table, same id, with @p border attached
    [[nodiscard]] std::shared_ptr<const table_node> with_visual_border(visual_border border) const;

private:
    std::optional<visual_border> border_;
};

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_TABLE_NODE_HPP
