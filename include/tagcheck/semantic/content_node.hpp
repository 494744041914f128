/**
 * @file content_node.hpp
 * @brief Generic structure node with optional text payload
 */

#ifndef TAGCHECK_SEMANTIC_CONTENT_NODE_HPP
#define TAGCHECK_SEMANTIC_CONTENT_NODE_HPP

#include "tagcheck/semantic/semantic_node.hpp"
#include "tagcheck/text/text_chunk.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tagcheck::semantic {

/**
 * @brief Dominant font metrics of a content node
 *
 * Fields left unset are derived from the text blocks on construction.
 */
struct content_metrics {
    std::optional<double> font_size;
    std::optional<double> font_weight;
    std::optional<text::text_color> color;
};

/**
 * @brief Structure node of any role
 *
 * Used for grouping elements (Document, Sect, TR, ...) as well as leaf
 * text elements (P, H1, Span, TD, ...).
 */
class content_node final : public semantic_node {
public:
    content_node(semantic_type type, node_fields fields,
                 std::vector<text::text_block> text_blocks = {},
                 content_metrics metrics = {});

    [[nodiscard]] node_kind kind() const noexcept override { return node_kind::content; }

    [[nodiscard]] const std::vector<text::text_block>& text_blocks() const noexcept {
        return text_blocks_;
    }

    /// Most frequent font size, weighted by character count
    [[nodiscard]] std::optional<double> dominant_font_size() const noexcept {
        return metrics_.font_size;
    }

    [[nodiscard]] std::optional<double> dominant_font_weight() const noexcept {
        return metrics_.font_weight;
    }

    [[nodiscard]] std::optional<text::text_color> dominant_color() const noexcept {
        return metrics_.color;
    }

    /// Block texts joined with a blank line
    [[nodiscard]] std::string text() const;

    [[nodiscard]] bool has_text_content() const;

    [[nodiscard]] std::size_t text_block_count() const noexcept { return text_blocks_.size(); }
    [[nodiscard]] std::size_t total_line_count() const noexcept;
    [[nodiscard]] std::size_t total_chunk_count() const noexcept;

    /**
     * @brief WCAG large text
     *
     * 18pt and above, or 14pt and above with a weight of at least 700.
     */
    [[nodiscard]] bool is_large_text() const noexcept;

    [[nodiscard]] text::text_type text_type() const noexcept;

    [[nodiscard]] bool is_heading() const noexcept { return semantic::is_heading(type()); }
    [[nodiscard]] std::optional<int> heading_level() const noexcept {
        return semantic::heading_level(type());
    }

    [[nodiscard]] std::string own_text() const override { return text(); }

private:
    void derive_metrics();

    std::vector<text::text_block> text_blocks_;
    content_metrics metrics_;
};

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_CONTENT_NODE_HPP
