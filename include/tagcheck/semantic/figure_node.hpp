/**
 * @file figure_node.hpp
 * @brief Figure structure element with image and vector content
 */

#ifndef TAGCHECK_SEMANTIC_FIGURE_NODE_HPP
#define TAGCHECK_SEMANTIC_FIGURE_NODE_HPP

#include "tagcheck/semantic/error_code.hpp"
#include "tagcheck/semantic/non_text_chunk.hpp"
#include "tagcheck/semantic/semantic_node.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tagcheck::semantic {

/**
 * @brief Figure node
 *
 * The role is always Figure. The caption is the first child whose role is
 * Caption.
 */
class figure_node final : public semantic_node {
public:
    explicit figure_node(node_fields fields, std::vector<image_chunk> images = {},
                         std::vector<line_art_chunk> line_art = {});

    [[nodiscard]] node_kind kind() const noexcept override { return node_kind::figure; }

    [[nodiscard]] const std::vector<image_chunk>& image_chunks() const noexcept {
        return image_chunks_;
    }

    [[nodiscard]] const std::vector<line_art_chunk>& line_art_chunks() const noexcept {
        return line_art_chunks_;
    }

    [[nodiscard]] bool has_images() const noexcept { return !image_chunks_.empty(); }
    [[nodiscard]] bool has_line_art() const noexcept { return !line_art_chunks_.empty(); }
    [[nodiscard]] bool has_visual_content() const noexcept {
        return has_images() || has_line_art();
    }

    /// No text alternative, no children and no visual content
    [[nodiscard]] bool appears_decorative() const;

    [[nodiscard]] const semantic_node* caption() const;
    [[nodiscard]] bool has_caption() const { return caption() != nullptr; }

    /// Text of the caption subtree, nullopt without a caption or text
    [[nodiscard]] std::optional<std::string> caption_text() const;

    /**
     * @brief Box of the figure
     *
     * The explicit box when present, otherwise the union of the image and
     * line-art boxes lying on the first chunk's page.
     */
    [[nodiscard]] std::optional<geometry::bounding_box> computed_box() const;

    /// Node text alternative, caption, image description, then line-art description
    [[nodiscard]] std::optional<std::string> best_description() const;

    /**
     * @brief Accessibility defects of this figure
     * @return figure_missing_alt_text when no alternative exists and the
     *         figure is not decorative
     */
    [[nodiscard]] std::set<semantic_error_code> validate_accessibility() const;

private:
    std::vector<image_chunk> image_chunks_;
    std::vector<line_art_chunk> line_art_chunks_;
};

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_FIGURE_NODE_HPP
