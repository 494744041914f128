/**
 * @file figure_node.cpp
 * @brief Implementation of the figure node
 */

#include "tagcheck/semantic/figure_node.hpp"

#include <utility>

namespace tagcheck::semantic {

figure_node::figure_node(node_fields fields, std::vector<image_chunk> images,
                         std::vector<line_art_chunk> line_art)
    : semantic_node(semantic_type::figure, std::move(fields)),
      image_chunks_(std::move(images)),
      line_art_chunks_(std::move(line_art)) {}

bool figure_node::appears_decorative() const {
    return !has_text_alternative() && !has_children() && !has_visual_content();
}

const semantic_node* figure_node::caption() const {
    return first_child_of_type(semantic_type::caption);
}

std::optional<std::string> figure_node::caption_text() const {
    const auto* node = caption();
    if (node == nullptr) {
        return std::nullopt;
    }
    auto text = node->collected_text();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<geometry::bounding_box> figure_node::computed_box() const {
    if (box()) {
        return box();
    }

    std::optional<geometry::bounding_box> merged;
    auto merge = [&merged](const geometry::bounding_box& b) {
        if (!merged) {
            merged = b;
        } else if (auto u = merged->union_with(b)) {
            merged = *u;
        }
    };

    for (const auto& image : image_chunks_) {
        merge(image.box);
    }
    for (const auto& art : line_art_chunks_) {
        merge(art.box());
    }
    return merged;
}

std::optional<std::string> figure_node::best_description() const {
    if (auto own = text_description()) {
        return own;
    }
    if (auto text = caption_text()) {
        return text;
    }
    for (const auto& image : image_chunks_) {
        if (auto d = image.text_description()) {
            return d;
        }
    }
    for (const auto& art : line_art_chunks_) {
        if (auto d = art.text_description()) {
            return d;
        }
    }
    return std::nullopt;
}

std::set<semantic_error_code> figure_node::validate_accessibility() const {
    std::set<semantic_error_code> codes;
    if (!has_text_alternative() && !appears_decorative()) {
        codes.insert(semantic_error_code::figure_missing_alt_text);
    }
    return codes;
}

}  // namespace tagcheck::semantic
