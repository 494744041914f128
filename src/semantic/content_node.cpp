/**
 * @file content_node.cpp
 * @brief Implementation of the generic content node
 */

#include "tagcheck/semantic/content_node.hpp"

#include <map>
#include <utility>
#include <tuple>

namespace tagcheck::semantic {

namespace {

constexpr double large_bold_min_weight = 700.0;

template <typename Key>
std::optional<Key> weighted_mode(const std::map<Key, std::size_t>& histogram) {
    std::optional<Key> best;
    std::size_t best_count = 0;
    for (const auto& [key, count] : histogram) {
        if (count > best_count) {
            best = key;
            best_count = count;
        }
    }
    return best;
}

}  // namespace

content_node::content_node(semantic_type type, node_fields fields,
                           std::vector<text::text_block> text_blocks,
                           content_metrics metrics)
    : semantic_node(type, std::move(fields)),
      text_blocks_(std::move(text_blocks)),
      metrics_(metrics) {
    derive_metrics();
}

void content_node::derive_metrics() {
    if (metrics_.font_size && metrics_.font_weight && metrics_.color) {
        return;
    }

    using color_key = std::tuple<double, double, double, double>;
    std::map<double, std::size_t> sizes;
    std::map<double, std::size_t> weights;
    std::map<color_key, std::size_t> colors;

    for (const auto& block : text_blocks_) {
        for (const auto& line : block.lines) {
            for (const auto& chunk : line.chunks) {
                const std::size_t weight = chunk.value.empty() ? 1 : chunk.value.size();
                sizes[chunk.font_size] += weight;
                weights[chunk.font_weight] += weight;
                colors[{chunk.color.red, chunk.color.green, chunk.color.blue,
                        chunk.color.alpha}] += weight;
            }
        }
    }

    if (!metrics_.font_size) {
        metrics_.font_size = weighted_mode(sizes);
    }
    if (!metrics_.font_weight) {
        metrics_.font_weight = weighted_mode(weights);
    }
    if (!metrics_.color) {
        if (auto c = weighted_mode(colors)) {
            auto [r, g, b, a] = *c;
            metrics_.color = text::text_color{r, g, b, a};
        }
    }
}

std::string content_node::text() const {
    std::string result;
    for (std::size_t i = 0; i < text_blocks_.size(); ++i) {
        if (i > 0) {
            result += "\n\n";
        }
        result += text_blocks_[i].text();
    }
    return result;
}

bool content_node::has_text_content() const {
    return !text_blocks_.empty() && !text().empty();
}

std::size_t content_node::total_line_count() const noexcept {
    std::size_t count = 0;
    for (const auto& block : text_blocks_) {
        count += block.line_count();
    }
    return count;
}

std::size_t content_node::total_chunk_count() const noexcept {
    std::size_t count = 0;
    for (const auto& block : text_blocks_) {
        count += block.total_chunk_count();
    }
    return count;
}

bool content_node::is_large_text() const noexcept {
    if (!metrics_.font_size) {
        return false;
    }
    if (*metrics_.font_size >= text::large_text_min_size) {
        return true;
    }
    return *metrics_.font_size >= text::large_bold_text_min_size && metrics_.font_weight &&
           *metrics_.font_weight >= large_bold_min_weight;
}

text::text_type content_node::text_type() const noexcept {
    return is_large_text() ? text::text_type::large : text::text_type::regular;
}

}  // namespace tagcheck::semantic
