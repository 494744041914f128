/**
 * @file text_chunk.cpp
 * @brief Implementation of the text payload types
 */

#include "tagcheck/text/text_chunk.hpp"

#include <cmath>
#include <utility>

namespace tagcheck::text {

// =============================================================================
// text_chunk
// =============================================================================

bool text_chunk::is_italic() const noexcept {
    return std::abs(italic_angle) > 0.0 || slant_degree > 10.0;
}

text_type text_chunk::type() const noexcept {
    if (font_size >= large_text_min_size) {
        return text_type::large;
    }
    if (font_size >= large_bold_text_min_size && is_bold()) {
        return text_type::large;
    }
    return text_type::regular;
}

// =============================================================================
// text_line
// =============================================================================

std::string text_line::text() const {
    std::string result;
    for (const auto& chunk : chunks) {
        result += chunk.value;
    }
    return result;
}

bool text_line::empty() const {
    return chunks.empty() || text().empty();
}

// =============================================================================
// text_block
// =============================================================================

std::string text_block::text() const {
    std::string result;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i].text();
    }
    return result;
}

std::size_t text_block::total_chunk_count() const noexcept {
    std::size_t count = 0;
    for (const auto& line : lines) {
        count += line.chunk_count();
    }
    return count;
}

bool text_block::empty() const {
    return lines.empty() || text().empty();
}

std::vector<text_chunk> text_block::all_chunks() const {
    std::vector<text_chunk> result;
    result.reserve(total_chunk_count());
    for (const auto& line : lines) {
        result.insert(result.end(), line.chunks.begin(), line.chunks.end());
    }
    return result;
}

text_block make_text_block(const geometry::bounding_box& box, std::string value,
                           double font_size, double font_weight) {
    text_chunk chunk;
    chunk.box = box;
    chunk.value = std::move(value);
    chunk.font_size = font_size;
    chunk.font_weight = font_weight;

    text_line line;
    line.box = box;
    line.chunks.push_back(std::move(chunk));

    text_block block;
    block.box = box;
    block.lines.push_back(std::move(line));
    return block;
}

}  // namespace tagcheck::text
