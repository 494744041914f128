/**
 * @file non_text_chunk.cpp
 * @brief Implementation of image and line-art payloads
 */

#include "tagcheck/semantic/non_text_chunk.hpp"

#include <algorithm>
#include <utility>
#include <iterator>

namespace tagcheck::semantic {

namespace {

bool non_empty(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

std::optional<std::string> first_non_empty(const std::optional<std::string>& a,
                                           const std::optional<std::string>& b) {
    if (non_empty(a)) {
        return a;
    }
    if (non_empty(b)) {
        return b;
    }
    return std::nullopt;
}

geometry::bounding_box union_of_lines(const std::vector<geometry::line_chunk>& lines) {
    if (lines.empty()) {
        return geometry::bounding_box{};
    }
    auto merged = lines.front().box();
    for (const auto& line : lines) {
        if (auto u = merged.union_with(line.box())) {
            merged = *u;
        }
    }
    return merged;
}

}  // namespace

// =============================================================================
// image_chunk
// =============================================================================

bool image_chunk::has_alternative_text() const noexcept {
    return non_empty(alt_text) || non_empty(actual_text);
}

std::optional<double> image_chunk::aspect_ratio() const noexcept {
    if (pixel_height <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(pixel_width) / static_cast<double>(pixel_height);
}

std::optional<double> image_chunk::horizontal_resolution() const noexcept {
    if (box.width() <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(pixel_width) / box.width();
}

std::optional<double> image_chunk::vertical_resolution() const noexcept {
    if (box.height() <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(pixel_height) / box.height();
}

std::optional<std::string> image_chunk::text_description() const {
    return first_non_empty(alt_text, actual_text);
}

// =============================================================================
// line_art_chunk
// =============================================================================

line_art_chunk::line_art_chunk(std::vector<geometry::line_chunk> lines,
                               std::optional<geometry::bounding_box> box,
                               std::optional<std::string> alt_text,
                               std::optional<std::string> actual_text)
    : box_(box ? *box : union_of_lines(lines)),
      lines_(std::move(lines)),
      alt_text_(std::move(alt_text)),
      actual_text_(std::move(actual_text)) {}

double line_art_chunk::total_length() const noexcept {
    double total = 0.0;
    for (const auto& line : lines_) {
        total += line.length();
    }
    return total;
}

std::vector<geometry::line_chunk> line_art_chunk::horizontal_lines() const {
    std::vector<geometry::line_chunk> result;
    std::copy_if(lines_.begin(), lines_.end(), std::back_inserter(result),
                 [](const geometry::line_chunk& l) { return l.is_horizontal(); });
    return result;
}

std::vector<geometry::line_chunk> line_art_chunk::vertical_lines() const {
    std::vector<geometry::line_chunk> result;
    std::copy_if(lines_.begin(), lines_.end(), std::back_inserter(result),
                 [](const geometry::line_chunk& l) { return l.is_vertical(); });
    return result;
}

bool line_art_chunk::appears_grid_like() const {
    return horizontal_lines().size() >= 2 && vertical_lines().size() >= 2;
}

bool line_art_chunk::has_alternative_text() const noexcept {
    return non_empty(alt_text_) || non_empty(actual_text_);
}

std::optional<std::string> line_art_chunk::text_description() const {
    return first_non_empty(alt_text_, actual_text_);
}

}  // namespace tagcheck::semantic
