/**
 * @file text_chunk.hpp
 * @brief Text payload carried by content nodes
 *
 * Text is organised as blocks of lines of chunks. A chunk is a run of
 * characters sharing one font and colour; the chunk is the unit that font
 * metrics are reported for.
 */

#ifndef TAGCHECK_TEXT_TEXT_CHUNK_HPP
#define TAGCHECK_TEXT_TEXT_CHUNK_HPP

#include "tagcheck/geometry/bounding_box.hpp"
#include "tagcheck/text/text_type.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tagcheck::text {

/**
 * @brief RGBA colour, each component in [0, 1]
 */
struct text_color {
    double red = 0.0;
    double green = 0.0;
    double blue = 0.0;
    double alpha = 1.0;

    bool operator==(const text_color&) const = default;
};

/// Font weight from which a chunk counts as bold (CSS SemiBold)
inline constexpr double bold_font_weight = 600.0;

/**
 * @brief Run of text with uniform styling
 */
struct text_chunk {
    geometry::bounding_box box;
    std::string value;
    std::string font_name;
    double font_size = 12.0;
    double font_weight = 400.0;
    double italic_angle = 0.0;
    text_color color;
    std::optional<text_color> background_color;

    /// Pre-computed contrast ratio supplied by the extraction stage
    std::optional<double> contrast_ratio;

    bool underlined = false;
    double baseline = 0.0;

    /// Visual slant in degrees measured from the glyph outlines
    double slant_degree = 0.0;

    /// Non-zero italic angle or a visual slant above 10 degrees
    [[nodiscard]] bool is_italic() const noexcept;

    [[nodiscard]] bool is_bold() const noexcept { return font_weight >= bold_font_weight; }

    [[nodiscard]] text_type type() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return value.empty(); }
};

/**
 * @brief Visual line of text chunks
 */
struct text_line {
    geometry::bounding_box box;
    std::vector<text_chunk> chunks;
    bool line_start = true;
    bool line_end = true;

    /// Chunk values concatenated without separator
    [[nodiscard]] std::string text() const;

    [[nodiscard]] std::size_t chunk_count() const noexcept { return chunks.size(); }
    [[nodiscard]] bool empty() const;
};

/**
 * @brief Paragraph-like block of lines
 */
struct text_block {
    geometry::bounding_box box;
    std::vector<text_line> lines;

    /// Line texts joined with '\n'
    [[nodiscard]] std::string text() const;

    [[nodiscard]] std::size_t line_count() const noexcept { return lines.size(); }
    [[nodiscard]] std::size_t total_chunk_count() const noexcept;
    [[nodiscard]] bool empty() const;

    /// Every chunk in reading order
    [[nodiscard]] std::vector<text_chunk> all_chunks() const;
};

/**
 * @brief Single-line, single-chunk block
 *
 * Convenience for building trees by hand.
 */
[[nodiscard]] text_block make_text_block(const geometry::bounding_box& box,
                                         std::string value, double font_size = 12.0,
                                         double font_weight = 400.0);

}  // namespace tagcheck::text

#endif  // TAGCHECK_TEXT_TEXT_CHUNK_HPP
