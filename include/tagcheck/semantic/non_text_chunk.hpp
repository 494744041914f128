/**
 * @file non_text_chunk.hpp
 * @brief Raster image and vector line-art payloads of figure nodes
 */

#ifndef TAGCHECK_SEMANTIC_NON_TEXT_CHUNK_HPP
#define TAGCHECK_SEMANTIC_NON_TEXT_CHUNK_HPP

#include "tagcheck/geometry/bounding_box.hpp"
#include "tagcheck/geometry/line_chunk.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tagcheck::semantic {

// =============================================================================
// Image Chunk
// =============================================================================

/**
 * @brief Raster image placed on a page
 *
 * Pixel data is not retained; only the metadata needed for accessibility
 * checks.
 */
struct image_chunk {
    geometry::bounding_box box;
    int pixel_width = 0;
    int pixel_height = 0;
    int bits_per_component = 8;
    std::string color_space_name = "DeviceRGB";
    int component_count = 3;
    std::optional<std::string> alt_text;
    std::optional<std::string> actual_text;

    [[nodiscard]] bool has_alternative_text() const noexcept;

    [[nodiscard]] std::int64_t pixel_count() const noexcept {
        return static_cast<std::int64_t>(pixel_width) * pixel_height;
    }

    [[nodiscard]] bool is_grayscale() const noexcept { return component_count == 1; }

    /// Pixel width divided by pixel height; nullopt for zero height
    [[nodiscard]] std::optional<double> aspect_ratio() const noexcept;

    /// Pixels per point along x; nullopt when the box has no width
    [[nodiscard]] std::optional<double> horizontal_resolution() const noexcept;

    /// Pixels per point along y; nullopt when the box has no height
    [[nodiscard]] std::optional<double> vertical_resolution() const noexcept;

    /// Alt, else ActualText
    [[nodiscard]] std::optional<std::string> text_description() const;
};

// =============================================================================
// Line Art Chunk
// =============================================================================

/**
 * @brief Vector drawing made of stroked segments
 */
class line_art_chunk {
public:
    /**
     * @brief Construct from segments
     *
     * Without an explicit box, the box is the union of the segment boxes on
     * the first segment's page (an empty box on page 0 for no segments).
     */
    explicit line_art_chunk(std::vector<geometry::line_chunk> lines,
                            std::optional<geometry::bounding_box> box = std::nullopt,
                            std::optional<std::string> alt_text = std::nullopt,
                            std::optional<std::string> actual_text = std::nullopt);

    [[nodiscard]] const geometry::bounding_box& box() const noexcept { return box_; }
    [[nodiscard]] const std::vector<geometry::line_chunk>& lines() const noexcept {
        return lines_;
    }
    [[nodiscard]] const std::optional<std::string>& alt_text() const noexcept { return alt_text_; }
    [[nodiscard]] const std::optional<std::string>& actual_text() const noexcept {
        return actual_text_;
    }

    [[nodiscard]] std::size_t line_count() const noexcept { return lines_.size(); }
    [[nodiscard]] double total_length() const noexcept;

    [[nodiscard]] std::vector<geometry::line_chunk> horizontal_lines() const;
    [[nodiscard]] std::vector<geometry::line_chunk> vertical_lines() const;

    /// At least two horizontal and two vertical segments
    [[nodiscard]] bool appears_grid_like() const;

    [[nodiscard]] bool has_alternative_text() const noexcept;
    [[nodiscard]] std::optional<std::string> text_description() const;

private:
    geometry::bounding_box box_;
    std::vector<geometry::line_chunk> lines_;
    std::optional<std::string> alt_text_;
    std::optional<std::string> actual_text_;
};

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_NON_TEXT_CHUNK_HPP
