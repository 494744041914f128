/**
 * @file line_chunk.hpp
 * @brief Stroked line segment extracted from vector content
 *
 * Line chunks are the raw material of table border detection. Only the
 * geometric queries needed to group and compare segments live here; the
 * clustering of segments into a table grid is done upstream.
 */

#ifndef TAGCHECK_GEOMETRY_LINE_CHUNK_HPP
#define TAGCHECK_GEOMETRY_LINE_CHUNK_HPP

#include "tagcheck/geometry/bounding_box.hpp"

#include <array>

namespace tagcheck::geometry {

/// RGBA stroke colour, each component in [0, 1]
using stroke_color = std::array<double, 4>;

/**
 * @brief A straight stroked segment on one page
 */
class line_chunk {
public:
    /**
     * @brief Construct from endpoints
     *
     * The bounding box is derived from the endpoints, expanded by half the
     * line width on every side.
     */
    line_chunk(int page_index, point start, point end, double line_width = 1.0,
               stroke_color color = {0.0, 0.0, 0.0, 1.0});

    /**
     * @brief Construct with an explicit bounding box
     */
    line_chunk(bounding_box box, point start, point end, double line_width = 1.0,
               stroke_color color = {0.0, 0.0, 0.0, 1.0});

    [[nodiscard]] const bounding_box& box() const noexcept { return box_; }
    [[nodiscard]] int page_index() const noexcept { return box_.page_index(); }
    [[nodiscard]] const point& start() const noexcept { return start_; }
    [[nodiscard]] const point& end() const noexcept { return end_; }
    [[nodiscard]] double line_width() const noexcept { return line_width_; }
    [[nodiscard]] const stroke_color& color() const noexcept { return color_; }

    [[nodiscard]] double length() const noexcept;

    /**
     * @brief Horizontal within max(1% of the length, 0.5pt)
     *
     * A zero-length line counts as both horizontal and vertical.
     */
    [[nodiscard]] bool is_horizontal() const noexcept;

    /// Vertical within max(1% of the length, 0.5pt)
    [[nodiscard]] bool is_vertical() const noexcept;

    [[nodiscard]] bool is_axis_aligned() const noexcept;

    /// Direction in radians, measured from the positive x axis
    [[nodiscard]] double angle() const noexcept;

    [[nodiscard]] point midpoint() const noexcept;

    /**
     * @brief Shortest distance from @p p to the segment
     *
     * Falls back to the distance to the start point for zero-length lines.
     */
    [[nodiscard]] double distance_to(const point& p) const noexcept;

    /**
     * @brief Distance from @p p to the infinite line through the segment
     *
     * Falls back to the distance to the start point for zero-length lines.
     */
    [[nodiscard]] double perpendicular_distance_to(const point& p) const noexcept;

    /**
     * @brief Both segments lie on a common line within @p tolerance
     *
     * Every endpoint must be within tolerance of the other segment's
     * infinite line. Always false for segments on different pages.
     */
    [[nodiscard]] bool is_collinear_with(const line_chunk& other,
                                         double tolerance = 1.0) const noexcept;

    bool operator==(const line_chunk&) const = default;

private:
    bounding_box box_;
    point start_;
    point end_;
    double line_width_;
    stroke_color color_;
};

}  // namespace tagcheck::geometry

#endif  // TAGCHECK_GEOMETRY_LINE_CHUNK_HPP
