/**
 * @file bounding_box.hpp
 * @brief Page-scoped axis-aligned rectangle
 *
 * Coordinates follow the PDF user space: the origin is the bottom-left
 * corner of the page and y grows upward. Every binary operation is only
 * defined for two boxes on the same page; cross-page operations yield no
 * result instead of a coerced value.
 */

#ifndef TAGCHECK_GEOMETRY_BOUNDING_BOX_HPP
#define TAGCHECK_GEOMETRY_BOUNDING_BOX_HPP

#include <optional>
#include <string>

namespace tagcheck::geometry {

/**
 * @brief Point in page coordinates
 */
struct point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const point&) const = default;
};

/**
 * @brief Rectangle on a single page
 *
 * Negative width or height are normalized on construction so that
 * (x, y) is always the bottom-left corner.
 *
 * @example
 * @code
 * bounding_box a{0, 0.0, 0.0, 100.0, 20.0};
 * bounding_box b{0, 50.0, 10.0, 100.0, 20.0};
 *
 * auto merged = a.union_with(b);          // {0, 0, 0, 150, 30}
 * double overlap = a.overlap_percentage(b); // 0.25
 * @endcode
 */
class bounding_box {
public:
    bounding_box() = default;

    /**
     * @brief Construct from origin and extent
     * @param page_index Zero-based page index
     * @param x Left edge
     * @param y Bottom edge
     * @param width Horizontal extent
     * @param height Vertical extent
     */
    bounding_box(int page_index, double x, double y, double width, double height) noexcept;

    /**
     * @brief Construct from the four edges
     */
    [[nodiscard]] static bounding_box from_corners(int page_index, double left_x,
                                                   double bottom_y, double right_x,
                                                   double top_y) noexcept;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] int page_index() const noexcept { return page_index_; }
    [[nodiscard]] double x() const noexcept { return x_; }
    [[nodiscard]] double y() const noexcept { return y_; }
    [[nodiscard]] double width() const noexcept { return width_; }
    [[nodiscard]] double height() const noexcept { return height_; }

    [[nodiscard]] double left_x() const noexcept { return x_; }
    [[nodiscard]] double right_x() const noexcept { return x_ + width_; }
    [[nodiscard]] double bottom_y() const noexcept { return y_; }
    [[nodiscard]] double top_y() const noexcept { return y_ + height_; }

    [[nodiscard]] double area() const noexcept { return width_ * height_; }
    [[nodiscard]] point center() const noexcept;

    /// True when the box encloses no area
    [[nodiscard]] bool is_empty() const noexcept;

    // =========================================================================
    // Geometric Operations
    // =========================================================================

    /**
     * @brief Smallest box covering both boxes
     * @return std::nullopt when the boxes are on different pages
     */
    [[nodiscard]] std::optional<bounding_box> union_with(const bounding_box& other) const noexcept;

    /**
     * @brief Overlapping region of both boxes
     * @return std::nullopt when the boxes are on different pages or do not
     *         overlap with a positive extent in both directions
     */
    [[nodiscard]] std::optional<bounding_box>
    intersection_with(const bounding_box& other) const noexcept;

    /// Full containment; always false across pages
    [[nodiscard]] bool contains(const bounding_box& other) const noexcept;

    /// Point containment, edges included; the page is not considered
    [[nodiscard]] bool contains(const point& p) const noexcept;

    /// Positive-area overlap on the same page
    [[nodiscard]] bool intersects(const bounding_box& other) const noexcept;

    /**
     * @brief Intersection area divided by the smaller box's area
     *
     * @return Value in [0, 1]; 0 when disjoint, on different pages, or when
     *         the smaller box has no area
     */
    [[nodiscard]] double overlap_percentage(const bounding_box& other) const noexcept;

    /**
     * @brief Grow (positive) or shrink (negative) each side
     */
    [[nodiscard]] bounding_box inset_by(double dx, double dy) const noexcept;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const bounding_box&) const = default;

private:
    int page_index_ = 0;
    double x_ = 0.0;
    double y_ = 0.0;
    double width_ = 0.0;
    double height_ = 0.0;
};

}  // namespace tagcheck::geometry

#endif  // TAGCHECK_GEOMETRY_BOUNDING_BOX_HPP
