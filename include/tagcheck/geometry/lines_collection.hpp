/**
 * @file lines_collection.hpp
 * @brief Page-sorted collection of line chunks with spatial filters
 */

#ifndef TAGCHECK_GEOMETRY_LINES_COLLECTION_HPP
#define TAGCHECK_GEOMETRY_LINES_COLLECTION_HPP

#include "tagcheck/geometry/line_chunk.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <vector>

namespace tagcheck::geometry {

/**
 * @brief Immutable set of line chunks sorted by page index
 *
 * Filters return plain vectors; the filtered_* and adding/merged_with
 * members return new collections.
 */
class lines_collection {
public:
    using const_iterator = std::vector<line_chunk>::const_iterator;

    lines_collection() = default;
    explicit lines_collection(std::vector<line_chunk> lines);

    [[nodiscard]] const std::vector<line_chunk>& lines() const noexcept { return lines_; }
    [[nodiscard]] bool empty() const noexcept { return lines_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return lines_.size(); }
    [[nodiscard]] const line_chunk& operator[](std::size_t index) const { return lines_[index]; }

    [[nodiscard]] const_iterator begin() const noexcept { return lines_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return lines_.end(); }

    [[nodiscard]] std::set<int> page_indices() const;
    [[nodiscard]] std::size_t page_count() const;

    // =========================================================================
    // Orientation
    // =========================================================================

    [[nodiscard]] std::vector<line_chunk> horizontal_lines() const;
    [[nodiscard]] std::vector<line_chunk> vertical_lines() const;
    [[nodiscard]] std::vector<line_chunk> axis_aligned_lines() const;

    [[nodiscard]] lines_collection filtered_horizontal() const;
    [[nodiscard]] lines_collection filtered_vertical() const;
    [[nodiscard]] lines_collection filtered_axis_aligned() const;

    // =========================================================================
    // Spatial Queries
    // =========================================================================

    [[nodiscard]] std::vector<line_chunk> lines_on_page(int page_index) const;
    [[nodiscard]] lines_collection filtered_by_page(int page_index) const;

    [[nodiscard]] std::vector<line_chunk> lines_overlapping(const bounding_box& box) const;
    [[nodiscard]] lines_collection filtered_overlapping(const bounding_box& box) const;

    /// Lines on @p page_index whose segment lies within @p max_distance of @p p
    [[nodiscard]] std::vector<line_chunk> lines_near(const point& p, int page_index,
                                                     double max_distance) const;

    /// Lines whose box intersects @p box grown by @p max_distance
    [[nodiscard]] std::vector<line_chunk> lines_near(const bounding_box& box,
                                                     double max_distance) const;

    [[nodiscard]] std::vector<line_chunk> lines_contained_in(const bounding_box& box) const;

    // =========================================================================
    // Width / Length
    // =========================================================================

    [[nodiscard]] std::vector<line_chunk> lines_with_min_width(double min_width) const;
    [[nodiscard]] std::vector<line_chunk> lines_with_max_width(double max_width) const;
    [[nodiscard]] std::vector<line_chunk> lines_with_min_length(double min_length) const;

    // =========================================================================
    // Combination
    // =========================================================================

    [[nodiscard]] lines_collection adding(const line_chunk& line) const;
    [[nodiscard]] lines_collection adding(const std::vector<line_chunk>& lines) const;
    [[nodiscard]] lines_collection merged_with(const lines_collection& other) const;

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] double total_length() const noexcept;
    [[nodiscard]] std::optional<double> average_line_width() const noexcept;

    /**
     * @brief Union of the line boxes
     *
     * Lines on pages other than the first line's page are skipped.
     */
    [[nodiscard]] std::optional<bounding_box> combined_box() const;
    [[nodiscard]] std::optional<bounding_box> combined_box(int page_index) const;

private:
    template <typename Predicate>
    [[nodiscard]] std::vector<line_chunk> select(Predicate pred) const;

    std::vector<line_chunk> lines_;
};

}  // namespace tagcheck::geometry

#endif  // TAGCHECK_GEOMETRY_LINES_COLLECTION_HPP
