/**
 * @file multi_bounding_box.hpp
 * @brief Bounding region spanning one or more pages
 */

#ifndef TAGCHECK_GEOMETRY_MULTI_BOUNDING_BOX_HPP
#define TAGCHECK_GEOMETRY_MULTI_BOUNDING_BOX_HPP

#include "tagcheck/geometry/bounding_box.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <vector>

namespace tagcheck::geometry {

/**
 * @brief Ordered collection of page-scoped boxes
 *
 * Content such as a paragraph broken across a page boundary is described
 * by several boxes. The boxes are kept sorted by page index; boxes on the
 * same page keep their insertion order.
 */
class multi_bounding_box {
public:
    using const_iterator = std::vector<bounding_box>::const_iterator;

    multi_bounding_box() = default;
    explicit multi_bounding_box(bounding_box box);
    explicit multi_bounding_box(std::vector<bounding_box> boxes);

    [[nodiscard]] const std::vector<bounding_box>& boxes() const noexcept { return boxes_; }
    [[nodiscard]] bool empty() const noexcept { return boxes_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return boxes_.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return boxes_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return boxes_.end(); }

    [[nodiscard]] std::optional<bounding_box> first() const;
    [[nodiscard]] std::optional<bounding_box> last() const;

    [[nodiscard]] std::set<int> page_indices() const;
    [[nodiscard]] std::size_t page_count() const;
    [[nodiscard]] bool is_multi_page() const;

    /// Sum of the individual areas; overlapping boxes are counted twice
    [[nodiscard]] double total_area() const noexcept;

    [[nodiscard]] std::vector<bounding_box> boxes_on_page(int page_index) const;

    /**
     * @brief Union of every box on one page
     * @return std::nullopt when no box lies on that page
     */
    [[nodiscard]] std::optional<bounding_box> union_box_for_page(int page_index) const;

    [[nodiscard]] multi_bounding_box adding(const bounding_box& box) const;
    [[nodiscard]] multi_bounding_box adding(const std::vector<bounding_box>& boxes) const;
    [[nodiscard]] multi_bounding_box merged_with(const multi_bounding_box& other) const;
    [[nodiscard]] multi_bounding_box filtered_by_page(int page_index) const;

    /// True when any contained box intersects @p other
    [[nodiscard]] bool intersects(const bounding_box& other) const noexcept;

    /// True when any contained box fully contains @p other
    [[nodiscard]] bool contains(const bounding_box& other) const noexcept;

    [[nodiscard]] bool contains(const point& p, int page_index) const noexcept;

    bool operator==(const multi_bounding_box&) const = default;

private:
    void sort_by_page();

    std::vector<bounding_box> boxes_;
};

}  // namespace tagcheck::geometry

#endif  // TAGCHECK_GEOMETRY_MULTI_BOUNDING_BOX_HPP
