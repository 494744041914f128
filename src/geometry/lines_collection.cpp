/**
 * @file lines_collection.cpp
 * @brief Implementation of the line chunk collection
 */

#include "tagcheck/geometry/lines_collection.hpp"

#include <algorithm>
#include <iterator>

namespace tagcheck::geometry {

namespace {

std::optional<bounding_box> union_of(const std::vector<line_chunk>& lines) {
    if (lines.empty()) {
        return std::nullopt;
    }
    auto merged = lines.front().box();
    for (auto it = std::next(lines.begin()); it != lines.end(); ++it) {
        if (auto u = merged.union_with(it->box())) {
            merged = *u;
        }
    }
    return merged;
}

}  // namespace

lines_collection::lines_collection(std::vector<line_chunk> lines)
    : lines_(std::move(lines)) {
    std::stable_sort(lines_.begin(), lines_.end(),
                     [](const line_chunk& a, const line_chunk& b) {
                         return a.page_index() < b.page_index();
                     });
}

template <typename Predicate>
std::vector<line_chunk> lines_collection::select(Predicate pred) const {
    std::vector<line_chunk> result;
    std::copy_if(lines_.begin(), lines_.end(), std::back_inserter(result), pred);
    return result;
}

std::set<int> lines_collection::page_indices() const {
    std::set<int> pages;
    for (const auto& line : lines_) {
        pages.insert(line.page_index());
    }
    return pages;
}

std::size_t lines_collection::page_count() const {
    return page_indices().size();
}

std::vector<line_chunk> lines_collection::horizontal_lines() const {
    return select([](const line_chunk& l) { return l.is_horizontal(); });
}

std::vector<line_chunk> lines_collection::vertical_lines() const {
    return select([](const line_chunk& l) { return l.is_vertical(); });
}

std::vector<line_chunk> lines_collection::axis_aligned_lines() const {
    return select([](const line_chunk& l) { return l.is_axis_aligned(); });
}

lines_collection lines_collection::filtered_horizontal() const {
    return lines_collection{horizontal_lines()};
}

lines_collection lines_collection::filtered_vertical() const {
    return lines_collection{vertical_lines()};
}

lines_collection lines_collection::filtered_axis_aligned() const {
    return lines_collection{axis_aligned_lines()};
}

std::vector<line_chunk> lines_collection::lines_on_page(int page_index) const {
    return select([page_index](const line_chunk& l) { return l.page_index() == page_index; });
}

lines_collection lines_collection::filtered_by_page(int page_index) const {
    return lines_collection{lines_on_page(page_index)};
}

std::vector<line_chunk> lines_collection::lines_overlapping(const bounding_box& box) const {
    return select([&box](const line_chunk& l) { return l.box().intersects(box); });
}

lines_collection lines_collection::filtered_overlapping(const bounding_box& box) const {
    return lines_collection{lines_overlapping(box)};
}

std::vector<line_chunk> lines_collection::lines_near(const point& p, int page_index,
                                                     double max_distance) const {
    return select([&](const line_chunk& l) {
        return l.page_index() == page_index && l.distance_to(p) <= max_distance;
    });
}

std::vector<line_chunk> lines_collection::lines_near(const bounding_box& box,
                                                     double max_distance) const {
    const auto expanded = box.inset_by(max_distance, max_distance);
    return select([&expanded](const line_chunk& l) { return l.box().intersects(expanded); });
}

std::vector<line_chunk> lines_collection::lines_contained_in(const bounding_box& box) const {
    return select([&box](const line_chunk& l) { return box.contains(l.box()); });
}

std::vector<line_chunk> lines_collection::lines_with_min_width(double min_width) const {
    return select([min_width](const line_chunk& l) { return l.line_width() >= min_width; });
}

std::vector<line_chunk> lines_collection::lines_with_max_width(double max_width) const {
    return select([max_width](const line_chunk& l) { return l.line_width() <= max_width; });
}

std::vector<line_chunk> lines_collection::lines_with_min_length(double min_length) const {
    return select([min_length](const line_chunk& l) { return l.length() >= min_length; });
}

lines_collection lines_collection::adding(const line_chunk& line) const {
    auto lines = lines_;
    lines.push_back(line);
    return lines_collection{std::move(lines)};
}

lines_collection lines_collection::adding(const std::vector<line_chunk>& lines) const {
    auto combined = lines_;
    combined.insert(combined.end(), lines.begin(), lines.end());
    return lines_collection{std::move(combined)};
}

lines_collection lines_collection::merged_with(const lines_collection& other) const {
    return adding(other.lines_);
}

double lines_collection::total_length() const noexcept {
    double total = 0.0;
    for (const auto& line : lines_) {
        total += line.length();
    }
    return total;
}

std::optional<double> lines_collection::average_line_width() const noexcept {
    if (lines_.empty()) {
        return std::nullopt;
    }
    double total = 0.0;
    for (const auto& line : lines_) {
        total += line.line_width();
    }
    return total / static_cast<double>(lines_.size());
}

std::optional<bounding_box> lines_collection::combined_box() const {
    return union_of(lines_);
}

std::optional<bounding_box> lines_collection::combined_box(int page_index) const {
    return union_of(lines_on_page(page_index));
}

}  // namespace tagcheck::geometry
