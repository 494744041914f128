/**
 * @file multi_bounding_box.cpp
 * @brief Implementation of the multi-page bounding region
 */

#include "tagcheck/geometry/multi_bounding_box.hpp"

#include <algorithm>
#include <iterator>

namespace tagcheck::geometry {

multi_bounding_box::multi_bounding_box(bounding_box box) : boxes_{box} {}

multi_bounding_box::multi_bounding_box(std::vector<bounding_box> boxes)
    : boxes_(std::move(boxes)) {
    sort_by_page();
}

void multi_bounding_box::sort_by_page() {
    std::stable_sort(boxes_.begin(), boxes_.end(),
                     [](const bounding_box& a, const bounding_box& b) {
                         return a.page_index() < b.page_index();
                     });
}

std::optional<bounding_box> multi_bounding_box::first() const {
    if (boxes_.empty()) {
        return std::nullopt;
    }
    return boxes_.front();
}

std::optional<bounding_box> multi_bounding_box::last() const {
    if (boxes_.empty()) {
        return std::nullopt;
    }
    return boxes_.back();
}

std::set<int> multi_bounding_box::page_indices() const {
    std::set<int> pages;
    for (const auto& box : boxes_) {
        pages.insert(box.page_index());
    }
    return pages;
}

std::size_t multi_bounding_box::page_count() const {
    return page_indices().size();
}

bool multi_bounding_box::is_multi_page() const {
    return page_count() > 1;
}

double multi_bounding_box::total_area() const noexcept {
    double total = 0.0;
    for (const auto& box : boxes_) {
        total += box.area();
    }
    return total;
}

std::vector<bounding_box> multi_bounding_box::boxes_on_page(int page_index) const {
    std::vector<bounding_box> result;
    std::copy_if(boxes_.begin(), boxes_.end(), std::back_inserter(result),
                 [page_index](const bounding_box& b) { return b.page_index() == page_index; });
    return result;
}

std::optional<bounding_box> multi_bounding_box::union_box_for_page(int page_index) const {
    std::optional<bounding_box> merged;
    for (const auto& box : boxes_) {
        if (box.page_index() != page_index) {
            continue;
        }
        merged = merged ? merged->union_with(box) : box;
    }
    return merged;
}

multi_bounding_box multi_bounding_box::adding(const bounding_box& box) const {
    auto boxes = boxes_;
    boxes.push_back(box);
    return multi_bounding_box{std::move(boxes)};
}

multi_bounding_box multi_bounding_box::adding(const std::vector<bounding_box>& boxes) const {
    auto combined = boxes_;
    combined.insert(combined.end(), boxes.begin(), boxes.end());
    return multi_bounding_box{std::move(combined)};
}

multi_bounding_box multi_bounding_box::merged_with(const multi_bounding_box& other) const {
    return adding(other.boxes_);
}

multi_bounding_box multi_bounding_box::filtered_by_page(int page_index) const {
    return multi_bounding_box{boxes_on_page(page_index)};
}

bool multi_bounding_box::intersects(const bounding_box& other) const noexcept {
    return std::any_of(boxes_.begin(), boxes_.end(),
                       [&other](const bounding_box& b) { return b.intersects(other); });
}

bool multi_bounding_box::contains(const bounding_box& other) const noexcept {
    return std::any_of(boxes_.begin(), boxes_.end(),
                       [&other](const bounding_box& b) { return b.contains(other); });
}

bool multi_bounding_box::contains(const point& p, int page_index) const noexcept {
    return std::any_of(boxes_.begin(), boxes_.end(), [&](const bounding_box& b) {
        return b.page_index() == page_index && b.contains(p);
    });
}

}  // namespace tagcheck::geometry
