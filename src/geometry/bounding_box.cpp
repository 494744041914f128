/**
 * @file bounding_box.cpp
 * @brief Implementation of the page-scoped rectangle
 */

#include "tagcheck/geometry/bounding_box.hpp"
#include "tagcheck/compat/format.hpp"

#include <algorithm>

namespace tagcheck::geometry {

bounding_box::bounding_box(int page_index, double x, double y, double width,
                           double height) noexcept
    : page_index_(page_index), x_(x), y_(y), width_(width), height_(height) {
    if (width_ < 0.0) {
        x_ += width_;
        width_ = -width_;
    }
    if (height_ < 0.0) {
        y_ += height_;
        height_ = -height_;
    }
}

bounding_box bounding_box::from_corners(int page_index, double left_x, double bottom_y,
                                        double right_x, double top_y) noexcept {
    return bounding_box{page_index, left_x, bottom_y, right_x - left_x, top_y - bottom_y};
}

point bounding_box::center() const noexcept {
    return point{x_ + width_ / 2.0, y_ + height_ / 2.0};
}

bool bounding_box::is_empty() const noexcept {
    return width_ <= 0.0 || height_ <= 0.0;
}

std::optional<bounding_box>
bounding_box::union_with(const bounding_box& other) const noexcept {
    if (page_index_ != other.page_index_) {
        return std::nullopt;
    }
    return from_corners(page_index_,
                        std::min(left_x(), other.left_x()),
                        std::min(bottom_y(), other.bottom_y()),
                        std::max(right_x(), other.right_x()),
                        std::max(top_y(), other.top_y()));
}

std::optional<bounding_box>
bounding_box::intersection_with(const bounding_box& other) const noexcept {
    if (page_index_ != other.page_index_) {
        return std::nullopt;
    }

    const double left = std::max(left_x(), other.left_x());
    const double right = std::min(right_x(), other.right_x());
    const double bottom = std::max(bottom_y(), other.bottom_y());
    const double top = std::min(top_y(), other.top_y());

    if (right <= left || top <= bottom) {
        return std::nullopt;
    }
    return from_corners(page_index_, left, bottom, right, top);
}

bool bounding_box::contains(const bounding_box& other) const noexcept {
    return page_index_ == other.page_index_ &&
           other.left_x() >= left_x() && other.right_x() <= right_x() &&
           other.bottom_y() >= bottom_y() && other.top_y() <= top_y();
}

bool bounding_box::contains(const point& p) const noexcept {
    return p.x >= left_x() && p.x <= right_x() &&
           p.y >= bottom_y() && p.y <= top_y();
}

bool bounding_box::intersects(const bounding_box& other) const noexcept {
    return intersection_with(other).has_value();
}

double bounding_box::overlap_percentage(const bounding_box& other) const noexcept {
    auto overlap = intersection_with(other);
    if (!overlap) {
        return 0.0;
    }
    const double min_area = std::min(area(), other.area());
    if (min_area <= 0.0) {
        return 0.0;
    }
    return overlap->area() / min_area;
}

bounding_box bounding_box::inset_by(double dx, double dy) const noexcept {
    return bounding_box{page_index_, x_ - dx, y_ - dy, width_ + 2.0 * dx, height_ + 2.0 * dy};
}

std::string bounding_box::to_string() const {
    return compat::format("[page {}: ({:.2f}, {:.2f}) {:.2f}x{:.2f}]",
                          page_index_, x_, y_, width_, height_);
}

}  // namespace tagcheck::geometry
