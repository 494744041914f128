/**
 * @file line_chunk.cpp
 * @brief Implementation of stroked line segment queries
 */

#include "tagcheck/geometry/line_chunk.hpp"

#include <algorithm>
#include <cmath>

namespace tagcheck::geometry {

namespace {

constexpr double min_axis_tolerance = 0.5;
constexpr double relative_axis_tolerance = 0.01;

double point_distance(const point& a, const point& b) noexcept {
    return std::hypot(a.x - b.x, a.y - b.y);
}

}  // namespace

line_chunk::line_chunk(int page_index, point start, point end, double line_width,
                       stroke_color color)
    : start_(start), end_(end), line_width_(line_width), color_(color) {
    const double half = line_width / 2.0;
    box_ = bounding_box::from_corners(page_index,
                                      std::min(start.x, end.x) - half,
                                      std::min(start.y, end.y) - half,
                                      std::max(start.x, end.x) + half,
                                      std::max(start.y, end.y) + half);
}

line_chunk::line_chunk(bounding_box box, point start, point end, double line_width,
                       stroke_color color)
    : box_(box), start_(start), end_(end), line_width_(line_width), color_(color) {}

double line_chunk::length() const noexcept {
    return point_distance(start_, end_);
}

bool line_chunk::is_horizontal() const noexcept {
    const double len = length();
    if (len <= 0.0) {
        return true;
    }
    return std::abs(end_.y - start_.y) <=
           std::max(len * relative_axis_tolerance, min_axis_tolerance);
}

bool line_chunk::is_vertical() const noexcept {
    const double len = length();
    if (len <= 0.0) {
        return true;
    }
    return std::abs(end_.x - start_.x) <=
           std::max(len * relative_axis_tolerance, min_axis_tolerance);
}

bool line_chunk::is_axis_aligned() const noexcept {
    return is_horizontal() || is_vertical();
}

double line_chunk::angle() const noexcept {
    return std::atan2(end_.y - start_.y, end_.x - start_.x);
}

point line_chunk::midpoint() const noexcept {
    return point{(start_.x + end_.x) / 2.0, (start_.y + end_.y) / 2.0};
}

double line_chunk::distance_to(const point& p) const noexcept {
    const double dx = end_.x - start_.x;
    const double dy = end_.y - start_.y;
    const double length_squared = dx * dx + dy * dy;

    if (length_squared <= 0.0) {
        return point_distance(p, start_);
    }

    double t = ((p.x - start_.x) * dx + (p.y - start_.y) * dy) / length_squared;
    t = std::clamp(t, 0.0, 1.0);

    return point_distance(p, point{start_.x + t * dx, start_.y + t * dy});
}

double line_chunk::perpendicular_distance_to(const point& p) const noexcept {
    const double dx = end_.x - start_.x;
    const double dy = end_.y - start_.y;
    const double length_squared = dx * dx + dy * dy;

    if (length_squared <= 0.0) {
        return point_distance(p, start_);
    }

    const double cross = std::abs((p.x - start_.x) * dy - (p.y - start_.y) * dx);
    return cross / std::sqrt(length_squared);
}

bool line_chunk::is_collinear_with(const line_chunk& other, double tolerance) const noexcept {
    if (page_index() != other.page_index()) {
        return false;
    }
    return other.perpendicular_distance_to(start_) <= tolerance &&
           other.perpendicular_distance_to(end_) <= tolerance &&
           perpendicular_distance_to(other.start_) <= tolerance &&
           perpendicular_distance_to(other.end_) <= tolerance;
}

}  // namespace tagcheck::geometry
