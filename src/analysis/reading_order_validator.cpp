/**
 * @file reading_order_validator.cpp
 * @brief Implementation of the reading order validator
 */

#include "tagcheck/analysis/reading_order_validator.hpp"

#include "tagcheck/compat/format.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>

namespace tagcheck::analysis {

using semantic::semantic_error_code;
using semantic::semantic_node;

namespace {

/// Share of the shorter box height two boxes must overlap to share a line
constexpr double same_line_ratio = 0.5;

semantic_error_code error_code_for(reading_order_issue_type type) noexcept {
    switch (type) {
        case reading_order_issue_type::out_of_order:
            return semantic_error_code::reading_order_out_of_order;
        case reading_order_issue_type::reverse_direction:
            return semantic_error_code::reading_order_reverse_direction;
        case reading_order_issue_type::overlapping:
            return semantic_error_code::reading_order_overlapping;
        case reading_order_issue_type::column_jump:
        default:
            return semantic_error_code::reading_order_column_jump;
    }
}

}  // namespace

// =============================================================================
// Options and Result
// =============================================================================

reading_order_options reading_order_options::strict() {
    reading_order_options opts;
    opts.vertical_tolerance = 2.0;
    opts.horizontal_tolerance = 5.0;
    opts.overlap_threshold = 0.05;
    return opts;
}

reading_order_options reading_order_options::right_to_left() {
    reading_order_options opts;
    opts.direction = reading_direction::right_to_left;
    return opts;
}

std::size_t reading_order_result::critical_issue_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(issues.begin(), issues.end(), [](const reading_order_issue& i) {
            return i.severity == finding_severity::critical;
        }));
}

std::size_t reading_order_result::warning_issue_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(issues.begin(), issues.end(), [](const reading_order_issue& i) {
            return i.severity == finding_severity::warning;
        }));
}

std::vector<reading_order_issue> reading_order_result::issues_on_page(int page_index) const {
    std::vector<reading_order_issue> matching;
    std::copy_if(issues.begin(), issues.end(), std::back_inserter(matching),
                 [page_index](const reading_order_issue& i) { return i.page_index == page_index; });
    return matching;
}

std::vector<finding> to_findings(const reading_order_result& result) {
    std::vector<finding> findings;
    findings.reserve(result.issues.size());
    for (const auto& i : result.issues) {
        findings.push_back(finding{to_string(i.type), finding_category::reading_order,
                                   i.severity, i.node_id1, i.node_id2, i.message, i.page_index,
                                   i.context});
    }
    return findings;
}

// =============================================================================
// Column Detection
// =============================================================================

std::vector<double> detect_columns(std::vector<double> left_edges, double gap) {
    std::sort(left_edges.begin(), left_edges.end());

    std::vector<double> columns;
    std::optional<double> last;
    for (double x : left_edges) {
        if (!last || x - *last > gap) {
            columns.push_back(x);
        }
        last = x;
    }
    return columns;
}

std::optional<std::size_t> find_column(double x, const std::vector<double>& columns, double gap) {
    if (columns.empty()) {
        return std::nullopt;
    }

    std::optional<std::size_t> nearest;
    double nearest_distance = gap;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        const double distance = std::abs(x - columns[i]);
        if (distance < nearest_distance) {
            nearest = i;
            nearest_distance = distance;
        }
    }
    if (nearest) {
        return nearest;
    }

    auto after = std::upper_bound(columns.begin(), columns.end(), x);
    if (after == columns.begin()) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(columns.begin(), after) - 1);
}

// =============================================================================
// Validator
// =============================================================================

reading_order_validator::reading_order_validator(const reading_order_options& options)
    : options_(options) {}

const reading_order_options& reading_order_validator::options() const noexcept {
    return options_;
}

void reading_order_validator::set_options(const reading_order_options& options) {
    options_ = options;
}

reading_order_result reading_order_validator::validate(const semantic_node& root,
                                                       semantic::error_code_table* codes) const {
    std::map<int, std::vector<placed_node>> nodes_by_page;
    for (const auto* node : root.all_descendants()) {
        if (const auto& box = node->box()) {
            nodes_by_page[box->page_index()].push_back(placed_node{node, *box});
        }
    }

    reading_order_result result;
    result.page_count = nodes_by_page.size();
    for (const auto& [page, nodes] : nodes_by_page) {
        validate_page(nodes, page, result.issues);
        result.total_node_count += nodes.size();
    }

    for (const auto& issue : result.issues) {
        semantic::annotate(codes, issue.node_id1, error_code_for(issue.type));
    }
    return result;
}

void reading_order_validator::validate_page(const std::vector<placed_node>& nodes,
                                            int page_index, issue_list& issues) const {
    if (nodes.size() < 2) {
        return;
    }

    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        check_spatial_order(nodes[i], nodes[i + 1], page_index, issues);
        if (options_.check_overlaps) {
            check_overlap(nodes[i], nodes[i + 1], page_index, issues);
        }
    }

    if (options_.validate_columns) {
        check_columns(nodes, page_index, issues);
    }
}

void reading_order_validator::check_spatial_order(const placed_node& current,
                                                  const placed_node& next, int page_index,
                                                  issue_list& issues) const {
    const auto& cur = current.box;
    const auto& nxt = next.box;

    const double vertical_gap = nxt.top_y() - cur.bottom_y();
    if (vertical_gap > options_.vertical_tolerance) {
        issues.push_back(reading_order_issue{
            reading_order_issue_type::out_of_order, finding_severity::critical,
            current.node->id(), next.node->id(), "Content appears out of vertical order",
            page_index,
            {{"vertical_gap", format_decimal(vertical_gap)},
             {"current_bottom", format_decimal(cur.bottom_y())},
             {"next_top", format_decimal(nxt.top_y())}}});
        return;
    }

    const double same_line_threshold = std::min(cur.height(), nxt.height()) * same_line_ratio;
    const double vertical_overlap =
        std::min(cur.top_y(), nxt.top_y()) - std::max(cur.bottom_y(), nxt.bottom_y());
    if (vertical_overlap <= same_line_threshold) {
        return;
    }

    const double horizontal_distance = options_.direction == reading_direction::left_to_right
                                           ? nxt.left_x() - cur.right_x()
                                           : cur.left_x() - nxt.right_x();
    if (horizontal_distance < -options_.horizontal_tolerance) {
        issues.push_back(reading_order_issue{
            reading_order_issue_type::reverse_direction, finding_severity::warning,
            current.node->id(), next.node->id(), "Content appears in reverse reading direction",
            page_index,
            {{"horizontal_distance", format_decimal(horizontal_distance)},
             {"reading_direction", to_string(options_.direction)}}});
    }
}

void reading_order_validator::check_overlap(const placed_node& current, const placed_node& next,
                                            int page_index, issue_list& issues) const {
    const double overlap = current.box.overlap_percentage(next.box);
    if (overlap > options_.overlap_threshold) {
        issues.push_back(reading_order_issue{
            reading_order_issue_type::overlapping, finding_severity::warning, current.node->id(),
            next.node->id(), "Content overlaps in reading sequence", page_index,
            {{"overlap_percentage", format_decimal(overlap * 100.0, 1) + "%"}}});
    }
}

void reading_order_validator::check_columns(const std::vector<placed_node>& nodes,
                                            int page_index, issue_list& issues) const {
    if (nodes.size() < 3) {
        return;
    }

    std::vector<double> left_edges;
    left_edges.reserve(nodes.size());
    for (const auto& n : nodes) {
        left_edges.push_back(n.box.left_x());
    }

    const auto columns = detect_columns(std::move(left_edges), options_.column_gap);
    if (columns.size() < 2) {
        return;
    }

    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        auto current_column = find_column(nodes[i].box.left_x(), columns, options_.column_gap);
        auto next_column = find_column(nodes[i + 1].box.left_x(), columns, options_.column_gap);
        if (!current_column || !next_column || *next_column >= *current_column) {
            continue;
        }
        issues.push_back(reading_order_issue{
            reading_order_issue_type::column_jump, finding_severity::warning,
            nodes[i].node->id(), nodes[i + 1].node->id(),
            "Reading order jumps backward across columns", page_index,
            {{"from_column", std::to_string(*current_column)},
             {"to_column", std::to_string(*next_column)}}});
    }
}

}  // namespace tagcheck::analysis
