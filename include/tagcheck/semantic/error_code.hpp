/**
 * @file error_code.hpp
 * @brief Numbered defect codes attached to structure nodes
 *
 * Codes are grouped in blocks of one hundred per category:
 *  - 1000-1099 general structure
 *  - 1100-1199 tables
 *  - 1200-1299 lists
 *  - 1300-1399 headings
 *  - 1400-1499 figures
 *  - 1500-1599 reading order
 */

#ifndef TAGCHECK_SEMANTIC_ERROR_CODE_HPP
#define TAGCHECK_SEMANTIC_ERROR_CODE_HPP

#include <string_view>

namespace tagcheck::semantic {

/**
 * @brief Defect code recorded against a node
 */
enum class semantic_error_code : int {
    // General structure
    missing_alt_text = 1000,
    empty_element = 1001,
    invalid_nesting = 1002,
    missing_required_child = 1003,
    unexpected_child = 1004,
    invalid_attribute = 1005,
    missing_attribute = 1006,
    duplicate_id = 1007,

    // Tables
    table_cell_below_next_row = 1100,
    table_cell_above_previous_row = 1101,
    table_cell_right_of_next_column = 1102,
    table_cell_left_of_previous_column = 1103,
    table_row_count_mismatch = 1104,
    table_column_count_mismatch = 1105,
    table_row_span_mismatch = 1106,
    table_col_span_mismatch = 1107,
    table_missing_headers = 1108,
    table_irregular_structure = 1109,
    table_empty_row = 1110,
    table_invalid_cell_type = 1111,
    table_mixed_cell_types = 1112,
    table_header_group_missing = 1113,

    // Lists
    list_item_missing_label = 1200,
    list_item_missing_body = 1201,
    list_inconsistent_labels = 1202,
    list_labels_out_of_sequence = 1203,
    list_nesting_too_deep = 1204,

    // Headings
    heading_level_skipped = 1300,
    multiple_h1_headings = 1301,
    empty_heading = 1302,
    heading_hierarchy_invalid = 1303,
    heading_missing_h1 = 1304,
    heading_first_not_h1 = 1305,
    heading_level_exceeds_maximum = 1306,
    heading_text_not_meaningful = 1307,

    // Figures
    figure_missing_alt_text = 1400,
    figure_caption_not_associated = 1401,
    decorative_figure_not_artifact = 1402,
    figure_insufficient_contrast = 1403,

    // Reading order
    reading_order_out_of_order = 1500,
    reading_order_reverse_direction = 1501,
    reading_order_overlapping = 1502,
    reading_order_column_jump = 1503
};

/**
 * @brief Numeric value of a code
 */
[[nodiscard]] constexpr int to_int(semantic_error_code code) noexcept {
    return static_cast<int>(code);
}

/**
 * @brief Stable machine-readable name of a code
 */
[[nodiscard]] constexpr std::string_view to_string(semantic_error_code code) noexcept {
    switch (code) {
        case semantic_error_code::missing_alt_text: return "missing_alt_text";
        case semantic_error_code::empty_element: return "empty_element";
        case semantic_error_code::invalid_nesting: return "invalid_nesting";
        case semantic_error_code::missing_required_child: return "missing_required_child";
        case semantic_error_code::unexpected_child: return "unexpected_child";
        case semantic_error_code::invalid_attribute: return "invalid_attribute";
        case semantic_error_code::missing_attribute: return "missing_attribute";
        case semantic_error_code::duplicate_id: return "duplicate_id";
        case semantic_error_code::table_cell_below_next_row: return "table_cell_below_next_row";
        case semantic_error_code::table_cell_above_previous_row:
            return "table_cell_above_previous_row";
        case semantic_error_code::table_cell_right_of_next_column:
            return "table_cell_right_of_next_column";
        case semantic_error_code::table_cell_left_of_previous_column:
            return "table_cell_left_of_previous_column";
        case semantic_error_code::table_row_count_mismatch: return "table_row_count_mismatch";
        case semantic_error_code::table_column_count_mismatch:
            return "table_column_count_mismatch";
        case semantic_error_code::table_row_span_mismatch: return "table_row_span_mismatch";
        case semantic_error_code::table_col_span_mismatch: return "table_col_span_mismatch";
        case semantic_error_code::table_missing_headers: return "table_missing_headers";
        case semantic_error_code::table_irregular_structure: return "table_irregular_structure";
        case semantic_error_code::table_empty_row: return "table_empty_row";
        case semantic_error_code::table_invalid_cell_type: return "table_invalid_cell_type";
        case semantic_error_code::table_mixed_cell_types: return "table_mixed_cell_types";
        case semantic_error_code::table_header_group_missing: return "table_header_group_missing";
        case semantic_error_code::list_item_missing_label: return "list_item_missing_label";
        case semantic_error_code::list_item_missing_body: return "list_item_missing_body";
        case semantic_error_code::list_inconsistent_labels: return "list_inconsistent_labels";
        case semantic_error_code::list_labels_out_of_sequence:
            return "list_labels_out_of_sequence";
        case semantic_error_code::list_nesting_too_deep: return "list_nesting_too_deep";
        case semantic_error_code::heading_level_skipped: return "heading_level_skipped";
        case semantic_error_code::multiple_h1_headings: return "multiple_h1_headings";
        case semantic_error_code::empty_heading: return "empty_heading";
        case semantic_error_code::heading_hierarchy_invalid: return "heading_hierarchy_invalid";
        case semantic_error_code::heading_missing_h1: return "heading_missing_h1";
        case semantic_error_code::heading_first_not_h1: return "heading_first_not_h1";
        case semantic_error_code::heading_level_exceeds_maximum:
            return "heading_level_exceeds_maximum";
        case semantic_error_code::heading_text_not_meaningful:
            return "heading_text_not_meaningful";
        case semantic_error_code::figure_missing_alt_text: return "figure_missing_alt_text";
        case semantic_error_code::figure_caption_not_associated:
            return "figure_caption_not_associated";
        case semantic_error_code::decorative_figure_not_artifact:
            return "decorative_figure_not_artifact";
        case semantic_error_code::figure_insufficient_contrast:
            return "figure_insufficient_contrast";
        case semantic_error_code::reading_order_out_of_order: return "reading_order_out_of_order";
        case semantic_error_code::reading_order_reverse_direction:
            return "reading_order_reverse_direction";
        case semantic_error_code::reading_order_overlapping: return "reading_order_overlapping";
        case semantic_error_code::reading_order_column_jump: return "reading_order_column_jump";
        default: return "unknown";
    }
}

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_ERROR_CODE_HPP
