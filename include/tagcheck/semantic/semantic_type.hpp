/**
 * @file semantic_type.hpp
 * @brief Closed set of structure roles of a tagged PDF
 *
 * The roles follow the standard structure types of ISO 32000-1 Section
 * 14.8.4. Every static fact about a role (heading level, block or inline,
 * presentational, alternative text requirement) is defined here and
 * nowhere else.
 *
 * @see ISO 32000-1 Section 14.8.4 - Standard Structure Types
 * @see ISO 14289-1 (PDF/UA-1) Section 7
 */

#ifndef TAGCHECK_SEMANTIC_SEMANTIC_TYPE_HPP
#define TAGCHECK_SEMANTIC_SEMANTIC_TYPE_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace tagcheck::semantic {

// =============================================================================
// Semantic Type
// =============================================================================

/**
 * @brief Structure role of a node
 */
enum class semantic_type {
    // Grouping elements
    document,             ///< Document
    part,                 ///< Part
    article,              ///< Art
    section,              ///< Sect
    div,                  ///< Div
    paragraph,            ///< P
    span,                 ///< Span
    block_quote,          ///< BlockQuote
    index,                ///< Index

    // Headings
    heading,              ///< H (level from the Level attribute)
    h1,                   ///< H1
    h2,                   ///< H2
    h3,                   ///< H3
    h4,                   ///< H4
    h5,                   ///< H5
    h6,                   ///< H6

    // Lists
    list,                 ///< L
    list_item,            ///< LI
    list_label,           ///< Lbl
    list_body,            ///< LBody

    // Tables
    table,                ///< Table
    table_row,            ///< TR
    table_header,         ///< TH
    table_cell,           ///< TD
    table_head,           ///< THead
    table_body,           ///< TBody
    table_foot,           ///< TFoot

    // Illustrations and special content
    figure,               ///< Figure
    caption,              ///< Caption
    formula,              ///< Formula
    form,                 ///< Form
    code,                 ///< Code
    title,                ///< Title

    // Inline elements
    link,                 ///< Link
    annotation,           ///< Annot
    reference,            ///< Reference
    note,                 ///< Note
    toc,                  ///< TOC
    toc_item,             ///< TOCI
    bibliography,         ///< BibEntry
    quote,                ///< Quote

    // Ruby and Warichu
    ruby,                 ///< Ruby
    ruby_base,            ///< RB
    ruby_text,            ///< RT
    ruby_punctuation,     ///< RP
    warichu,              ///< Warichu
    warichu_text,         ///< WT
    warichu_punctuation,  ///< WP

    // Presentational elements
    artifact,             ///< Artifact
    non_struct,           ///< NonStruct
    private_element,      ///< Private
    document_header,      ///< Header
    document_footer       ///< Footer
};

/// Number of roles in semantic_type
inline constexpr std::size_t semantic_type_count = 53;

/**
 * @brief Every role in declaration order
 */
inline constexpr std::array<semantic_type, semantic_type_count> all_semantic_types = {
    semantic_type::document, semantic_type::part, semantic_type::article,
    semantic_type::section, semantic_type::div, semantic_type::paragraph,
    semantic_type::span, semantic_type::block_quote, semantic_type::index,
    semantic_type::heading, semantic_type::h1, semantic_type::h2,
    semantic_type::h3, semantic_type::h4, semantic_type::h5, semantic_type::h6,
    semantic_type::list, semantic_type::list_item, semantic_type::list_label,
    semantic_type::list_body, semantic_type::table, semantic_type::table_row,
    semantic_type::table_header, semantic_type::table_cell, semantic_type::table_head,
    semantic_type::table_body, semantic_type::table_foot, semantic_type::figure,
    semantic_type::caption, semantic_type::formula, semantic_type::form,
    semantic_type::code, semantic_type::title, semantic_type::link,
    semantic_type::annotation, semantic_type::reference, semantic_type::note,
    semantic_type::toc, semantic_type::toc_item, semantic_type::bibliography,
    semantic_type::quote, semantic_type::ruby, semantic_type::ruby_base,
    semantic_type::ruby_text, semantic_type::ruby_punctuation, semantic_type::warichu,
    semantic_type::warichu_text, semantic_type::warichu_punctuation,
    semantic_type::artifact, semantic_type::non_struct, semantic_type::private_element,
    semantic_type::document_header, semantic_type::document_footer};

// =============================================================================
// Role Names
// =============================================================================

/**
 * @brief PDF structure type name of a role
 * @param type The role
 * @return Standard structure type name such as "P" or "TD"
 */
[[nodiscard]] constexpr std::string_view to_string(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::document: return "Document";
        case semantic_type::part: return "Part";
        case semantic_type::article: return "Art";
        case semantic_type::section: return "Sect";
        case semantic_type::div: return "Div";
        case semantic_type::paragraph: return "P";
        case semantic_type::span: return "Span";
        case semantic_type::block_quote: return "BlockQuote";
        case semantic_type::index: return "Index";
        case semantic_type::heading: return "H";
        case semantic_type::h1: return "H1";
        case semantic_type::h2: return "H2";
        case semantic_type::h3: return "H3";
        case semantic_type::h4: return "H4";
        case semantic_type::h5: return "H5";
        case semantic_type::h6: return "H6";
        case semantic_type::list: return "L";
        case semantic_type::list_item: return "LI";
        case semantic_type::list_label: return "Lbl";
        case semantic_type::list_body: return "LBody";
        case semantic_type::table: return "Table";
        case semantic_type::table_row: return "TR";
        case semantic_type::table_header: return "TH";
        case semantic_type::table_cell: return "TD";
        case semantic_type::table_head: return "THead";
        case semantic_type::table_body: return "TBody";
        case semantic_type::table_foot: return "TFoot";
        case semantic_type::figure: return "Figure";
        case semantic_type::caption: return "Caption";
        case semantic_type::formula: return "Formula";
        case semantic_type::form: return "Form";
        case semantic_type::code: return "Code";
        case semantic_type::title: return "Title";
        case semantic_type::link: return "Link";
        case semantic_type::annotation: return "Annot";
        case semantic_type::reference: return "Reference";
        case semantic_type::note: return "Note";
        case semantic_type::toc: return "TOC";
        case semantic_type::toc_item: return "TOCI";
        case semantic_type::bibliography: return "BibEntry";
        case semantic_type::quote: return "Quote";
        case semantic_type::ruby: return "Ruby";
        case semantic_type::ruby_base: return "RB";
        case semantic_type::ruby_text: return "RT";
        case semantic_type::ruby_punctuation: return "RP";
        case semantic_type::warichu: return "Warichu";
        case semantic_type::warichu_text: return "WT";
        case semantic_type::warichu_punctuation: return "WP";
        case semantic_type::artifact: return "Artifact";
        case semantic_type::non_struct: return "NonStruct";
        case semantic_type::private_element: return "Private";
        case semantic_type::document_header: return "Header";
        case semantic_type::document_footer: return "Footer";
        default: return "Unknown";
    }
}

/**
 * @brief Parse a structure type name
 *
 * Tries an exact match first, then a case-insensitive match, then the
 * aliases "header", "footer" and "nonstruct".
 *
 * @param name Structure type name as found in the tag tree
 * @return The role, or std::nullopt for non-standard names
 */
[[nodiscard]] std::optional<semantic_type> parse_semantic_type(std::string_view name);

// =============================================================================
// Static Role Facts
// =============================================================================

[[nodiscard]] constexpr bool is_heading(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::heading:
        case semantic_type::h1:
        case semantic_type::h2:
        case semantic_type::h3:
        case semantic_type::h4:
        case semantic_type::h5:
        case semantic_type::h6:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Level of a numbered heading role
 * @return 1-6 for H1-H6, std::nullopt otherwise (including generic H)
 */
[[nodiscard]] constexpr std::optional<int> heading_level(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::h1: return 1;
        case semantic_type::h2: return 2;
        case semantic_type::h3: return 3;
        case semantic_type::h4: return 4;
        case semantic_type::h5: return 5;
        case semantic_type::h6: return 6;
        default: return std::nullopt;
    }
}

/**
 * @brief Numbered heading role for a level
 * @return H1-H6 for levels 1-6, generic H otherwise
 */
[[nodiscard]] constexpr semantic_type heading_type_for_level(int level) noexcept {
    switch (level) {
        case 1: return semantic_type::h1;
        case 2: return semantic_type::h2;
        case 3: return semantic_type::h3;
        case 4: return semantic_type::h4;
        case 5: return semantic_type::h5;
        case 6: return semantic_type::h6;
        default: return semantic_type::heading;
    }
}

[[nodiscard]] constexpr bool is_list(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::list:
        case semantic_type::list_item:
        case semantic_type::list_label:
        case semantic_type::list_body:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr bool is_table(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::table:
        case semantic_type::table_row:
        case semantic_type::table_header:
        case semantic_type::table_cell:
        case semantic_type::table_head:
        case semantic_type::table_body:
        case semantic_type::table_foot:
            return true;
        default:
            return false;
    }
}

/// TH or TD
[[nodiscard]] constexpr bool is_table_cell(semantic_type type) noexcept {
    return type == semantic_type::table_header || type == semantic_type::table_cell;
}

/// THead, TBody or TFoot
[[nodiscard]] constexpr bool is_table_row_group(semantic_type type) noexcept {
    return type == semantic_type::table_head || type == semantic_type::table_body ||
           type == semantic_type::table_foot;
}

[[nodiscard]] constexpr bool is_block_level(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::document:
        case semantic_type::part:
        case semantic_type::article:
        case semantic_type::section:
        case semantic_type::div:
        case semantic_type::paragraph:
        case semantic_type::block_quote:
        case semantic_type::index:
        case semantic_type::heading:
        case semantic_type::h1:
        case semantic_type::h2:
        case semantic_type::h3:
        case semantic_type::h4:
        case semantic_type::h5:
        case semantic_type::h6:
        case semantic_type::list:
        case semantic_type::list_item:
        case semantic_type::list_body:
        case semantic_type::table:
        case semantic_type::table_row:
        case semantic_type::table_head:
        case semantic_type::table_body:
        case semantic_type::table_foot:
        case semantic_type::figure:
        case semantic_type::formula:
        case semantic_type::form:
        case semantic_type::code:
        case semantic_type::toc:
        case semantic_type::toc_item:
        case semantic_type::bibliography:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr bool is_inline(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::span:
        case semantic_type::link:
        case semantic_type::annotation:
        case semantic_type::reference:
        case semantic_type::note:
        case semantic_type::quote:
        case semantic_type::list_label:
        case semantic_type::table_header:
        case semantic_type::table_cell:
        case semantic_type::ruby:
        case semantic_type::ruby_base:
        case semantic_type::ruby_text:
        case semantic_type::ruby_punctuation:
        case semantic_type::warichu:
        case semantic_type::warichu_text:
        case semantic_type::warichu_punctuation:
            return true;
        default:
            return false;
    }
}

/// Content outside the logical structure (artifacts, running headers)
[[nodiscard]] constexpr bool is_presentational(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::artifact:
        case semantic_type::non_struct:
        case semantic_type::private_element:
        case semantic_type::document_header:
        case semantic_type::document_footer:
            return true;
        default:
            return false;
    }
}

/// Figure and Formula need Alt or ActualText (PDF/UA-1 7.3, 7.7)
[[nodiscard]] constexpr bool requires_alternative_text(semantic_type type) noexcept {
    return type == semantic_type::figure || type == semantic_type::formula;
}

[[nodiscard]] constexpr bool is_grouping(semantic_type type) noexcept {
    switch (type) {
        case semantic_type::document:
        case semantic_type::part:
        case semantic_type::article:
        case semantic_type::section:
        case semantic_type::div:
        case semantic_type::list:
        case semantic_type::list_item:
        case semantic_type::table:
        case semantic_type::table_row:
        case semantic_type::table_head:
        case semantic_type::table_body:
        case semantic_type::table_foot:
        case semantic_type::toc:
        case semantic_type::ruby:
        case semantic_type::warichu:
        case semantic_type::form:
            return true;
        default:
            return false;
    }
}

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_SEMANTIC_TYPE_HPP
