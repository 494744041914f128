/**
 * @file semantic_type.cpp
 * @brief Structure type name parsing
 */

#include "tagcheck/semantic/semantic_type.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace tagcheck::semantic {

namespace {

std::string to_lower(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

std::optional<semantic_type> parse_semantic_type(std::string_view name) {
    for (auto type : all_semantic_types) {
        if (to_string(type) == name) {
            return type;
        }
    }

    const auto lowered = to_lower(name);
    for (auto type : all_semantic_types) {
        if (to_lower(to_string(type)) == lowered) {
            return type;
        }
    }

    if (lowered == "header") return semantic_type::document_header;
    if (lowered == "footer") return semantic_type::document_footer;
    if (lowered == "nonstruct") return semantic_type::non_struct;
    return std::nullopt;
}

}  // namespace tagcheck::semantic
