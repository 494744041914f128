/**
 * @file text_type.hpp
 * @brief WCAG text size classification
 */

#ifndef TAGCHECK_TEXT_TEXT_TYPE_HPP
#define TAGCHECK_TEXT_TEXT_TYPE_HPP

#include <string_view>

namespace tagcheck::text {

/**
 * @brief Text classification used for contrast requirements
 */
enum class text_type {
    regular,  ///< Below the large-text thresholds
    large,    ///< 18pt and above, or 14pt bold and above
    logo      ///< Logotype or incidental text, exempt from contrast rules
};

/// Point size at which text is always large
inline constexpr double large_text_min_size = 18.0;

/// Point size at which bold text is large
inline constexpr double large_bold_text_min_size = 14.0;

[[nodiscard]] constexpr const char* to_string(text_type type) noexcept {
    switch (type) {
        case text_type::regular: return "regular";
        case text_type::large: return "large";
        case text_type::logo: return "logo";
        default: return "unknown";
    }
}

/**
 * @brief Minimum contrast ratio for WCAG level AA (1.4.3)
 */
[[nodiscard]] constexpr double minimum_contrast_ratio_aa(text_type type) noexcept {
    switch (type) {
        case text_type::regular: return 4.5;
        case text_type::large: return 3.0;
        case text_type::logo: return 1.0;
        default: return 4.5;
    }
}

/**
 * @brief Minimum contrast ratio for WCAG level AAA (1.4.6)
 */
[[nodiscard]] constexpr double minimum_contrast_ratio_aaa(text_type type) noexcept {
    switch (type) {
        case text_type::regular: return 7.0;
        case text_type::large: return 4.5;
        case text_type::logo: return 1.0;
        default: return 7.0;
    }
}

}  // namespace tagcheck::text

#endif  // TAGCHECK_TEXT_TEXT_TYPE_HPP
