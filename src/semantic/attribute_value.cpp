/**
 * @file attribute_value.cpp
 * @brief Typed accessors of attribute_value
 */

#include "tagcheck/semantic/attribute_value.hpp"

#include <charconv>
#include <cmath>

namespace tagcheck::semantic {

std::optional<std::string> attribute_value::as_string() const {
    if (const auto* s = std::get_if<std::string>(&value_)) {
        return *s;
    }
    return std::nullopt;
}

std::optional<bool> attribute_value::as_bool() const noexcept {
    if (const auto* b = std::get_if<bool>(&value_)) {
        return *b;
    }
    return std::nullopt;
}

std::optional<std::int64_t> attribute_value::as_int() const noexcept {
    if (const auto* i = std::get_if<std::int64_t>(&value_)) {
        return *i;
    }
    return std::nullopt;
}

std::optional<double> attribute_value::as_double() const noexcept {
    if (const auto* d = std::get_if<double>(&value_)) {
        return *d;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value_)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

const attribute_value::array_type* attribute_value::as_array() const noexcept {
    return std::get_if<array_type>(&value_);
}

std::optional<std::int64_t> attribute_value::to_integer() const {
    if (auto i = as_int()) {
        return i;
    }
    if (const auto* d = std::get_if<double>(&value_)) {
        // [-2^63, 2^63) is exactly the range that converts without overflow
        constexpr double lower = -9223372036854775808.0;
        constexpr double upper = 9223372036854775808.0;
        if (std::isfinite(*d) && std::trunc(*d) == *d && *d >= lower && *d < upper) {
            return static_cast<std::int64_t>(*d);
        }
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&value_)) {
        std::int64_t parsed = 0;
        const char* first = s->data();
        const char* last = s->data() + s->size();
        auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec == std::errc{} && ptr == last && first != last) {
            return parsed;
        }
    }
    return std::nullopt;
}

}  // namespace tagcheck::semantic
