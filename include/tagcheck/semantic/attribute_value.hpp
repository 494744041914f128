/**
 * @file attribute_value.hpp
 * @brief Generic attribute value of a structure element
 *
 * Structure element attributes arrive from the ingestion stage as untyped
 * values. attribute_value keeps them in a closed variant and offers typed
 * optional accessors; analyzers read the reserved keys below.
 */

#ifndef TAGCHECK_SEMANTIC_ATTRIBUTE_VALUE_HPP
#define TAGCHECK_SEMANTIC_ATTRIBUTE_VALUE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tagcheck::semantic {

/**
 * @brief Reserved attribute keys
 */
namespace attribute_keys {
inline constexpr std::string_view alt = "Alt";
inline constexpr std::string_view actual_text = "ActualText";
inline constexpr std::string_view lang = "Lang";
inline constexpr std::string_view title = "Title";
inline constexpr std::string_view level = "Level";
inline constexpr std::string_view summary = "Summary";
inline constexpr std::string_view role_map = "RoleMap";
}  // namespace attribute_keys

/**
 * @brief Null, string, bool, integer, double or array
 */
class attribute_value {
public:
    using array_type = std::vector<attribute_value>;
    using storage_type =
        std::variant<std::monostate, std::string, bool, std::int64_t, double, array_type>;

    attribute_value() = default;
    attribute_value(std::string value) : value_(std::move(value)) {}
    attribute_value(const char* value) : value_(std::string{value}) {}
    attribute_value(bool value) : value_(value) {}
    attribute_value(int value) : value_(static_cast<std::int64_t>(value)) {}
    attribute_value(std::int64_t value) : value_(value) {}
    attribute_value(double value) : value_(value) {}
    attribute_value(array_type value) : value_(std::move(value)) {}

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    [[nodiscard]] std::optional<std::string> as_string() const;
    [[nodiscard]] std::optional<bool> as_bool() const noexcept;
    [[nodiscard]] std::optional<std::int64_t> as_int() const noexcept;
    [[nodiscard]] std::optional<double> as_double() const noexcept;
    [[nodiscard]] const array_type* as_array() const noexcept;

    /**
     * @brief Integer value, also accepting integral doubles and numeric strings
     */
    [[nodiscard]] std::optional<std::int64_t> to_integer() const;

    [[nodiscard]] const storage_type& storage() const noexcept { return value_; }

    bool operator==(const attribute_value& other) const { return value_ == other.value_; }

private:
    storage_type value_;
};

/// Attribute dictionary of a node, ordered by key
using attribute_map = std::map<std::string, attribute_value, std::less<>>;

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_ATTRIBUTE_VALUE_HPP
