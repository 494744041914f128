/**
 * @file semantic_type_test.cpp
 * @brief Unit tests for semantic roles, error codes and attribute values
 */

#include <tagcheck/semantic/attribute_value.hpp>
#include <tagcheck/semantic/error_code.hpp>
#include <tagcheck/semantic/semantic_type.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <set>
#include <string>

using namespace tagcheck::semantic;

// =============================================================================
// semantic_type
// =============================================================================

TEST_CASE("semantic_type names are unique and parse back", "[semantic][semantic_type]") {
    std::set<std::string_view> names;
    for (auto type : all_semantic_types) {
        auto name = to_string(type);
        CHECK(names.insert(name).second);

        auto parsed = parse_semantic_type(name);
        REQUIRE(parsed.has_value());
        CHECK(*parsed == type);
    }
    CHECK(names.size() == semantic_type_count);
}

TEST_CASE("parse_semantic_type is case-insensitive with aliases", "[semantic][semantic_type]") {
    CHECK(parse_semantic_type("p") == semantic_type::paragraph);
    CHECK(parse_semantic_type("TBODY") == semantic_type::table_body);
    CHECK(parse_semantic_type("nonstruct") == semantic_type::non_struct);
    CHECK_FALSE(parse_semantic_type("Paragraph2").has_value());
    CHECK_FALSE(parse_semantic_type("").has_value());
}

TEST_CASE("heading roles and levels", "[semantic][semantic_type]") {
    CHECK(is_heading(semantic_type::heading));
    CHECK(is_heading(semantic_type::h4));
    CHECK_FALSE(is_heading(semantic_type::paragraph));

    CHECK(heading_level(semantic_type::h3) == 3);
    CHECK_FALSE(heading_level(semantic_type::heading).has_value());

    for (int level = 1; level <= 6; ++level) {
        CHECK(heading_level(heading_type_for_level(level)) == level);
    }
    CHECK(heading_type_for_level(0) == semantic_type::heading);
    CHECK(heading_type_for_level(7) == semantic_type::heading);
}

TEST_CASE("role families", "[semantic][semantic_type]") {
    CHECK(is_table_cell(semantic_type::table_header));
    CHECK(is_table_cell(semantic_type::table_cell));
    CHECK_FALSE(is_table_cell(semantic_type::table_row));

    CHECK(is_table_row_group(semantic_type::table_foot));
    CHECK_FALSE(is_table_row_group(semantic_type::table));

    CHECK(is_list(semantic_type::list_body));
    CHECK(is_table(semantic_type::table_head));
    CHECK(is_presentational(semantic_type::artifact));
    CHECK(requires_alternative_text(semantic_type::formula));
    CHECK_FALSE(requires_alternative_text(semantic_type::paragraph));
}

TEST_CASE("block and inline roles do not overlap", "[semantic][semantic_type]") {
    for (auto type : all_semantic_types) {
        CAPTURE(to_string(type));
        CHECK_FALSE((is_block_level(type) && is_inline(type)));
    }
}

// =============================================================================
// semantic_error_code
// =============================================================================

TEST_CASE("semantic_error_code names", "[semantic][error_code]") {
    CHECK(to_string(semantic_error_code::duplicate_id) == "duplicate_id");
    CHECK(to_string(semantic_error_code::empty_element) == "empty_element");
    CHECK(to_string(semantic_error_code::table_missing_headers) == "table_missing_headers");
}

// =============================================================================
// attribute_value
// =============================================================================

TEST_CASE("attribute_value accessors", "[semantic][attribute_value]") {
    attribute_value text{"hello"};
    attribute_value flag{true};
    attribute_value number{3};
    attribute_value real{2.5};
    attribute_value none;

    CHECK(text.as_string() == "hello");
    CHECK_FALSE(text.as_int().has_value());
    CHECK(flag.as_bool() == true);
    CHECK(number.as_int() == 3);
    CHECK(real.as_double() == 2.5);
    CHECK(none.is_null());
    CHECK(none.as_array() == nullptr);
}

TEST_CASE("attribute_value to_integer coerces numeric forms", "[semantic][attribute_value]") {
    CHECK(attribute_value{4}.to_integer() == 4);
    CHECK(attribute_value{3.0}.to_integer() == 3);
    CHECK(attribute_value{"2"}.to_integer() == 2);
    CHECK_FALSE(attribute_value{"two"}.to_integer().has_value());
    CHECK_FALSE(attribute_value{}.to_integer().has_value());
}

TEST_CASE("attribute_value to_integer rejects doubles outside int64", "[semantic][attribute_value]") {
    CHECK_FALSE(attribute_value{1e30}.to_integer().has_value());
    CHECK_FALSE(attribute_value{-1e30}.to_integer().has_value());
    CHECK_FALSE(attribute_value{9223372036854775808.0}.to_integer().has_value());
    CHECK(attribute_value{-9223372036854775808.0}.to_integer() ==
          std::numeric_limits<std::int64_t>::min());
    CHECK(attribute_value{std::int64_t{4294967297}}.to_integer() == 4294967297);
    CHECK_FALSE(attribute_value{2.5}.to_integer().has_value());
}
