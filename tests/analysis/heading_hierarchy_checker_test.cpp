/**
 * @file heading_hierarchy_checker_test.cpp
 * @brief Unit tests for heading_hierarchy_checker
 */

#include <tagcheck/analysis/heading_hierarchy_checker.hpp>
#include <tagcheck/semantic/node_tree.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace tagcheck::analysis;
using namespace tagcheck::semantic;

namespace {

node_fields fields(std::string id, node_list children = {}) {
    node_fields f;
    f.id = std::move(id);
    f.children = std::move(children);
    return f;
}

/// Document with one heading per level, named h0, h1, ...
node_ptr document_with_levels(const std::vector<int>& levels) {
    node_list children;
    for (std::size_t i = 0; i < levels.size(); ++i) {
        children.push_back(make_heading(levels[i], fields("h" + std::to_string(i)),
                                        "Quarterly results part " + std::to_string(i)));
    }
    return make_document(fields("doc", std::move(children)));
}

}  // namespace

TEST_CASE("well-ordered headings are valid", "[analysis][heading]") {
    auto root = document_with_levels({1, 2, 3, 2, 3, 3});
    auto result = heading_hierarchy_checker{}.validate(*root);

    CHECK(result.is_valid());
    CHECK(result.total_heading_count == 6);
    CHECK(result.has_single_h1());
    CHECK(result.max_heading_level() == 3);
    CHECK(result.headings_by_level.at(3) == 3);
}

TEST_CASE("a skipped level is reported once", "[analysis][heading]") {
    auto root = document_with_levels({1, 2, 4});

    error_code_table codes;
    auto result = heading_hierarchy_checker{}.validate(*root, &codes);

    REQUIRE(result.issues.size() == 1);
    const auto& issue = result.issues.front();
    CHECK(issue.type == heading_issue_type::level_skipped);
    CHECK(issue.severity == finding_severity::critical);
    CHECK(issue.node_id == "h2");
    CHECK(issue.heading_level == 4);
    CHECK(issue.message == "Heading level skipped from H2 to H4");
    CHECK(issue.context.at("previous_level") == "2");
    CHECK(issue.context.at("current_level") == "4");
    CHECK(issue.context.at("skipped_levels") == "1");
    CHECK(codes.contains("h2", semantic_error_code::heading_level_skipped));
}

TEST_CASE("returning to a higher level is allowed but two H1 are not", "[analysis][heading]") {
    auto root = document_with_levels({1, 2, 1, 3});
    auto result = heading_hierarchy_checker{}.validate(*root);

    auto multiple = result.issues_of_type(heading_issue_type::multiple_h1);
    REQUIRE(multiple.size() == 2);
    CHECK(multiple[0].node_id == "h0");
    CHECK(multiple[1].node_id == "h2");
    CHECK(multiple[0].context.at("h1_count") == "2");

    auto skipped = result.issues_of_type(heading_issue_type::level_skipped);
    REQUIRE(skipped.size() == 1);
    CHECK(skipped.front().node_id == "h3");
    CHECK(skipped.front().context.at("skipped_levels") == "1");

    CHECK_FALSE(result.has_single_h1());
    CHECK(result.critical_issue_count() == 3);
}

TEST_CASE("missing H1 and wrong first heading", "[analysis][heading]") {
    auto root = document_with_levels({2, 3});

    SECTION("all checks") {
        auto result = heading_hierarchy_checker{}.validate(*root);

        REQUIRE(result.issues.size() == 2);
        CHECK(result.issues[0].type == heading_issue_type::no_h1);
        CHECK(result.issues[0].severity == finding_severity::critical);
        CHECK(result.issues[1].type == heading_issue_type::first_heading_not_h1);
        CHECK(result.issues[1].severity == finding_severity::warning);
        CHECK(result.issues[1].context.at("actual_level") == "2");
    }

    SECTION("basic preset skips document-level rules") {
        auto result = heading_hierarchy_checker{heading_validation_options::basic()}.validate(*root);
        CHECK(result.is_valid());
    }
}

TEST_CASE("a document without headings has no issues", "[analysis][heading]") {
    auto root = make_document(fields("doc", {make_paragraph(fields("p"), "Body")}));
    auto result = heading_hierarchy_checker{}.validate(*root);

    CHECK(result.is_valid());
    CHECK(result.total_heading_count == 0);
    CHECK(result.max_heading_level() == 0);
}

TEST_CASE("empty heading is critical and also not meaningful", "[analysis][heading]") {
    auto root = make_document(fields(
        "doc", {make_heading(1, fields("title"), "Report"), make_heading(2, fields("empty"))}));
    auto result = heading_hierarchy_checker{}.validate(*root);

    auto empty = result.issues_of_type(heading_issue_type::empty_heading);
    REQUIRE(empty.size() == 1);
    CHECK(empty.front().node_id == "empty");
    CHECK(empty.front().severity == finding_severity::critical);

    auto text = result.issues_of_type(heading_issue_type::non_meaningful_text);
    REQUIRE(text.size() == 1);
    CHECK(text.front().node_id == "empty");
    CHECK(text.front().context.at("text_length") == "0");
    CHECK(text.front().context.at("min_length") == "1");
}

TEST_CASE("generic heading text", "[analysis][heading]") {
    CHECK(is_generic_heading_text("Untitled"));
    CHECK(is_generic_heading_text("CLICK HERE"));
    CHECK_FALSE(is_generic_heading_text("Untitled draft"));

    auto root = make_document(fields(
        "doc", {make_heading(1, fields("generic"), "  Heading  "), make_heading(2, fields("ok"), "Scope")}));
    auto result = heading_hierarchy_checker{}.validate(*root);

    REQUIRE(result.issues.size() == 1);
    CHECK(result.issues.front().type == heading_issue_type::non_meaningful_text);
    CHECK(result.issues.front().severity == finding_severity::warning);
    CHECK(result.issues.front().context.at("heading_text") == "Heading");
}

TEST_CASE("alternative text counts as heading text", "[analysis][heading]") {
    auto f = fields("alt");
    f.attributes = {{"Alt", "Executive summary"}};
    auto root = make_document(fields("doc", {make_heading(1, std::move(f))}));

    CHECK(heading_hierarchy_checker{}.validate(*root).is_valid());
}

TEST_CASE("heading text length counts characters, not bytes", "[analysis][heading]") {
    // "日本" is two characters in six bytes, "東京都" three in nine
    auto root = make_document(fields(
        "doc", {make_heading(1, fields("short"), "\xE6\x97\xA5\xE6\x9C\xAC"),
                make_heading(2, fields("long"), "\xE6\x9D\xB1\xE4\xBA\xAC\xE9\x83\xBD")}));

    heading_validation_options options;
    options.min_heading_text_length = 3;
    auto result = heading_hierarchy_checker{options}.validate(*root);

    auto text = result.issues_of_type(heading_issue_type::non_meaningful_text);
    REQUIRE(text.size() == 1);
    CHECK(text.front().node_id == "short");
    CHECK(text.front().context.at("text_length") == "2");
    CHECK(text.front().context.at("min_length") == "3");
}

TEST_CASE("generic H takes its level from the Level attribute", "[analysis][heading]") {
    auto with_level = fields("generic");
    with_level.attributes = {{"Level", 3}};
    auto with_string_level = fields("string-level");
    with_string_level.attributes = {{"Level", "2"}};

    auto generic = make_text_node(semantic_type::heading, std::move(with_level), "Details");
    auto string_level = make_text_node(semantic_type::heading, std::move(with_string_level), "More");
    auto plain = make_text_node(semantic_type::heading, fields("plain"), "Top");

    CHECK(resolve_heading_level(*generic) == 3);
    CHECK(resolve_heading_level(*string_level) == 2);
    CHECK(resolve_heading_level(*plain) == 1);
    CHECK_FALSE(resolve_heading_level(*make_paragraph(fields("p"), "x")).has_value());
}

TEST_CASE("Level attribute outside the int range falls back to 1", "[analysis][heading]") {
    auto generic = [](std::string id, attribute_value level) {
        auto f = fields(std::move(id));
        f.attributes = {{"Level", std::move(level)}};
        return make_text_node(semantic_type::heading, std::move(f), "Details");
    };

    CHECK(resolve_heading_level(*generic("wide", std::int64_t{4294967298})) == 1);
    CHECK(resolve_heading_level(*generic("huge", 1e30)) == 1);
    CHECK(resolve_heading_level(*generic("zero", 0)) == 1);
    CHECK(resolve_heading_level(*generic("negative", -2)) == 1);
    CHECK(resolve_heading_level(*generic("max", std::int64_t{2147483647})) == 2147483647);

    // A wrapped Level would have made this an H2 following the H1
    auto root = make_document(fields(
        "doc", {make_heading(1, fields("h1"), "Annual report"),
                generic("g", std::int64_t{4294967298})}));
    auto result = heading_hierarchy_checker{}.validate(*root);
    CHECK(result.headings_by_level.at(1) == 2);
    CHECK(result.headings_by_level.count(2) == 0);
}

TEST_CASE("heading level above the maximum", "[analysis][heading]") {
    auto root = document_with_levels({1, 2, 3, 4, 5});

    heading_validation_options options;
    options.max_heading_level = 4;
    auto result = heading_hierarchy_checker{options}.validate(*root);

    REQUIRE(result.issues.size() == 1);
    CHECK(result.issues.front().type == heading_issue_type::level_exceeds_maximum);
    CHECK(result.issues.front().node_id == "h4");
    CHECK(result.issues.front().context.at("max_level") == "4");
}

TEST_CASE("heading findings", "[analysis][heading]") {
    auto findings = to_findings(heading_hierarchy_checker{}.validate(*document_with_levels({1, 3})));

    REQUIRE(findings.size() == 1);
    CHECK(findings.front().code == "level_skipped");
    CHECK(findings.front().category == finding_category::heading);
    CHECK(findings.front().severity == finding_severity::critical);
    CHECK(has_blocking(findings));
}
