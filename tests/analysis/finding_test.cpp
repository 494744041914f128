/**
 * @file finding_test.cpp
 * @brief Unit tests for the shared finding record
 */

#include <tagcheck/analysis/finding.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace tagcheck::analysis;

namespace {

finding make_finding(std::optional<finding_severity> severity, std::string code = "sample") {
    return finding{std::move(code), finding_category::heading, severity, "h3", std::nullopt,
                   "Heading level skipped", 0, {}};
}

}  // namespace

TEST_CASE("blocking severities", "[analysis][finding]") {
    CHECK(is_blocking(finding_severity::critical));
    CHECK(is_blocking(finding_severity::error));
    CHECK_FALSE(is_blocking(finding_severity::warning));
    CHECK_FALSE(is_blocking(finding_severity::info));
}

TEST_CASE("severity and blocking counts", "[analysis][finding]") {
    std::vector<finding> findings{make_finding(finding_severity::warning),
                                  make_finding(finding_severity::warning),
                                  make_finding(std::nullopt)};

    CHECK(count_with_severity(findings, finding_severity::warning) == 2);
    CHECK(count_with_severity(findings, finding_severity::critical) == 0);
    CHECK_FALSE(has_blocking(findings));

    findings.push_back(make_finding(finding_severity::error));
    CHECK(has_blocking(findings));
    CHECK_FALSE(has_blocking({}));
}

TEST_CASE("finding rendering", "[analysis][finding]") {
    CHECK(to_string(make_finding(finding_severity::critical, "level_skipped")) ==
          "[critical] heading/level_skipped h3: Heading level skipped");
    CHECK(to_string(make_finding(std::nullopt, "level_skipped")) ==
          "[unrated] heading/level_skipped h3: Heading level skipped");
}

TEST_CASE("decimal formatting", "[analysis][finding]") {
    CHECK(format_decimal(112.0) == "112.00");
    CHECK(format_decimal(-350.0) == "-350.00");
    CHECK(format_decimal(0.14, 1) == "0.1");
    CHECK(format_decimal(11.000000000000002, 1) == "11.0");
    CHECK(format_decimal(3.0, 0) == "3");
}
