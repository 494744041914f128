/**
 * @file config_loader_test.cpp
 * @brief Unit tests for config_loader
 */

#include <tagcheck/config/config_loader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace tagcheck;
using namespace tagcheck::config;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief RAII temporary YAML file
 */
class temp_config_file {
public:
    explicit temp_config_file(const std::string& content)
        : path_(std::filesystem::temp_directory_path() / "tagcheck_config_test.yaml") {
        std::ofstream file(path_);
        file << content;
    }

    ~temp_config_file() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    temp_config_file(const temp_config_file&) = delete;
    temp_config_file& operator=(const temp_config_file&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

constexpr const char* full_config = R"(
# Validation engine settings
analysis:
  parallel: yes
  analyzers:
    - structure
    - headings

structure:
  max_depth: 12
  check_duplicate_ids: false

headings:
  max_heading_level: 4
  min_heading_text_length: 3

reading_order:
  preset: strict
  vertical_tolerance: 7.5
  direction: rtl

tables:
  validate_visual_match: off

logging:
  directory: "/tmp/tagcheck logs"
  level: debug
  console: false
  file: true
  max_files: 3

threads:
  worker_count: 3
  pool_name: "tagcheck #1"  # shared pool
)";

}  // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST_CASE("default configuration", "[config]") {
    auto config = config_loader::create_default();

    CHECK(config.analysis.runner.run_structure);
    CHECK(config.analysis.runner.run_tables);
    CHECK_FALSE(config.analysis.runner.parallel);
    CHECK(config.analysis.reading_order.vertical_tolerance == 5.0);
    CHECK(config.analysis.headings.max_heading_level == 6);
    CHECK(config.logging.min_level == integration::log_level::info);
    CHECK(config_loader::validate(config).is_ok());
}

TEST_CASE("empty document yields the defaults", "[config]") {
    auto result = config_loader::load_from_string("");
    REQUIRE(result.is_ok());

    auto defaults = config_loader::create_default();
    CHECK(result.value().analysis.reading_order.column_gap ==
          defaults.analysis.reading_order.column_gap);
    CHECK(result.value().threads.pool_name == defaults.threads.pool_name);
}

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("full configuration is applied", "[config]") {
    auto result = config_loader::load_from_string(full_config);
    REQUIRE(result.is_ok());
    auto& config = result.value();

    SECTION("runner") {
        CHECK(config.analysis.runner.parallel);
        CHECK(config.analysis.runner.run_structure);
        CHECK(config.analysis.runner.run_headings);
        CHECK_FALSE(config.analysis.runner.run_reading_order);
        CHECK_FALSE(config.analysis.runner.run_tables);
    }

    SECTION("analyzers") {
        CHECK(config.analysis.structure.max_depth == 12);
        CHECK_FALSE(config.analysis.structure.check_duplicate_ids);
        CHECK(config.analysis.headings.max_heading_level == 4);
        CHECK(config.analysis.headings.min_heading_text_length == 3);
        CHECK_FALSE(config.analysis.tables.validate_visual_match);
        CHECK(config.analysis.tables.require_headers);
    }

    SECTION("preset is applied before individual keys") {
        const auto& order = config.analysis.reading_order;
        CHECK(order.vertical_tolerance == 7.5);
        CHECK(order.horizontal_tolerance == 5.0);
        CHECK(order.overlap_threshold == 0.05);
        CHECK(order.direction == analysis::reading_direction::right_to_left);
    }

    SECTION("logging and threads") {
        CHECK(config.logging.log_directory == std::filesystem::path("/tmp/tagcheck logs"));
        CHECK(config.logging.min_level == integration::log_level::debug);
        CHECK_FALSE(config.logging.enable_console);
        CHECK(config.logging.enable_file);
        CHECK(config.logging.max_files == 3);
        CHECK(config.threads.worker_count == 3);
        CHECK(config.threads.pool_name == "tagcheck #1");
    }
}

TEST_CASE("malformed values are rejected", "[config]") {
    SECTION("boolean") {
        auto result = config_loader::load_from_string("analysis:\n  parallel: maybe\n");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
        CHECK(result.error().message.find("analysis.parallel") != std::string::npos);
    }

    SECTION("number") {
        auto result = config_loader::load_from_string("structure:\n  max_depth: deep\n");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }

    SECTION("trailing garbage after a number") {
        auto result = config_loader::load_from_string("threads:\n  worker_count: 4x\n");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }

    SECTION("number too large") {
        auto result =
            config_loader::load_from_string("structure:\n  max_depth: 99999999999999999999\n");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_out_of_range);
    }

    SECTION("first error wins") {
        auto result = config_loader::load_from_string(
            "analysis:\n  parallel: maybe\nlogging:\n  level: loud\n");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }

    SECTION("unknown analyzer") {
        auto result =
            config_loader::load_from_string("analysis:\n  analyzers:\n    - spelling\n");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }
}

TEST_CASE("unknown enumerators are rejected", "[config]") {
    auto preset = config_loader::load_from_string("reading_order:\n  preset: relaxed\n");
    REQUIRE(preset.is_err());
    CHECK(preset.error().code == error_codes::config_unknown_preset);

    auto level = config_loader::load_from_string("logging:\n  level: loud\n");
    REQUIRE(level.is_err());
    CHECK(level.error().code == error_codes::config_unknown_preset);
}

TEST_CASE("out of range settings fail validation", "[config]") {
    auto threshold =
        config_loader::load_from_string("reading_order:\n  overlap_threshold: 1.5\n");
    REQUIRE(threshold.is_err());
    CHECK(threshold.error().code == error_codes::config_out_of_range);

    auto level = config_loader::load_from_string("headings:\n  max_heading_level: 7\n");
    REQUIRE(level.is_err());
    CHECK(level.error().code == error_codes::config_out_of_range);

    auto config = config_loader::create_default();
    config.analysis.structure.max_depth = -1;
    CHECK(config_loader::validate(config).is_err());

    config = config_loader::create_default();
    config.analysis.reading_order.column_gap = 0.0;
    CHECK(config_loader::validate(config).is_err());

    config = config_loader::create_default();
    config.logging.enable_file = true;
    config.logging.max_files = 0;
    CHECK(config_loader::validate(config).is_err());

    config = config_loader::create_default();
    config.logging.async_mode = true;
    config.logging.buffer_size = 0;
    CHECK(config_loader::validate(config).is_err());
}

// =============================================================================
// Enumerator Parsing
// =============================================================================

TEST_CASE("enumerator parsing", "[config]") {
    auto warn = config_loader::parse_log_level("Warning");
    REQUIRE(warn.is_ok());
    CHECK(warn.value() == integration::log_level::warn);

    auto ltr = config_loader::parse_reading_direction(" LTR ");
    REQUIRE(ltr.is_ok());
    CHECK(ltr.value() == analysis::reading_direction::left_to_right);

    auto rtl = config_loader::parse_reading_direction("right_to_left");
    REQUIRE(rtl.is_ok());
    CHECK(rtl.value() == analysis::reading_direction::right_to_left);

    auto strict = config_loader::parse_reading_order_preset("strict");
    REQUIRE(strict.is_ok());
    CHECK(strict.value().vertical_tolerance == 2.0);

    CHECK(config_loader::parse_reading_direction("top_to_bottom").is_err());
}

// =============================================================================
// File Loading
// =============================================================================

TEST_CASE("loading from a file", "[config][file]") {
    SECTION("missing file") {
        auto result = config_loader::load("/nonexistent/tagcheck.yaml");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_file_not_found);
    }

    SECTION("existing file") {
        temp_config_file file(full_config);
        auto result = config_loader::load(file.path());
        REQUIRE(result.is_ok());
        CHECK(result.value().threads.worker_count == 3);
    }
}
