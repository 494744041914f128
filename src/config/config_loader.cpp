/**
 * @file config_loader.cpp
 * @brief Implementation of the YAML configuration loader
 */

#include "tagcheck/config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace tagcheck::config {

namespace {

[[nodiscard]] auto trim(std::string_view str) -> std::string {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

[[nodiscard]] auto to_lower(std::string_view str) -> std::string {
    std::string lowered(str);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

/**
 * @brief Simple YAML parser for configuration files
 *
 * Handles:
 * - Key-value pairs
 * - Nested sections (with indentation)
 * - Simple lists (- item syntax)
 * - Comments (# lines and trailing # after whitespace)
 * - Quoted strings
 */
class simple_yaml_parser {
public:
    explicit simple_yaml_parser(std::string_view content) { parse(content); }

    [[nodiscard]] auto find(const std::string& path) const -> std::optional<std::string> {
        auto it = values_.find(path);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] auto find_list(const std::string& path) const
        -> std::optional<std::vector<std::string>> {
        auto it = lists_.find(path);
        if (it == lists_.end()) return std::nullopt;
        return it->second;
    }

private:
    void parse(std::string_view content) {
        std::istringstream stream{std::string(content)};
        std::string line;
        std::vector<std::pair<int, std::string>> path_stack;
        std::string current_list_path;

        while (std::getline(stream, line)) {
            if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }

            auto non_ws = line.find_first_not_of(" \t");
            if (line[non_ws] == '#') {
                continue;
            }

            int indent = 0;
            for (char c : line) {
                if (c == ' ') indent++;
                else if (c == '\t') indent += 2;
                else break;
            }

            auto trimmed = trim(strip_comment(line));

            if (trimmed.starts_with("- ") || trimmed == "-") {
                auto item = strip_quotes(trim(std::string_view(trimmed).substr(1)));
                if (!current_list_path.empty()) {
                    lists_[current_list_path].push_back(std::move(item));
                }
                continue;
            }

            current_list_path.clear();

            auto colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) continue;

            std::string key = trim(std::string_view(trimmed).substr(0, colon_pos));
            std::string value = trim(std::string_view(trimmed).substr(colon_pos + 1));

            while (!path_stack.empty() && path_stack.back().first >= indent) {
                path_stack.pop_back();
            }

            std::string full_path;
            for (const auto& [_, segment] : path_stack) {
                full_path += segment + ".";
            }
            full_path += key;

            if (value.empty()) {
                // Section header or list owner
                path_stack.emplace_back(indent, key);
                current_list_path = full_path;
            } else {
                values_[full_path] = strip_quotes(value);
            }
        }
    }

    /// Drop a trailing comment that is not inside quotes
    [[nodiscard]] static auto strip_comment(std::string_view line) -> std::string_view {
        char quote = 0;
        for (std::size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quote != 0) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && i > 0 && (line[i - 1] == ' ' || line[i - 1] == '\t')) {
                return line.substr(0, i);
            }
        }
        return line;
    }

    [[nodiscard]] static auto strip_quotes(std::string_view str) -> std::string {
        if (str.length() >= 2) {
            if ((str.front() == '"' && str.back() == '"') ||
                (str.front() == '\'' && str.back() == '\'')) {
                return std::string(str.substr(1, str.length() - 2));
            }
        }
        return std::string(str);
    }

    std::map<std::string, std::string> values_;
    std::map<std::string, std::vector<std::string>> lists_;
};

/**
 * @brief Typed reads from the parsed document, keeping the first failure
 */
class value_reader {
public:
    explicit value_reader(const simple_yaml_parser& parser) : parser_(parser) {}

    void read(const std::string& path, bool& target) {
        auto raw = lookup(path);
        if (!raw) return;
        auto value = to_lower(*raw);
        if (value == "true" || value == "yes" || value == "on" || value == "1") {
            target = true;
        } else if (value == "false" || value == "no" || value == "off" || value == "0") {
            target = false;
        } else {
            fail(error_codes::config_invalid_value, path, *raw, "expected a boolean");
        }
    }

    template <typename Number>
    void read(const std::string& path, Number& target) {
        auto raw = lookup(path);
        if (!raw) return;
        Number parsed{};
        const char* first = raw->data();
        const char* last = raw->data() + raw->size();
        auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec == std::errc::result_out_of_range) {
            fail(error_codes::config_out_of_range, path, *raw, "number out of range");
        } else if (ec != std::errc{} || ptr != last) {
            fail(error_codes::config_invalid_value, path, *raw, "expected a number");
        } else {
            target = parsed;
        }
    }

    void read(const std::string& path, std::string& target) {
        if (auto raw = lookup(path)) {
            target = *raw;
        }
    }

    template <typename Parser, typename Target>
    void read_with(const std::string& path, Parser parse, Target& target) {
        auto raw = lookup(path);
        if (!raw) return;
        auto parsed = parse(*raw);
        if (parsed.is_err()) {
            record(parsed.error());
            return;
        }
        target = std::move(parsed.value());
    }

    void fail(int code, const std::string& path, const std::string& raw,
              const std::string& reason) {
        record(error_info{code, "Invalid value '" + raw + "' for '" + path + "': " + reason,
                          "tagcheck"});
    }

    [[nodiscard]] auto status() const -> VoidResult {
        if (first_error_) {
            return VoidResult(*first_error_);
        }
        return ok();
    }

private:
    [[nodiscard]] auto lookup(const std::string& path) const -> std::optional<std::string> {
        if (first_error_) return std::nullopt;
        return parser_.find(path);
    }

    void record(const error_info& error) {
        if (!first_error_) {
            first_error_ = error;
        }
    }

    const simple_yaml_parser& parser_;
    std::optional<error_info> first_error_;
};

[[nodiscard]] auto apply_analyzer_list(const std::vector<std::string>& names,
                                       analysis::runner_options& runner) -> VoidResult {
    runner.run_structure = false;
    runner.run_headings = false;
    runner.run_reading_order = false;
    runner.run_tables = false;

    for (const auto& name : names) {
        auto v = to_lower(name);
        if (v == "structure") {
            runner.run_structure = true;
        } else if (v == "headings") {
            runner.run_headings = true;
        } else if (v == "reading_order") {
            runner.run_reading_order = true;
        } else if (v == "tables") {
            runner.run_tables = true;
        } else {
            return tagcheck_void_error(error_codes::config_invalid_value,
                                       "Unknown analyzer: " + name,
                                       "expected structure, headings, reading_order or tables");
        }
    }
    return ok();
}

}  // namespace

auto config_loader::load(const std::filesystem::path& path) -> Result<engine_config> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return tagcheck_error<engine_config>(error_codes::config_file_not_found,
                                             "Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return tagcheck_error<engine_config>(error_codes::config_read_error,
                                             "Failed to open configuration file: " +
                                                 path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

auto config_loader::load_from_string(std::string_view yaml_content) -> Result<engine_config> {
    simple_yaml_parser parser(yaml_content);
    value_reader reader(parser);
    engine_config config = create_default();

    // Runner
    auto& runner = config.analysis.runner;
    reader.read("analysis.parallel", runner.parallel);
    if (auto names = parser.find_list("analysis.analyzers")) {
        auto applied = apply_analyzer_list(*names, runner);
        if (applied.is_err()) {
            return Result<engine_config>(applied.error());
        }
    }

    // Structure analyzer
    auto& structure = config.analysis.structure;
    reader.read("structure.validate_nesting", structure.validate_nesting);
    reader.read("structure.validate_required_children", structure.validate_required_children);
    reader.read("structure.validate_attributes", structure.validate_attributes);
    reader.read("structure.check_empty_elements", structure.check_empty_elements);
    reader.read("structure.check_duplicate_ids", structure.check_duplicate_ids);
    reader.read("structure.max_depth", structure.max_depth);

    // Heading hierarchy
    auto& headings = config.analysis.headings;
    reader.read("headings.require_single_h1", headings.require_single_h1);
    reader.read("headings.require_first_h1", headings.require_first_h1);
    reader.read("headings.check_skipped_levels", headings.check_skipped_levels);
    reader.read("headings.check_empty_headings", headings.check_empty_headings);
    reader.read("headings.validate_heading_text", headings.validate_heading_text);
    reader.read("headings.max_heading_level", headings.max_heading_level);
    reader.read("headings.min_heading_text_length", headings.min_heading_text_length);

    // Reading order: preset first, individual keys override it
    auto& reading_order = config.analysis.reading_order;
    reader.read_with("reading_order.preset", &config_loader::parse_reading_order_preset,
                     reading_order);
    reader.read_with("reading_order.direction", &config_loader::parse_reading_direction,
                     reading_order.direction);
    reader.read("reading_order.vertical_tolerance", reading_order.vertical_tolerance);
    reader.read("reading_order.horizontal_tolerance", reading_order.horizontal_tolerance);
    reader.read("reading_order.check_overlaps", reading_order.check_overlaps);
    reader.read("reading_order.overlap_threshold", reading_order.overlap_threshold);
    reader.read("reading_order.validate_columns", reading_order.validate_columns);
    reader.read("reading_order.column_gap", reading_order.column_gap);

    // Tables
    auto& tables = config.analysis.tables;
    reader.read("tables.require_headers", tables.require_headers);
    reader.read("tables.recommend_header_group", tables.recommend_header_group);
    reader.read("tables.validate_regularity", tables.validate_regularity);
    reader.read("tables.validate_visual_match", tables.validate_visual_match);

    // Logging
    auto& logging = config.logging;
    std::string log_directory = logging.log_directory.string();
    reader.read("logging.directory", log_directory);
    logging.log_directory = log_directory;
    reader.read_with("logging.level", &config_loader::parse_log_level, logging.min_level);
    reader.read("logging.console", logging.enable_console);
    reader.read("logging.file", logging.enable_file);
    reader.read("logging.max_file_size_mb", logging.max_file_size_mb);
    reader.read("logging.max_files", logging.max_files);
    reader.read("logging.async", logging.async_mode);
    reader.read("logging.buffer_size", logging.buffer_size);

    // Worker pool
    reader.read("threads.worker_count", config.threads.worker_count);
    reader.read("threads.pool_name", config.threads.pool_name);

    if (auto status = reader.status(); status.is_err()) {
        return Result<engine_config>(status.error());
    }

    auto validation = validate(config);
    if (validation.is_err()) {
        return Result<engine_config>(validation.error());
    }

    return Result<engine_config>::ok(std::move(config));
}

auto config_loader::create_default() -> engine_config {
    engine_config config;
    config.analysis.structure = analysis::structure_analysis_options::all();
    config.analysis.headings = analysis::heading_validation_options::all();
    config.analysis.reading_order = analysis::reading_order_options::standard();
    config.analysis.tables = analysis::table_validation_options::strict();
    return config;
}

auto config_loader::validate(const engine_config& config) -> VoidResult {
    const auto& analysis = config.analysis;

    if (analysis.structure.max_depth < 0) {
        return tagcheck_void_error(error_codes::config_out_of_range,
                                   "structure.max_depth cannot be negative");
    }

    if (analysis.headings.max_heading_level < 1 || analysis.headings.max_heading_level > 6) {
        return tagcheck_void_error(error_codes::config_out_of_range,
                                   "headings.max_heading_level must be between 1 and 6");
    }

    const auto& order = analysis.reading_order;
    if (order.vertical_tolerance < 0.0 || order.horizontal_tolerance < 0.0) {
        return tagcheck_void_error(error_codes::config_out_of_range,
                                   "reading_order tolerances cannot be negative");
    }
    if (order.overlap_threshold < 0.0 || order.overlap_threshold > 1.0) {
        return tagcheck_void_error(error_codes::config_out_of_range,
                                   "reading_order.overlap_threshold must be between 0 and 1");
    }
    if (order.column_gap <= 0.0) {
        return tagcheck_void_error(error_codes::config_out_of_range,
                                   "reading_order.column_gap must be positive");
    }

    if (config.logging.enable_file && config.logging.max_files == 0) {
        return tagcheck_void_error(error_codes::config_out_of_range,
                                   "logging.max_files must be at least 1");
    }
    if (config.logging.async_mode && config.logging.buffer_size == 0) {
        return tagcheck_void_error(error_codes::config_out_of_range,
                                   "logging.buffer_size cannot be 0 in async mode");
    }

    return ok();
}

auto config_loader::parse_log_level(std::string_view value) -> Result<integration::log_level> {
    using integration::log_level;
    auto v = to_lower(trim(value));

    if (v == "trace") return Result<log_level>::ok(log_level::trace);
    if (v == "debug") return Result<log_level>::ok(log_level::debug);
    if (v == "info") return Result<log_level>::ok(log_level::info);
    if (v == "warn" || v == "warning") return Result<log_level>::ok(log_level::warn);
    if (v == "error") return Result<log_level>::ok(log_level::error);
    if (v == "fatal") return Result<log_level>::ok(log_level::fatal);
    if (v == "off") return Result<log_level>::ok(log_level::off);

    return tagcheck_error<log_level>(error_codes::config_unknown_preset,
                                     "Unknown log level: " + std::string(value));
}

auto config_loader::parse_reading_direction(std::string_view value)
    -> Result<analysis::reading_direction> {
    using analysis::reading_direction;
    auto v = to_lower(trim(value));

    if (v == "left_to_right" || v == "ltr") {
        return Result<reading_direction>::ok(reading_direction::left_to_right);
    }
    if (v == "right_to_left" || v == "rtl") {
        return Result<reading_direction>::ok(reading_direction::right_to_left);
    }

    return tagcheck_error<reading_direction>(error_codes::config_unknown_preset,
                                             "Unknown reading direction: " + std::string(value));
}

auto config_loader::parse_reading_order_preset(std::string_view value)
    -> Result<analysis::reading_order_options> {
    using analysis::reading_order_options;
    auto v = to_lower(trim(value));

    if (v == "standard") return Result<reading_order_options>::ok(reading_order_options::standard());
    if (v == "strict") return Result<reading_order_options>::ok(reading_order_options::strict());
    if (v == "right_to_left") {
        return Result<reading_order_options>::ok(reading_order_options::right_to_left());
    }

    return tagcheck_error<reading_order_options>(error_codes::config_unknown_preset,
                                                 "Unknown reading order preset: " +
                                                     std::string(value));
}

}  // namespace tagcheck::config
