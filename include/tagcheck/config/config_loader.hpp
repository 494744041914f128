/**
 * @file config_loader.hpp
 * @brief YAML configuration loader for the validation engine
 *
 * Reads a small subset of YAML: nested sections by indentation,
 * `key: value` pairs, `- item` lists, comments and quoted strings.
 *
 * @code
 * analysis:
 *   parallel: true
 * reading_order:
 *   preset: strict
 *   column_gap: 40
 * headings:
 *   max_heading_level: 4
 * logging:
 *   level: debug
 * @endcode
 */

#pragma once

#include <tagcheck/config/engine_config.hpp>
#include <tagcheck/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace tagcheck::config {

/**
 * @brief YAML configuration file loader
 *
 * Keys that are absent keep their defaults. A reading_order.preset is
 * applied before the individual reading_order keys, which override it.
 *
 * @example
 * @code
 * auto result = config_loader::load("tagcheck.yaml");
 * if (result.is_ok()) {
 *     analysis::validation_runner runner{result.value().analysis};
 * } else {
 *     std::cerr << result.error().message << "\n";
 * }
 * @endcode
 */
class config_loader {
public:
    /**
     * @brief Load configuration from a YAML file
     * @return Configuration, or config_file_not_found / config_read_error
     *         / any error of load_from_string()
     */
    [[nodiscard]] static auto load(const std::filesystem::path& path)
        -> Result<engine_config>;

    /**
     * @brief Load configuration from YAML text
     * @return Configuration, or config_invalid_value for malformed values,
     *         config_unknown_preset for unknown enumerators and
     *         config_out_of_range when validate() rejects the result
     */
    [[nodiscard]] static auto load_from_string(std::string_view yaml_content)
        -> Result<engine_config>;

    /**
     * @brief Create the default configuration
     */
    [[nodiscard]] static auto create_default() -> engine_config;

    /**
     * @brief Check numeric settings against their ranges
     */
    [[nodiscard]] static auto validate(const engine_config& config) -> VoidResult;

    [[nodiscard]] static auto parse_log_level(std::string_view value)
        -> Result<integration::log_level>;

    [[nodiscard]] static auto parse_reading_direction(std::string_view value)
        -> Result<analysis::reading_direction>;

    [[nodiscard]] static auto parse_reading_order_preset(std::string_view value)
        -> Result<analysis::reading_order_options>;
};

}  // namespace tagcheck::config
