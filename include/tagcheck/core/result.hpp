/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for tagcheck
 *
 * The analyzers themselves never fail; Result is used by the ambient layers
 * (configuration loading, worker pool startup) and follows common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace tagcheck {

/**
 * @brief Result type alias for tagcheck operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief tagcheck-specific error codes
 *
 * Error code range: -900 to -929
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int tagcheck_base = -900;

    // Configuration errors (-900 to -919)
    constexpr int config_file_not_found = tagcheck_base - 0;
    constexpr int config_read_error = tagcheck_base - 1;
    constexpr int config_invalid_value = tagcheck_base - 2;
    constexpr int config_unknown_preset = tagcheck_base - 3;
    constexpr int config_out_of_range = tagcheck_base - 4;

    // Logging and engine startup errors (-910 to -919)
    constexpr int logging_already_started = tagcheck_base - 10;
    constexpr int logging_start_failed = tagcheck_base - 11;

    // Worker pool errors (-920 to -929)
    constexpr int pool_start_failed = tagcheck_base - 20;
    constexpr int pool_worker_rejected = tagcheck_base - 21;
    constexpr int pool_submit_failed = tagcheck_base - 22;

}  // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a tagcheck error result with module context
 * @tparam T The result value type
 * @param code Error code from tagcheck::error_codes
 * @param message Error message
 * @param details Optional additional details
 */
template <typename T>
inline Result<T> tagcheck_error(int code, const std::string& message,
                                const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "tagcheck");
    }
    return kcenon::common::make_error<T>(code, message, "tagcheck", details);
}

/**
 * @brief Create a tagcheck void error result
 */
inline VoidResult tagcheck_void_error(int code, const std::string& message,
                                      const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "tagcheck"});
    }
    return VoidResult(error_info{code, message, "tagcheck", details});
}

}  // namespace tagcheck

