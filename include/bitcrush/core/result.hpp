/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for bitcrush
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the bitcrush service, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace bitcrush {

/**
 * @brief Result type alias for bitcrush operations
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
 * @brief bitcrush-specific error codes
 *
 * Error code range: -900 to -949
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int bitcrush_base = -900;

    // Image codec errors (-900 to -919)
    constexpr int decode_error = bitcrush_base - 0;
    constexpr int encode_error = bitcrush_base - 1;
    constexpr int unsupported_format = bitcrush_base - 2;
    constexpr int invalid_image_params = bitcrush_base - 3;

    // Transform errors (-920 to -929)
    constexpr int transform_failed = bitcrush_base - 20;

    // Artifact lookup errors (-930 to -939)
    constexpr int invalid_identifier = bitcrush_base - 30;
    constexpr int not_found = bitcrush_base - 31;

    // Template errors (-940 to -949)
    constexpr int invalid_template_path = bitcrush_base - 40;
    constexpr int template_not_found = bitcrush_base - 41;
    constexpr int template_render_error = bitcrush_base - 42;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create a bitcrush error result with module context
 * @tparam T The result value type
 * @param code Error code from bitcrush::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> bitcrush_error(int code, const std::string& message,
                                const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "bitcrush");
    }
    return kcenon::common::make_error<T>(code, message, "bitcrush", details);
}

/**
 * @brief Create a bitcrush void error result
 * @param code Error code from bitcrush::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult bitcrush_void_error(int code, const std::string& message,
                                      const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "bitcrush"});
    }
    return VoidResult(error_info{code, message, "bitcrush", details});
}

/**
 * @brief Render an error as "message: details" for logging
 * @param error Error to describe
 * @return Message, followed by the details when present
 */
inline std::string describe(const error_info& error) {
    std::string text = error.message;
    if (error.details && !error.details->empty()) {
        text += ": ";
        text += *error.details;
    }
    return text;
}

} // namespace bitcrush

/**
 * @brief Return early if expression is an error
 */
#define BITCRUSH_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define BITCRUSH_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
