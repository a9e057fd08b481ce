/**
 * @file rest_types.hpp
 * @brief Common types and utilities for REST API
 *
 * This file provides HTTP status codes, JSON error bodies, and the mapping
 * from bitcrush error codes to HTTP responses.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "bitcrush/core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace bitcrush::web {

/**
 * @enum http_status
 * @brief Common HTTP status codes
 */
enum class http_status : std::uint16_t {
  // Success
  ok = 200,
  no_content = 204,

  // Client errors
  bad_request = 400,
  not_found = 404,
  method_not_allowed = 405,
  payload_too_large = 413,
  unprocessable_entity = 422,

  // Server errors
  internal_server_error = 500,
  service_unavailable = 503
};

/**
 * @struct api_error
 * @brief Standard API error structure
 */
struct api_error {
  std::string code;
  std::string message;
  std::string details;
};

/**
 * @struct mapped_error
 * @brief HTTP status and public error body for an internal error code
 */
struct mapped_error {
  http_status status{http_status::internal_server_error};
  api_error error;
};

/// Message shown for every failure the client cannot fix
inline constexpr std::string_view kGenericFailureMessage =
    "Something went wrong, sorry!";

/**
 * @brief Map a bitcrush error code to its HTTP representation
 *
 * decode failures map to 422, malformed identifiers to 400, missing
 * artifacts to 404 and everything else to 500. The returned message never
 * contains internal detail.
 *
 * @param code Error code from bitcrush::error_codes
 */
[[nodiscard]] inline mapped_error to_api_error(int code) {
  switch (code) {
  case error_codes::decode_error:
  case error_codes::unsupported_format:
    return {http_status::unprocessable_entity,
            {"INVALID_IMAGE", "Upload is not a supported image", ""}};
  case error_codes::invalid_identifier:
    return {http_status::bad_request,
            {"INVALID_ID", "Malformed image identifier", ""}};
  case error_codes::not_found:
    return {http_status::not_found, {"NOT_FOUND", "Image not found", ""}};
  default:
    return {http_status::internal_server_error,
            {"INTERNAL_ERROR", std::string(kGenericFailureMessage), ""}};
  }
}

/**
 * @brief Escape a string for JSON
 * @param s Input string
 * @return JSON-escaped string
 */
[[nodiscard]] inline std::string json_escape(std::string_view s) {
  std::string result;
  result.reserve(s.size() + 10);
  for (char c : s) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\b':
      result += "\\b";
      break;
    case '\f':
      result += "\\f";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      result += c;
      break;
    }
  }
  return result;
}

/**
 * @brief Create JSON error response body
 * @param error The API error
 * @return JSON string
 */
[[nodiscard]] inline std::string to_json(const api_error &error) {
  std::string json = R"({"error":{"code":")" + json_escape(error.code) +
                     R"(","message":")" + json_escape(error.message) + R"(")";
  if (!error.details.empty()) {
    json += R"(,"details":")" + json_escape(error.details) + R"(")";
  }
  json += "}}";
  return json;
}

/**
 * @brief Create JSON error response body
 * @param code Error code
 * @param message Error message
 * @return JSON string
 */
[[nodiscard]] inline std::string make_error_json(std::string_view code,
                                                 std::string_view message) {
  return std::string(R"({"error":{"code":")") + json_escape(code) +
         R"(","message":")" + json_escape(message) + R"("}})";
}

/**
 * @brief Body of a successful upload
 * @param src Public reference of the stored image
 * @return JSON string of the form {"src":"/images/<id>.jpg"}
 */
[[nodiscard]] inline std::string make_upload_json(std::string_view src) {
  return std::string(R"({"src":")") + json_escape(src) + R"("})";
}

} // namespace bitcrush::web
