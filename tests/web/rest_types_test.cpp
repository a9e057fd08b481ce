/**
 * @file rest_types_test.cpp
 * @brief Unit tests for REST error mapping and JSON helpers
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include <catch2/catch_test_macros.hpp>

#include "bitcrush/web/rest_types.hpp"

using namespace bitcrush;
using namespace bitcrush::web;

TEST_CASE("to_api_error maps service errors", "[web][errors]") {
  SECTION("undecodable uploads are 422") {
    auto mapped = to_api_error(error_codes::decode_error);
    REQUIRE(mapped.status == http_status::unprocessable_entity);
    REQUIRE(mapped.error.code == "INVALID_IMAGE");

    REQUIRE(to_api_error(error_codes::unsupported_format).status ==
            http_status::unprocessable_entity);
  }

  SECTION("malformed identifiers are 400") {
    auto mapped = to_api_error(error_codes::invalid_identifier);
    REQUIRE(mapped.status == http_status::bad_request);
    REQUIRE(mapped.error.code == "INVALID_ID");
  }

  SECTION("unknown identifiers are 404") {
    auto mapped = to_api_error(error_codes::not_found);
    REQUIRE(mapped.status == http_status::not_found);
    REQUIRE(mapped.error.code == "NOT_FOUND");
  }

  SECTION("everything else is a generic 500") {
    for (int code : {error_codes::encode_error, error_codes::transform_failed,
                     error_codes::invalid_image_params,
                     error_codes::template_render_error, -1}) {
      auto mapped = to_api_error(code);
      REQUIRE(mapped.status == http_status::internal_server_error);
      REQUIRE(mapped.error.code == "INTERNAL_ERROR");
      REQUIRE(mapped.error.message == kGenericFailureMessage);
    }
  }
}

TEST_CASE("http_status values", "[web][types]") {
  REQUIRE(static_cast<int>(http_status::ok) == 200);
  REQUIRE(static_cast<int>(http_status::payload_too_large) == 413);
  REQUIRE(static_cast<int>(http_status::unprocessable_entity) == 422);
  REQUIRE(static_cast<int>(http_status::service_unavailable) == 503);
}

TEST_CASE("json_escape", "[web][json]") {
  REQUIRE(json_escape("plain") == "plain");
  REQUIRE(json_escape("a\"b") == "a\\\"b");
  REQUIRE(json_escape("back\\slash") == "back\\\\slash");
  REQUIRE(json_escape("line\nbreak\ttab") == "line\\nbreak\\ttab");
}

TEST_CASE("error JSON bodies", "[web][json]") {
  SECTION("to_json without details") {
    api_error error{"NOT_FOUND", "Image not found", ""};
    REQUIRE(to_json(error) ==
            R"({"error":{"code":"NOT_FOUND","message":"Image not found"}})");
  }

  SECTION("to_json with details") {
    api_error error{"INVALID_ID", "Malformed image identifier", "x\"y"};
    REQUIRE(
        to_json(error) ==
        R"({"error":{"code":"INVALID_ID","message":"Malformed image identifier","details":"x\"y"}})");
  }

  SECTION("make_error_json") {
    REQUIRE(make_error_json("PAYLOAD_TOO_LARGE", "Upload too large") ==
            R"({"error":{"code":"PAYLOAD_TOO_LARGE","message":"Upload too large"}})");
  }
}

TEST_CASE("make_upload_json", "[web][json]") {
  REQUIRE(make_upload_json("/images/01ARZ3NDEKTSV4RRFFQ69G5FAV.jpg") ==
          R"({"src":"/images/01ARZ3NDEKTSV4RRFFQ69G5FAV.jpg"})");
}
