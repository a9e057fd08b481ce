/**
 * @file image_service_test.cpp
 * @brief Unit tests for image submission and retrieval
 */

#include <bitcrush/services/image_service.hpp>

#include <bitcrush/encoding/compression/jpeg_codec.hpp>
#include <bitcrush/encoding/compression/png_codec.hpp>
#include <bitcrush/integration/thread_adapter.hpp>

#include "support/header_patching.hpp"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bitcrush;
using namespace bitcrush::services;
using bitcrush::encoding::compression::image_params;
using bitcrush::encoding::compression::jpeg_codec;
using bitcrush::encoding::compression::png_codec;

namespace {

std::vector<std::uint8_t> make_png(std::uint32_t width, std::uint32_t height) {
    image_params params;
    params.width = width;
    params.height = height;
    params.samples_per_pixel = 3;

    std::vector<std::uint8_t> pixels(params.frame_size_bytes());
    for (std::size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] = static_cast<std::uint8_t>(i % 251);
    }

    auto encoded = png_codec{}.encode(pixels, params);
    REQUIRE(encoded.is_ok());
    return encoded.value().data;
}

struct service_fixture {
    std::shared_ptr<storage::artifact_store> store =
        std::make_shared<storage::artifact_store>();
    image_service service{store, make_default_random_source()};
};

}  // namespace

TEST_CASE("image_service requires a store", "[services]") {
    REQUIRE_THROWS_AS(image_service(nullptr, make_default_random_source()),
                      std::invalid_argument);
}

TEST_CASE("image_service default options", "[services]") {
    service_fixture f;
    REQUIRE(f.service.options().output_quality == 25);
    REQUIRE(f.service.options().transform.iterations == 2);
    REQUIRE(f.service.store() == f.store);
}

TEST_CASE("image_service submits a PNG and serves a JPEG", "[services]") {
    service_fixture f;
    auto upload = make_png(64, 64);

    auto id = f.service.submit(upload);
    REQUIRE(id.is_ok());
    REQUIRE(id.value().size() == artifact_id_generator::kLength);
    REQUIRE(f.store->size() == 1);

    SECTION("retrieve by display token") {
        auto item = f.service.retrieve(id.value() + ".jpg");
        REQUIRE(item.is_ok());
        REQUIRE(item.value().content_type == "image/jpeg");
        REQUIRE(item.value().data.size() > 2);
        REQUIRE(item.value().data[0] == 0xFF);
        REQUIRE(item.value().data[1] == 0xD8);
    }

    SECTION("stored image keeps the upload dimensions") {
        auto item = f.service.retrieve(id.value());
        REQUIRE(item.is_ok());

        auto decoded = jpeg_codec{}.decode(item.value().data);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().output_params.width == 64);
        REQUIRE(decoded.value().output_params.height == 64);
    }

    SECTION("any extension is ignored") {
        REQUIRE(f.service.retrieve(id.value() + ".png").is_ok());
        REQUIRE(f.service.retrieve(id.value() + ".jpg.extra").is_ok());
    }
}

TEST_CASE("image_service accepts JPEG uploads", "[services]") {
    service_fixture f;

    image_params params;
    params.width = 40;
    params.height = 30;
    params.samples_per_pixel = 3;
    std::vector<std::uint8_t> pixels(params.frame_size_bytes(), 90);
    auto jpeg = jpeg_codec{}.encode(pixels, params);
    REQUIRE(jpeg.is_ok());

    auto id = f.service.submit(jpeg.value().data);
    REQUIRE(id.is_ok());
    REQUIRE(f.store->contains(id.value()));
}

TEST_CASE("image_service assigns distinct identifiers", "[services]") {
    service_fixture f;
    auto upload = make_png(16, 16);

    std::set<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = f.service.submit(upload);
        REQUIRE(id.is_ok());
        ids.insert(id.value());
    }

    REQUIRE(ids.size() == 5);
    REQUIRE(f.store->size() == 5);
}

TEST_CASE("image_service rejects non-image uploads", "[services]") {
    service_fixture f;

    SECTION("plain text") {
        std::string text = "hello, definitely not pixels";
        std::vector<std::uint8_t> bytes(text.begin(), text.end());

        auto id = f.service.submit(bytes);
        REQUIRE(id.is_err());
        REQUIRE(id.error().code == error_codes::unsupported_format);
    }

    SECTION("empty body") {
        std::vector<std::uint8_t> empty;
        auto id = f.service.submit(empty);
        REQUIRE(id.is_err());
    }

    SECTION("corrupt PNG") {
        auto png = make_png(8, 8);
        png.resize(png.size() / 2);
        auto id = f.service.submit(png);
        REQUIRE(id.is_err());
        REQUIRE(id.error().code == error_codes::decode_error);
    }

    SECTION("small PNG declaring 30000x30000 pixels") {
        auto oversized = test_support::with_png_dimensions(make_png(8, 8), 30000, 30000);
        REQUIRE(oversized.size() < 1024);

        auto id = f.service.submit(oversized);
        REQUIRE(id.is_err());
        REQUIRE(id.error().code == error_codes::decode_error);
    }

    REQUIRE(f.store->empty());
}

TEST_CASE("image_service fails cleanly when the transform exceeds its budget", "[services][limits]") {
    auto store = std::make_shared<storage::artifact_store>();
    image_service_options options;
    options.transform.max_intermediate_bytes = 64;
    image_service service(store, make_default_random_source(), options);

    auto id = service.submit(make_png(16, 16));

    REQUIRE(id.is_err());
    REQUIRE(id.error().code == error_codes::encode_error);
    REQUIRE(store->empty());
}

TEST_CASE("image_service retrieve errors", "[services]") {
    service_fixture f;

    SECTION("well formed but unknown id") {
        auto item = f.service.retrieve("01ARZ3NDEKTSV4RRFFQ69G5FAV.jpg");
        REQUIRE(item.is_err());
        REQUIRE(item.error().code == error_codes::not_found);
    }

    SECTION("malformed id") {
        auto item = f.service.retrieve("nope.jpg");
        REQUIRE(item.is_err());
        REQUIRE(item.error().code == error_codes::invalid_identifier);
    }

    SECTION("extension only") {
        auto item = f.service.retrieve(".jpg");
        REQUIRE(item.is_err());
        REQUIRE(item.error().code == error_codes::invalid_identifier);
    }
}

TEST_CASE("image_service token helpers", "[services]") {
    SECTION("parse_token strips the extension and canonicalizes") {
        auto id = image_service::parse_token("01arz3ndektsv4rrffq69g5fav.jpg");
        REQUIRE(id.is_ok());
        REQUIRE(id.value() == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
    }

    SECTION("parse_token accepts a bare id") {
        REQUIRE(image_service::parse_token("01ARZ3NDEKTSV4RRFFQ69G5FAV").is_ok());
    }

    SECTION("parse_token rejects path segments") {
        REQUIRE(image_service::parse_token("../secret").is_err());
    }

    SECTION("src_for builds the public reference") {
        REQUIRE(image_service::src_for("01ARZ3NDEKTSV4RRFFQ69G5FAV") ==
                "/images/01ARZ3NDEKTSV4RRFFQ69G5FAV.jpg");
    }
}

TEST_CASE("image_service submit_async runs on the transform pool", "[services][async]") {
    service_fixture f;

    auto future = f.service.submit_async(make_png(32, 24));
    auto id = future.get();

    REQUIRE(id.is_ok());
    REQUIRE(f.store->contains(id.value()));

    integration::thread_adapter::shutdown(true);
}
