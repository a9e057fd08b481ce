#include <catch2/catch_test_macros.hpp>

#include "bitcrush/encoding/compression/webp_codec.hpp"

#include <string>
#include <vector>

using namespace bitcrush::encoding::compression;

namespace {

// 1x1 reference images from the WebP feature-detection snippets
const std::vector<uint8_t> kLossy = {
    0x52, 0x49, 0x46, 0x46, 0x22, 0x00, 0x00, 0x00, 0x57, 0x45, 0x42, 0x50, 0x56, 0x50,
    0x38, 0x20, 0x16, 0x00, 0x00, 0x00, 0x30, 0x01, 0x00, 0x9D, 0x01, 0x2A, 0x01, 0x00,
    0x01, 0x00, 0x0E, 0xC0, 0xFE, 0x25, 0xA4, 0x00, 0x03, 0x70, 0x00, 0x00, 0x00, 0x00};

const std::vector<uint8_t> kLossless = {
    0x52, 0x49, 0x46, 0x46, 0x1A, 0x00, 0x00, 0x00, 0x57, 0x45, 0x42, 0x50,
    0x56, 0x50, 0x38, 0x4C, 0x0D, 0x00, 0x00, 0x00, 0x2F, 0x00, 0x00, 0x00,
    0x10, 0x07, 0x10, 0x11, 0x11, 0x88, 0x88, 0xFE, 0x07, 0x00};

const std::vector<uint8_t> kAnimated = {
    0x52, 0x49, 0x46, 0x46, 0x52, 0x00, 0x00, 0x00, 0x57, 0x45, 0x42, 0x50, 0x56, 0x50,
    0x38, 0x58, 0x0A, 0x00, 0x00, 0x00, 0x12, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x41, 0x4E, 0x49, 0x4D, 0x06, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF,
    0x00, 0x00, 0x41, 0x4E, 0x4D, 0x46, 0x26, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x64, 0x00, 0x00, 0x00, 0x56, 0x50,
    0x38, 0x4C, 0x0D, 0x00, 0x00, 0x00, 0x2F, 0x00, 0x00, 0x00, 0x10, 0x07, 0x10, 0x11,
    0x11, 0x88, 0x88, 0xFE, 0x07, 0x00};

}  // namespace

TEST_CASE("webp_codec basic properties", "[encoding][compression][webp]") {
    webp_codec codec;

    REQUIRE(codec.format() == image_format::webp);
    REQUIRE(codec.name() == "WebP");
    REQUIRE(codec.mime_type() == "image/webp");
    REQUIRE(codec.can_decode(kLossy));
    REQUIRE(codec.can_decode(kLossless));
}

TEST_CASE("webp_codec decodes still images", "[encoding][compression][webp]") {
    webp_codec codec;

    SECTION("lossy") {
        auto decoded = codec.decode(kLossy);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().output_params.width == 1);
        REQUIRE(decoded.value().output_params.height == 1);
        REQUIRE(decoded.value().data.size() == 3);
    }

    SECTION("lossless") {
        auto decoded = codec.decode(kLossless);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().output_params.samples_per_pixel == 3);
        REQUIRE(decoded.value().data.size() == 3);
    }
}

TEST_CASE("webp_codec error handling", "[encoding][compression][webp]") {
    webp_codec codec;

    SECTION("animation is rejected") {
        auto result = codec.decode(kAnimated);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == bitcrush::error_codes::decode_error);
    }

    SECTION("RIFF container of another type") {
        auto wave = kLossy;
        wave[8] = 'W';
        wave[9] = 'A';
        wave[10] = 'V';
        wave[11] = 'E';
        REQUIRE_FALSE(codec.can_decode(wave));
        REQUIRE(codec.decode(wave).is_err());
    }

    SECTION("corrupt bitstream") {
        auto broken = kLossy;
        broken.resize(24);
        auto result = codec.decode(broken);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == bitcrush::error_codes::decode_error);
    }

    SECTION("16384x16384 header is beyond the decode budget") {
        auto huge = kLossless;
        // 14-bit width-1 and height-1 fields follow the 0x2F signature byte
        huge[21] = 0xFF;
        huge[22] = 0xFF;
        huge[23] = 0xFF;
        huge[24] = 0x0F;
        auto result = codec.decode(huge);
        REQUIRE(result.is_err());
        REQUIRE(result.error().message.find("budget") != std::string::npos);
    }
}
