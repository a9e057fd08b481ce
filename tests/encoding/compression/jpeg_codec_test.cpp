#include <catch2/catch_test_macros.hpp>

#include "bitcrush/encoding/compression/jpeg_codec.hpp"
#include "bitcrush/encoding/compression/image_params.hpp"
#include "support/header_patching.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

using namespace bitcrush::encoding::compression;

namespace {

/**
 * @brief Creates a simple grayscale gradient test image.
 */
std::vector<uint8_t> create_gradient_image(uint32_t width, uint32_t height) {
    std::vector<uint8_t> data(static_cast<size_t>(width) * height);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            data[y * width + x] = static_cast<uint8_t>(
                (x + y) * 255 / (width + height - 2));
        }
    }
    return data;
}

/**
 * @brief Creates a simple RGB color test image.
 */
std::vector<uint8_t> create_color_image(uint32_t width, uint32_t height) {
    std::vector<uint8_t> data(static_cast<size_t>(width) * height * 3);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            size_t idx = (static_cast<size_t>(y) * width + x) * 3;
            data[idx + 0] = static_cast<uint8_t>(x * 255 / (width - 1));
            data[idx + 1] = static_cast<uint8_t>(y * 255 / (height - 1));
            data[idx + 2] = 128;
        }
    }
    return data;
}

double calculate_psnr(const std::vector<uint8_t>& original,
                      const std::vector<uint8_t>& reconstructed) {
    if (original.size() != reconstructed.size() || original.empty()) {
        return 0.0;
    }

    double mse = 0.0;
    for (size_t i = 0; i < original.size(); ++i) {
        double diff = static_cast<double>(original[i]) - reconstructed[i];
        mse += diff * diff;
    }
    mse /= static_cast<double>(original.size());

    if (mse == 0.0) {
        return std::numeric_limits<double>::infinity();
    }

    return 10.0 * std::log10(255.0 * 255.0 / mse);
}

image_params make_params(uint32_t width, uint32_t height, uint16_t samples) {
    image_params params;
    params.width = width;
    params.height = height;
    params.samples_per_pixel = samples;
    params.bits_allocated = 8;
    return params;
}

}  // namespace

TEST_CASE("jpeg_codec basic properties", "[encoding][compression][jpeg]") {
    jpeg_codec codec;

    REQUIRE(codec.format() == image_format::jpeg);
    REQUIRE(codec.name() == "JPEG Baseline");
    REQUIRE(codec.mime_type() == "image/jpeg");
    REQUIRE(codec.is_lossy());
}

TEST_CASE("jpeg_codec can_encode validation", "[encoding][compression][jpeg]") {
    jpeg_codec codec;

    SECTION("accepts 8-bit grayscale") {
        REQUIRE(codec.can_encode(make_params(256, 256, 1)));
    }

    SECTION("accepts 8-bit RGB") {
        REQUIRE(codec.can_encode(make_params(256, 256, 3)));
    }

    SECTION("rejects 16-bit samples") {
        auto params = make_params(256, 256, 1);
        params.bits_allocated = 16;
        REQUIRE_FALSE(codec.can_encode(params));
    }

    SECTION("rejects four channels") {
        REQUIRE_FALSE(codec.can_encode(make_params(256, 256, 4)));
    }

    SECTION("rejects zero dimensions") {
        REQUIRE_FALSE(codec.can_encode(make_params(0, 16, 3)));
    }

    SECTION("rejects dimensions beyond the JPEG limit") {
        REQUIRE_FALSE(codec.can_encode(make_params(70000, 16, 3)));
    }
}

TEST_CASE("jpeg_codec can_decode checks the SOI marker", "[encoding][compression][jpeg]") {
    jpeg_codec codec;

    std::vector<uint8_t> jpeg_header = {0xFF, 0xD8, 0xFF, 0xE0};
    std::vector<uint8_t> png_header = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    std::vector<uint8_t> empty;

    REQUIRE(codec.can_decode(jpeg_header));
    REQUIRE_FALSE(codec.can_decode(png_header));
    REQUIRE_FALSE(codec.can_decode(empty));
}

TEST_CASE("jpeg_codec encode and decode", "[encoding][compression][jpeg]") {
    jpeg_codec codec;

    SECTION("grayscale survives at high quality") {
        auto params = make_params(64, 64, 1);
        auto original = create_gradient_image(64, 64);

        compression_options options;
        options.quality = 95;
        auto encoded = codec.encode(original, params, options);
        REQUIRE(encoded.is_ok());
        REQUIRE(encoded.value().data.size() > 2);
        REQUIRE(encoded.value().data[0] == 0xFF);
        REQUIRE(encoded.value().data[1] == 0xD8);

        auto decoded = codec.decode(encoded.value().data);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().output_params.width == 64);
        REQUIRE(decoded.value().output_params.height == 64);
        REQUIRE(decoded.value().output_params.samples_per_pixel == 1);
        REQUIRE(calculate_psnr(original, decoded.value().data) > 30.0);
    }

    SECTION("color keeps three channels") {
        auto params = make_params(48, 32, 3);
        auto original = create_color_image(48, 32);

        auto encoded = codec.encode(original, params);
        REQUIRE(encoded.is_ok());

        auto decoded = codec.decode(encoded.value().data);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().output_params.width == 48);
        REQUIRE(decoded.value().output_params.height == 32);
        REQUIRE(decoded.value().output_params.samples_per_pixel == 3);
        REQUIRE(decoded.value().data.size() == 48 * 32 * 3);
    }

    SECTION("lower quality yields smaller output") {
        auto params = make_params(128, 128, 3);
        auto original = create_color_image(128, 128);

        compression_options low;
        low.quality = 10;
        compression_options high;
        high.quality = 95;

        auto small = codec.encode(original, params, low);
        auto large = codec.encode(original, params, high);
        REQUIRE(small.is_ok());
        REQUIRE(large.is_ok());
        REQUIRE(small.value().data.size() < large.value().data.size());
    }
}

TEST_CASE("jpeg_codec error handling", "[encoding][compression][jpeg]") {
    jpeg_codec codec;

    SECTION("encode rejects mismatched buffer size") {
        auto params = make_params(16, 16, 3);
        std::vector<uint8_t> short_buffer(10);
        auto result = codec.encode(short_buffer, params);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == bitcrush::error_codes::encode_error);
    }

    SECTION("decode rejects empty input") {
        std::vector<uint8_t> empty;
        auto result = codec.decode(empty);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == bitcrush::error_codes::decode_error);
    }

    SECTION("decode rejects garbage after the SOI marker") {
        std::vector<uint8_t> garbage = {0xFF, 0xD8, 0xFF, 0x00, 0x01, 0x02, 0x03};
        auto result = codec.decode(garbage);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == bitcrush::error_codes::decode_error);
    }

    SECTION("decode rejects a truncated stream") {
        auto params = make_params(32, 32, 3);
        auto encoded = codec.encode(create_color_image(32, 32), params);
        REQUIRE(encoded.is_ok());

        std::vector<uint8_t> truncated(encoded.value().data.begin(),
                                       encoded.value().data.begin() + 20);
        auto result = codec.decode(truncated);
        REQUIRE(result.is_err());
    }
}

TEST_CASE("jpeg_codec enforces the decode budget", "[encoding][compression][jpeg][limits]") {
    jpeg_codec codec;
    auto encoded = codec.encode(create_color_image(16, 16), make_params(16, 16, 3));
    REQUIRE(encoded.is_ok());

    auto oversized = bitcrush::test_support::with_jpeg_dimensions(
        encoded.value().data, 60000, 60000);
    auto result = codec.decode(oversized);

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == bitcrush::error_codes::decode_error);
    REQUIRE(result.error().message.find("budget") != std::string::npos);
}
