#include <catch2/catch_test_macros.hpp>

#include "bitcrush/encoding/compression/codec_factory.hpp"
#include "bitcrush/encoding/compression/jpeg_codec.hpp"
#include "bitcrush/encoding/compression/png_codec.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace bitcrush::encoding::compression;

namespace {

image_params rgb_params(uint32_t width, uint32_t height) {
    image_params params;
    params.width = width;
    params.height = height;
    params.samples_per_pixel = 3;
    return params;
}

std::vector<uint8_t> flat_pixels(uint32_t width, uint32_t height, uint8_t value) {
    return std::vector<uint8_t>(static_cast<size_t>(width) * height * 3, value);
}

}  // namespace

TEST_CASE("codec_factory creates codecs by format", "[encoding][compression][factory]") {
    SECTION("jpeg") {
        auto codec = codec_factory::create(image_format::jpeg);
        REQUIRE(codec != nullptr);
        REQUIRE(codec->format() == image_format::jpeg);
    }

    SECTION("png") {
        auto codec = codec_factory::create(image_format::png);
        REQUIRE(codec != nullptr);
        REQUIRE(codec->format() == image_format::png);
    }

    SECTION("decode-only formats") {
        for (auto format : {image_format::gif, image_format::webp, image_format::tiff,
                            image_format::bmp}) {
            auto codec = codec_factory::create(format);
            REQUIRE(codec != nullptr);
            REQUIRE(codec->format() == format);
            REQUIRE_FALSE(codec->can_encode(rgb_params(8, 8)));
        }
    }

    SECTION("unknown") {
        REQUIRE(codec_factory::create(image_format::unknown) == nullptr);
    }
}

TEST_CASE("codec_factory lists supported formats", "[encoding][compression][factory]") {
    auto formats = codec_factory::supported_formats();

    REQUIRE(formats.size() == 6);
    for (auto format : {image_format::jpeg, image_format::png, image_format::gif,
                        image_format::webp, image_format::tiff, image_format::bmp}) {
        REQUIRE(std::find(formats.begin(), formats.end(), format) != formats.end());
    }
}

TEST_CASE("codec_factory detects formats by signature", "[encoding][compression][factory]") {
    auto jpeg = jpeg_codec{}.encode(flat_pixels(8, 8, 100), rgb_params(8, 8));
    auto png = png_codec{}.encode(flat_pixels(8, 8, 100), rgb_params(8, 8));
    REQUIRE(jpeg.is_ok());
    REQUIRE(png.is_ok());

    REQUIRE(codec_factory::detect(jpeg.value().data) == image_format::jpeg);
    REQUIRE(codec_factory::detect(png.value().data) == image_format::png);

    std::string text = "this is definitely not an image";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    REQUIRE(codec_factory::detect(bytes) == image_format::unknown);
    REQUIRE(codec_factory::create_for(bytes) == nullptr);

    std::vector<uint8_t> empty;
    REQUIRE(codec_factory::detect(empty) == image_format::unknown);

    SECTION("other container signatures") {
        std::vector<uint8_t> gif87 = {'G', 'I', 'F', '8', '7', 'a', 1, 0};
        std::vector<uint8_t> gif89 = {'G', 'I', 'F', '8', '9', 'a', 1, 0};
        std::vector<uint8_t> webp = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'};
        std::vector<uint8_t> wave = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
        std::vector<uint8_t> tiff_le = {'I', 'I', 42, 0, 8, 0, 0, 0};
        std::vector<uint8_t> tiff_be = {'M', 'M', 0, 42, 0, 0, 0, 8};
        std::vector<uint8_t> bigtiff = {'I', 'I', 43, 0, 8, 0, 0, 0};
        std::vector<uint8_t> bmp = {'B', 'M', 0, 0, 0, 0};

        REQUIRE(codec_factory::detect(gif87) == image_format::gif);
        REQUIRE(codec_factory::detect(gif89) == image_format::gif);
        REQUIRE(codec_factory::detect(webp) == image_format::webp);
        REQUIRE(codec_factory::detect(wave) == image_format::unknown);
        REQUIRE(codec_factory::detect(tiff_le) == image_format::tiff);
        REQUIRE(codec_factory::detect(tiff_be) == image_format::tiff);
        REQUIRE(codec_factory::detect(bigtiff) == image_format::tiff);
        REQUIRE(codec_factory::detect(bmp) == image_format::bmp);
    }
}

TEST_CASE("codec_factory::decode_any", "[encoding][compression][factory]") {
    SECTION("decodes PNG input") {
        auto png = png_codec{}.encode(flat_pixels(12, 6, 200), rgb_params(12, 6));
        REQUIRE(png.is_ok());

        auto decoded = codec_factory::decode_any(png.value().data);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().output_params.width == 12);
        REQUIRE(decoded.value().output_params.height == 6);
    }

    SECTION("decodes JPEG input") {
        auto jpeg = jpeg_codec{}.encode(flat_pixels(16, 16, 50), rgb_params(16, 16));
        REQUIRE(jpeg.is_ok());

        auto decoded = codec_factory::decode_any(jpeg.value().data);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().output_params.width == 16);
    }

    SECTION("unrecognized data is an unsupported format") {
        std::vector<uint8_t> bytes = {'P', 'K', 3, 4, 20, 0, 0, 0};
        auto decoded = codec_factory::decode_any(bytes);
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().code == bitcrush::error_codes::unsupported_format);
    }

    SECTION("a valid signature with a broken body is a decode error") {
        std::vector<uint8_t> bytes = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 0, 0, 0};
        auto decoded = codec_factory::decode_any(bytes);
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().code == bitcrush::error_codes::decode_error);
    }

    SECTION("a truncated GIF is a decode error") {
        std::vector<uint8_t> bytes = {'G', 'I', 'F', '8', '9', 'a', 1, 0};
        auto decoded = codec_factory::decode_any(bytes);
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().code == bitcrush::error_codes::decode_error);
    }
}

TEST_CASE("image_format helpers", "[encoding][compression]") {
    REQUIRE(to_string(image_format::jpeg) == "jpeg");
    REQUIRE(to_string(image_format::png) == "png");
    REQUIRE(to_string(image_format::webp) == "webp");
    REQUIRE(to_string(image_format::bmp) == "bmp");
    REQUIRE(content_type(image_format::jpeg) == "image/jpeg");
    REQUIRE(content_type(image_format::gif) == "image/gif");
    REQUIRE(content_type(image_format::tiff) == "image/tiff");
    REQUIRE(content_type(image_format::unknown) == "application/octet-stream");
}
