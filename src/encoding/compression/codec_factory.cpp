#include "bitcrush/encoding/compression/codec_factory.hpp"
#include "bitcrush/encoding/compression/bmp_codec.hpp"
#include "bitcrush/encoding/compression/gif_codec.hpp"
#include "bitcrush/encoding/compression/jpeg_codec.hpp"
#include "bitcrush/encoding/compression/png_codec.hpp"
#include "bitcrush/encoding/compression/tiff_codec.hpp"
#include "bitcrush/encoding/compression/webp_codec.hpp"

#include <array>

namespace bitcrush::encoding::compression {

namespace {

static constexpr std::array<image_format, 6> kSupportedFormats = {{
    image_format::jpeg,
    image_format::png,
    image_format::gif,
    image_format::webp,
    image_format::tiff,
    image_format::bmp,
}};

}  // namespace

std::unique_ptr<compression_codec> codec_factory::create(image_format format) {
    switch (format) {
        case image_format::jpeg:
            return std::make_unique<jpeg_codec>();
        case image_format::png:
            return std::make_unique<png_codec>();
        case image_format::gif:
            return std::make_unique<gif_codec>();
        case image_format::webp:
            return std::make_unique<webp_codec>();
        case image_format::tiff:
            return std::make_unique<tiff_codec>();
        case image_format::bmp:
            return std::make_unique<bmp_codec>();
        default:
            return nullptr;
    }
}

image_format codec_factory::detect(std::span<const uint8_t> data) noexcept {
    if (jpeg_codec{}.can_decode(data)) {
        return image_format::jpeg;
    }
    if (png_codec{}.can_decode(data)) {
        return image_format::png;
    }
    if (gif_codec{}.can_decode(data)) {
        return image_format::gif;
    }
    if (webp_codec{}.can_decode(data)) {
        return image_format::webp;
    }
    if (tiff_codec{}.can_decode(data)) {
        return image_format::tiff;
    }
    // Two-byte signature, checked last
    if (bmp_codec{}.can_decode(data)) {
        return image_format::bmp;
    }
    return image_format::unknown;
}

std::unique_ptr<compression_codec> codec_factory::create_for(
    std::span<const uint8_t> data) {
    return create(detect(data));
}

codec_result codec_factory::decode_any(std::span<const uint8_t> data) {
    auto codec = create_for(data);
    if (!codec) {
        return bitcrush::bitcrush_error<compression_result>(
            bitcrush::error_codes::unsupported_format,
            "Unrecognized image format",
            "signature did not match JPEG, PNG, GIF, WebP, TIFF or BMP (" +
                std::to_string(data.size()) + " bytes)");
    }
    return codec->decode(data);
}

std::vector<image_format> codec_factory::supported_formats() {
    return {kSupportedFormats.begin(), kSupportedFormats.end()};
}

}  // namespace bitcrush::encoding::compression
