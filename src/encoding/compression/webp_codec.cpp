#include "bitcrush/encoding/compression/webp_codec.hpp"

#include <bitcrush/core/result.hpp>

#include <string>

#include <webp/decode.h>

namespace bitcrush::encoding::compression {

namespace {

codec_result make_decode_error(const std::string& message) {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::decode_error, message);
}

}  // namespace

image_format webp_codec::format() const noexcept {
    return image_format::webp;
}

std::string_view webp_codec::name() const noexcept {
    return "WebP";
}

std::string_view webp_codec::mime_type() const noexcept {
    return "image/webp";
}

bool webp_codec::is_lossy() const noexcept {
    return true;
}

bool webp_codec::can_encode(const image_params& /*params*/) const noexcept {
    return false;
}

bool webp_codec::can_decode(std::span<const uint8_t> data) const noexcept {
    // RIFF container with a WEBP form type
    return data.size() >= 12 &&
           data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' &&
           data[8] == 'W' && data[9] == 'E' && data[10] == 'B' && data[11] == 'P';
}

codec_result webp_codec::encode(
    std::span<const uint8_t> /*pixel_data*/,
    const image_params& /*params*/,
    const compression_options& /*options*/) const {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::encode_error, "WebP encoding is not supported");
}

codec_result webp_codec::decode(std::span<const uint8_t> compressed_data) const {
    if (!can_decode(compressed_data)) {
        return make_decode_error("Missing WebP signature");
    }

    WebPBitstreamFeatures features;
    const VP8StatusCode status =
        WebPGetFeatures(compressed_data.data(), compressed_data.size(), &features);
    if (status != VP8_STATUS_OK) {
        return make_decode_error("Invalid WebP bitstream (status " +
                                 std::to_string(static_cast<int>(status)) + ")");
    }
    if (features.has_animation) {
        return make_decode_error("Animated WebP is not supported");
    }
    if (features.width <= 0 || features.height <= 0) {
        return make_decode_error("WebP image is empty");
    }

    image_params params;
    params.width = static_cast<uint32_t>(features.width);
    params.height = static_cast<uint32_t>(features.height);
    params.samples_per_pixel = 3;
    params.bits_allocated = 8;

    if (!within_pixel_budget(params.width, params.height, params.samples_per_pixel)) {
        return make_decode_error("WebP exceeds the decode budget: " +
                                 std::to_string(params.width) + "x" +
                                 std::to_string(params.height));
    }

    std::vector<uint8_t> output(params.frame_size_bytes());
    const uint8_t* decoded = WebPDecodeRGBInto(
        compressed_data.data(), compressed_data.size(), output.data(), output.size(),
        static_cast<int>(params.row_stride()));
    if (decoded == nullptr) {
        return make_decode_error("WebP decompression failed");
    }

    return bitcrush::ok<compression_result>(compression_result{std::move(output), params});
}

}  // namespace bitcrush::encoding::compression
