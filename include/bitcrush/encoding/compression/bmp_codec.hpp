#ifndef BITCRUSH_ENCODING_COMPRESSION_BMP_CODEC_HPP
#define BITCRUSH_ENCODING_COMPRESSION_BMP_CODEC_HPP

#include "bitcrush/encoding/compression/compression_codec.hpp"

namespace bitcrush::encoding::compression {

/**
 * @brief Windows bitmap decoder.
 *
 * Handles BITMAPINFOHEADER and its V4/V5 extensions with 1, 4, 8, 16, 24
 * or 32 bits per pixel, uncompressed or BI_BITFIELDS. RLE-compressed
 * bitmaps are rejected. Bottom-up and top-down row orders are both
 * supported.
 */
class bmp_codec final : public compression_codec {
public:
    bmp_codec() = default;
    ~bmp_codec() override = default;

    [[nodiscard]] image_format format() const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::string_view mime_type() const noexcept override;
    [[nodiscard]] bool is_lossy() const noexcept override;
    [[nodiscard]] bool can_encode(const image_params& params) const noexcept override;
    [[nodiscard]] bool can_decode(std::span<const uint8_t> data) const noexcept override;

    [[nodiscard]] codec_result encode(
        std::span<const uint8_t> pixel_data,
        const image_params& params,
        const compression_options& options = {}) const override;

    [[nodiscard]] codec_result decode(
        std::span<const uint8_t> compressed_data) const override;
};

}  // namespace bitcrush::encoding::compression

#endif  // BITCRUSH_ENCODING_COMPRESSION_BMP_CODEC_HPP
