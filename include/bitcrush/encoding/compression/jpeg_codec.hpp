#ifndef BITCRUSH_ENCODING_COMPRESSION_JPEG_CODEC_HPP
#define BITCRUSH_ENCODING_COMPRESSION_JPEG_CODEC_HPP

#include "bitcrush/encoding/compression/compression_codec.hpp"

namespace bitcrush::encoding::compression {

/**
 * @brief Baseline JPEG codec.
 *
 * Uses libjpeg(-turbo) with in-memory source and destination managers.
 *
 * Supported Features:
 * - 8-bit grayscale and RGB input
 * - Quality settings from 1-100
 * - Chroma subsampling (4:4:4, 4:2:2, 4:2:0)
 *
 * Limitations:
 * - Maximum edge length 65500 pixels (libjpeg limit)
 * - CMYK/YCCK streams are rejected on decode
 *
 * Decoding converts YCbCr streams to interleaved RGB.
 */
class jpeg_codec final : public compression_codec {
public:
    jpeg_codec();

    ~jpeg_codec() override;

    jpeg_codec(const jpeg_codec&) = delete;
    jpeg_codec& operator=(const jpeg_codec&) = delete;
    jpeg_codec(jpeg_codec&&) noexcept;
    jpeg_codec& operator=(jpeg_codec&&) noexcept;

    [[nodiscard]] image_format format() const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::string_view mime_type() const noexcept override;
    [[nodiscard]] bool is_lossy() const noexcept override;
    [[nodiscard]] bool can_encode(const image_params& params) const noexcept override;
    [[nodiscard]] bool can_decode(std::span<const uint8_t> data) const noexcept override;

    /**
     * @brief Compresses pixel data to JPEG.
     *
     * Quality mapping:
     * - 100: Highest quality, largest file size
     * - 25: output quality of stored artifacts
     * - 10-29: range used inside the bitcrush passes
     */
    [[nodiscard]] codec_result encode(
        std::span<const uint8_t> pixel_data,
        const image_params& params,
        const compression_options& options = {}) const override;

    [[nodiscard]] codec_result decode(
        std::span<const uint8_t> compressed_data) const override;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace bitcrush::encoding::compression

#endif  // BITCRUSH_ENCODING_COMPRESSION_JPEG_CODEC_HPP
