#ifndef BITCRUSH_ENCODING_COMPRESSION_GIF_CODEC_HPP
#define BITCRUSH_ENCODING_COMPRESSION_GIF_CODEC_HPP

#include "bitcrush/encoding/compression/compression_codec.hpp"

namespace bitcrush::encoding::compression {

/**
 * @brief GIF decoder using giflib.
 *
 * Only the first frame is decoded. It is composited over the logical
 * screen filled with the background color; transparency is ignored.
 * Encoding is not supported.
 */
class gif_codec final : public compression_codec {
public:
    gif_codec() = default;
    ~gif_codec() override = default;

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

#endif  // BITCRUSH_ENCODING_COMPRESSION_GIF_CODEC_HPP
