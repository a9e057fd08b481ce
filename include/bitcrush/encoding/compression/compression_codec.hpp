#ifndef BITCRUSH_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP
#define BITCRUSH_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP

#include "bitcrush/encoding/compression/image_params.hpp"
#include <bitcrush/core/result.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bitcrush::encoding::compression {

/**
 * @brief Compression settings for encoders.
 */
struct compression_options {
    /// Quality setting (1-100, JPEG only)
    int quality{75};

    /// Chroma subsampling for color JPEG images
    /// 0 = 4:4:4, 1 = 4:2:2, 2 = 4:2:0 (default)
    int chroma_subsampling{2};

    /// zlib compression level (0-9, PNG only, -1 = library default)
    int png_compression_level{-1};
};

/**
 * @brief Successful result of a compression/decompression operation.
 *
 * Encoding fills data with the compressed stream; decoding fills it with
 * interleaved 8-bit pixels described by output_params.
 */
struct compression_result {
    /// Processed data
    std::vector<uint8_t> data;

    /// Image parameters of the pixel data
    image_params output_params;
};

/**
 * @brief Result type alias for compression operations
 */
using codec_result = bitcrush::Result<compression_result>;

/**
 * @brief Abstract base class for image codecs.
 *
 * Implementations wrap external libraries (libjpeg, libpng).
 *
 * Thread Safety:
 * - Codec instances hold no mutable state; encode() and decode() may be
 *   called concurrently on the same instance.
 */
class compression_codec {
public:
    virtual ~compression_codec() = default;

    /// @name Codec Information
    /// @{

    /**
     * @brief Returns the container format handled by this codec.
     */
    [[nodiscard]] virtual image_format format() const noexcept = 0;

    /**
     * @brief Returns a human-readable name for the codec.
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Returns the MIME type of encoded output.
     */
    [[nodiscard]] virtual std::string_view mime_type() const noexcept = 0;

    /**
     * @brief Checks if this codec produces lossy compression.
     */
    [[nodiscard]] virtual bool is_lossy() const noexcept = 0;

    /**
     * @brief Checks if this codec can encode pixels with these parameters.
     */
    [[nodiscard]] virtual bool can_encode(const image_params& params) const noexcept = 0;

    /**
     * @brief Checks whether the data starts with this codec's signature.
     */
    [[nodiscard]] virtual bool can_decode(std::span<const uint8_t> data) const noexcept = 0;

    /// @}

    /// @name Compression Operations
    /// @{

    /**
     * @brief Compresses interleaved 8-bit pixel data.
     *
     * @param pixel_data Raw pixel data, params.frame_size_bytes() long
     * @param params Image parameters describing the pixel data
     * @param options Compression settings
     * @return codec_result with the encoded stream, or an
     *         error_codes::encode_error
     */
    [[nodiscard]] virtual codec_result encode(
        std::span<const uint8_t> pixel_data,
        const image_params& params,
        const compression_options& options = {}) const = 0;

    /**
     * @brief Decompresses an encoded stream.
     *
     * @param compressed_data The complete encoded file
     * @return codec_result with interleaved grayscale or RGB pixels, or an
     *         error_codes::decode_error
     */
    [[nodiscard]] virtual codec_result decode(
        std::span<const uint8_t> compressed_data) const = 0;

    /// @}

protected:
    compression_codec() = default;
    compression_codec(const compression_codec&) = default;
    compression_codec& operator=(const compression_codec&) = default;
    compression_codec(compression_codec&&) = default;
    compression_codec& operator=(compression_codec&&) = default;
};

}  // namespace bitcrush::encoding::compression

#endif  // BITCRUSH_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP
