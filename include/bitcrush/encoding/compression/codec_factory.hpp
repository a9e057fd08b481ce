#ifndef BITCRUSH_ENCODING_COMPRESSION_CODEC_FACTORY_HPP
#define BITCRUSH_ENCODING_COMPRESSION_CODEC_FACTORY_HPP

#include "bitcrush/encoding/compression/compression_codec.hpp"

#include <memory>
#include <span>
#include <vector>

namespace bitcrush::encoding::compression {

/**
 * @brief Factory class for creating codec instances.
 *
 * Codecs are selected either by format or by sniffing the leading bytes
 * of an encoded stream. Thread-safe: all factory methods can be called
 * from multiple threads.
 *
 * Usage:
 * @code
 * auto codec = codec_factory::create_for(upload_bytes);
 * if (codec) {
 *     auto result = codec->decode(upload_bytes);
 * }
 * @endcode
 */
class codec_factory {
public:
    /**
     * @brief Creates a codec instance for the given format.
     * @return A codec instance if supported, nullptr otherwise
     */
    [[nodiscard]] static std::unique_ptr<compression_codec> create(image_format format);

    /**
     * @brief Identifies the container format from its signature bytes.
     * @param data Encoded stream (only the first bytes are inspected)
     * @return The detected format, or image_format::unknown
     */
    [[nodiscard]] static image_format detect(std::span<const uint8_t> data) noexcept;

    /**
     * @brief Creates a codec able to decode the given stream.
     * @return A codec instance, or nullptr if the format is not recognized
     */
    [[nodiscard]] static std::unique_ptr<compression_codec> create_for(
        std::span<const uint8_t> data);

    /**
     * @brief Decodes an encoded stream of any supported format.
     * @return Decoded pixels, error_codes::unsupported_format when the
     *         signature is unknown, or the codec's decode error
     */
    [[nodiscard]] static codec_result decode_any(std::span<const uint8_t> data);

    /**
     * @brief Returns all formats with a codec.
     */
    [[nodiscard]] static std::vector<image_format> supported_formats();

private:
    codec_factory() = delete;  // Static-only class
};

}  // namespace bitcrush::encoding::compression

#endif  // BITCRUSH_ENCODING_COMPRESSION_CODEC_FACTORY_HPP
