/**
 * @file image_buffer.hpp
 * @brief Decoded pixel data together with its layout
 */

#pragma once

#include "bitcrush/encoding/compression/compression_codec.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace bitcrush::imaging {

using encoding::compression::image_params;

/**
 * @struct image_buffer
 * @brief Owning, interleaved 8-bit image
 *
 * pixels.size() always equals params.frame_size_bytes() for buffers
 * produced by the codecs and by the pixel operations.
 */
struct image_buffer {
    image_params params;
    std::vector<std::uint8_t> pixels;

    image_buffer() = default;

    image_buffer(image_params p, std::vector<std::uint8_t> data)
        : params(p), pixels(std::move(data)) {}

    /// Adopt the output of a codec decode
    explicit image_buffer(encoding::compression::compression_result&& decoded)
        : params(decoded.output_params), pixels(std::move(decoded.data)) {}

    [[nodiscard]] std::uint32_t width() const noexcept { return params.width; }
    [[nodiscard]] std::uint32_t height() const noexcept { return params.height; }
    [[nodiscard]] std::uint16_t channels() const noexcept { return params.samples_per_pixel; }

    [[nodiscard]] bool empty() const noexcept { return pixels.empty(); }

    [[nodiscard]] bool consistent() const noexcept {
        return params.is_valid() && pixels.size() == params.frame_size_bytes();
    }

    [[nodiscard]] std::span<const std::uint8_t> view() const noexcept { return pixels; }

    /// Pointer to the first sample of pixel (x, y)
    [[nodiscard]] const std::uint8_t* at(std::uint32_t x, std::uint32_t y) const noexcept {
        return pixels.data() + (static_cast<std::size_t>(y) * params.width + x) * channels();
    }

    [[nodiscard]] std::uint8_t* at(std::uint32_t x, std::uint32_t y) noexcept {
        return pixels.data() + (static_cast<std::size_t>(y) * params.width + x) * channels();
    }
};

} // namespace bitcrush::imaging
