/**
 * @file pixel_ops.cpp
 * @brief Implementation of geometric and color operations
 */

#include "bitcrush/imaging/pixel_ops.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numbers>
#include <vector>

namespace bitcrush::imaging {

namespace {

/// Source index for nearest-neighbor sampling along one axis
std::uint32_t nearest_source_index(std::uint32_t dst, std::uint32_t dst_size,
                                   std::uint32_t src_size) noexcept {
    const double position = (static_cast<double>(dst) + 0.5) *
                            static_cast<double>(src_size) /
                            static_cast<double>(dst_size);
    const auto index = static_cast<std::uint32_t>(std::floor(position));
    return std::min(index, src_size - 1);
}

std::uint8_t clamp_to_byte(double value) noexcept {
    return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

}  // namespace

image_buffer resize_nearest(const image_buffer& source,
                            std::uint32_t width,
                            std::uint32_t height) {
    if (width == 0 || height == 0 || !source.consistent()) {
        return {};
    }

    image_params params = source.params;
    params.width = width;
    params.height = height;

    const std::size_t channels = source.channels();
    std::vector<std::uint8_t> pixels(params.frame_size_bytes());

    // Column lookup is shared by every row
    std::vector<std::uint32_t> columns(width);
    for (std::uint32_t x = 0; x < width; ++x) {
        columns[x] = nearest_source_index(x, width, source.width());
    }

    auto* out = pixels.data();
    for (std::uint32_t y = 0; y < height; ++y) {
        const auto src_y = nearest_source_index(y, height, source.height());
        for (std::uint32_t x = 0; x < width; ++x) {
            std::memcpy(out, source.at(columns[x], src_y), channels);
            out += channels;
        }
    }

    return image_buffer(params, std::move(pixels));
}

image_buffer rotate_180(const image_buffer& source) {
    if (!source.consistent()) {
        return {};
    }

    const std::size_t channels = source.channels();
    const std::size_t pixel_count =
        static_cast<std::size_t>(source.width()) * source.height();
    std::vector<std::uint8_t> pixels(source.pixels.size());

    // Pixel i of the output is pixel (count - 1 - i) of the input
    for (std::size_t i = 0; i < pixel_count; ++i) {
        std::memcpy(pixels.data() + i * channels,
                    source.pixels.data() + (pixel_count - 1 - i) * channels,
                    channels);
    }

    return image_buffer(source.params, std::move(pixels));
}

std::array<double, 9> hue_rotation_matrix(double degrees) {
    const double radians = degrees * std::numbers::pi / 180.0;
    const double c = std::cos(radians);
    const double s = std::sin(radians);

    return {{
        0.213 + c * 0.787 - s * 0.213,
        0.715 - c * 0.715 - s * 0.715,
        0.072 - c * 0.072 + s * 0.928,

        0.213 - c * 0.213 + s * 0.143,
        0.715 + c * 0.285 + s * 0.140,
        0.072 - c * 0.072 - s * 0.283,

        0.213 - c * 0.213 - s * 0.787,
        0.715 - c * 0.715 + s * 0.715,
        0.072 + c * 0.928 + s * 0.072,
    }};
}

image_buffer hue_rotate(const image_buffer& source, double degrees) {
    if (!source.consistent()) {
        return {};
    }
    if (source.params.is_grayscale()) {
        return source;
    }

    const auto m = hue_rotation_matrix(degrees);
    std::vector<std::uint8_t> pixels(source.pixels.size());

    for (std::size_t i = 0; i + 2 < source.pixels.size(); i += 3) {
        const double r = source.pixels[i];
        const double g = source.pixels[i + 1];
        const double b = source.pixels[i + 2];

        pixels[i] = clamp_to_byte(m[0] * r + m[1] * g + m[2] * b);
        pixels[i + 1] = clamp_to_byte(m[3] * r + m[4] * g + m[5] * b);
        pixels[i + 2] = clamp_to_byte(m[6] * r + m[7] * g + m[8] * b);
    }

    return image_buffer(source.params, std::move(pixels));
}

}  // namespace bitcrush::imaging
