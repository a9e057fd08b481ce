/**
 * @file pixel_ops.hpp
 * @brief Geometric and color operations on image buffers
 *
 * All operations return a new buffer and leave the input untouched.
 * They accept grayscale and RGB buffers; a buffer whose pixel vector does
 * not match its parameters yields an empty result.
 */

#pragma once

#include "bitcrush/imaging/image_buffer.hpp"

#include <array>
#include <cstdint>

namespace bitcrush::imaging {

/**
 * @brief Resize with nearest-neighbor sampling.
 *
 * Each destination pixel copies the source pixel whose center is closest
 * to the destination pixel center, so no new colors are introduced.
 *
 * @param source Input image
 * @param width Target width, must be non-zero
 * @param height Target height, must be non-zero
 * @return Resized image, or an empty buffer for a zero target size
 */
[[nodiscard]] image_buffer resize_nearest(const image_buffer& source,
                                          std::uint32_t width,
                                          std::uint32_t height);

/**
 * @brief Rotate by 180 degrees (point reflection through the center).
 */
[[nodiscard]] image_buffer rotate_180(const image_buffer& source);

/**
 * @brief Luminance-preserving hue rotation matrix for an angle in degrees.
 *
 * Row-major 3x3 matrix applied to (R, G, B). Every row sums to one, so
 * gray pixels map to themselves.
 */
[[nodiscard]] std::array<double, 9> hue_rotation_matrix(double degrees);

/**
 * @brief Rotate the hue of every pixel by the given angle.
 *
 * Grayscale buffers are returned unchanged. Results are clamped to
 * [0, 255].
 */
[[nodiscard]] image_buffer hue_rotate(const image_buffer& source, double degrees);

} // namespace bitcrush::imaging
