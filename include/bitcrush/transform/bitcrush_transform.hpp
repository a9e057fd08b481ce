/**
 * @file bitcrush_transform.hpp
 * @brief Randomized lossy degradation of decoded images
 *
 * The transform runs a fixed number of passes over an image. Each pass
 * resizes it to a randomly chosen intermediate size, rotates it by 180
 * degrees, inverts its hue, round-trips it through a low-quality JPEG
 * encode, and resizes it back. The output always has the dimensions of
 * the input.
 */

#pragma once

#include "bitcrush/core/random_source.hpp"
#include "bitcrush/core/result.hpp"
#include "bitcrush/encoding/compression/jpeg_codec.hpp"
#include "bitcrush/imaging/image_buffer.hpp"

#include <cstdint>
#include <memory>

namespace bitcrush::transform {

/**
 * @struct transform_options
 * @brief Tunables of the degradation passes
 */
struct transform_options {
    /// Number of resize/rotate/hue/recompress passes
    int iterations = 2;

    /// Hue rotation applied in every pass, in degrees
    double hue_degrees = 180.0;

    /// Inclusive lower bound of the per-pass JPEG quality
    int min_quality = 10;

    /// Exclusive upper bound of the per-pass JPEG quality
    int max_quality = 30;

    /// Largest pixel buffer an intermediate image may occupy
    std::uint64_t max_intermediate_bytes = encoding::compression::kMaxDecodedBytes;
};

/**
 * @struct intermediate_size
 * @brief Dimensions every pass resizes to before recompression
 */
struct intermediate_size {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
};

/**
 * @class bitcrush_transform
 * @brief Executes the bitcrush algorithm
 *
 * Thread Safety: apply() may be called concurrently provided the
 * random_source is thread safe (every bundled source is).
 *
 * @par Example
 * @code
 * bitcrush_transform crush(make_default_random_source());
 * auto degraded = crush.apply(decoded);
 * if (degraded.is_ok()) {
 *     // degraded.value() has the dimensions of decoded
 * }
 * @endcode
 */
class bitcrush_transform {
public:
    explicit bitcrush_transform(std::shared_ptr<random_source> random,
                                transform_options options = {});

    /**
     * @brief Degrade an image
     * @param source Decoded grayscale or RGB image
     * @return Degraded image of identical dimensions, or
     *         error_codes::invalid_image_params for an inconsistent buffer,
     *         error_codes::encode_error when the intermediate image would
     *         exceed max_intermediate_bytes or a JPEG pass cannot encode,
     *         error_codes::decode_error when a pass cannot decode
     */
    [[nodiscard]] Result<imaging::image_buffer> apply(const imaging::image_buffer& source) const;

    /**
     * @brief Draw the intermediate size for an image of the given size
     *
     * width is drawn from [max(1, w/2), 2w), height from [max(1, h/2), 2h).
     */
    [[nodiscard]] intermediate_size choose_intermediate_size(std::uint32_t width,
                                                             std::uint32_t height) const;

    /// Draw a JPEG quality for one pass
    [[nodiscard]] int choose_quality() const;

    [[nodiscard]] const transform_options& options() const noexcept { return options_; }

private:
    [[nodiscard]] Result<imaging::image_buffer> run_pass(const imaging::image_buffer& image,
                                                         const intermediate_size& temp) const;

    std::shared_ptr<random_source> random_;
    transform_options options_;
    encoding::compression::jpeg_codec codec_;
};

} // namespace bitcrush::transform
