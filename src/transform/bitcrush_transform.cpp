/**
 * @file bitcrush_transform.cpp
 * @brief Implementation of the bitcrush degradation passes
 */

#include "bitcrush/transform/bitcrush_transform.hpp"
#include "bitcrush/imaging/pixel_ops.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace bitcrush::transform {

using encoding::compression::compression_options;
using imaging::image_buffer;

namespace {

std::uint32_t draw_dimension(random_source& random, std::uint32_t size) {
    const std::uint64_t low = std::max<std::uint64_t>(1, size / 2);
    const std::uint64_t high = std::max<std::uint64_t>(low + 1, std::uint64_t{size} * 2);
    return static_cast<std::uint32_t>(random.uniform(low, high));
}

}  // namespace

bitcrush_transform::bitcrush_transform(std::shared_ptr<random_source> random,
                                       transform_options options)
    : random_(std::move(random)), options_(options) {
    if (!random_) {
        throw std::invalid_argument("bitcrush_transform requires a random source");
    }
    if (options_.min_quality < 1 || options_.max_quality > 101 ||
        options_.min_quality >= options_.max_quality) {
        throw std::invalid_argument("invalid JPEG quality range");
    }
}

intermediate_size bitcrush_transform::choose_intermediate_size(std::uint32_t width,
                                                               std::uint32_t height) const {
    intermediate_size size;
    size.width = draw_dimension(*random_, width);
    size.height = draw_dimension(*random_, height);
    return size;
}

int bitcrush_transform::choose_quality() const {
    return static_cast<int>(random_->uniform(static_cast<std::uint64_t>(options_.min_quality),
                                             static_cast<std::uint64_t>(options_.max_quality)));
}

Result<image_buffer> bitcrush_transform::apply(const image_buffer& source) const {
    if (!source.consistent()) {
        return bitcrush_error<image_buffer>(
            error_codes::invalid_image_params, "Image buffer does not match its parameters",
            std::to_string(source.pixels.size()) + " bytes for " +
                std::to_string(source.width()) + "x" + std::to_string(source.height()));
    }

    // The intermediate size is drawn once and shared by every pass
    const auto temp = choose_intermediate_size(source.width(), source.height());
    if (!encoding::compression::within_pixel_budget(temp.width, temp.height,
                                                    source.params.samples_per_pixel,
                                                    options_.max_intermediate_bytes)) {
        return bitcrush_error<image_buffer>(
            error_codes::encode_error, "Intermediate image exceeds the pixel budget",
            std::to_string(temp.width) + "x" + std::to_string(temp.height));
    }

    image_buffer current = source;
    for (int pass = 0; pass < options_.iterations; ++pass) {
        auto result = run_pass(current, temp);
        if (result.is_err()) {
            return result;
        }
        current = std::move(result.value());
    }
    return ok<image_buffer>(std::move(current));
}

Result<image_buffer> bitcrush_transform::run_pass(const image_buffer& image,
                                                  const intermediate_size& temp) const {
    auto shrunk = imaging::resize_nearest(image, temp.width, temp.height);
    auto flipped = imaging::rotate_180(shrunk);
    auto inverted = imaging::hue_rotate(flipped, options_.hue_degrees);

    compression_options jpeg_options;
    jpeg_options.quality = choose_quality();

    auto encoded = codec_.encode(inverted.view(), inverted.params, jpeg_options);
    if (encoded.is_err()) {
        return encoded.error();
    }

    auto decoded = codec_.decode(encoded.value().data);
    if (decoded.is_err()) {
        return decoded.error();
    }

    image_buffer recompressed(std::move(decoded.value()));
    return ok<image_buffer>(
        imaging::resize_nearest(recompressed, image.width(), image.height()));
}

}  // namespace bitcrush::transform
