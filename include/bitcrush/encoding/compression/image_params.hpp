#ifndef BITCRUSH_ENCODING_COMPRESSION_IMAGE_PARAMS_HPP
#define BITCRUSH_ENCODING_COMPRESSION_IMAGE_PARAMS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace bitcrush::encoding::compression {

/**
 * @brief Container formats understood by the codec layer.
 */
enum class image_format {
    jpeg,    ///< JFIF / Exif JPEG
    png,     ///< Portable Network Graphics
    gif,     ///< GIF87a / GIF89a, first frame only
    webp,    ///< Still WebP, lossy or lossless
    tiff,    ///< Baseline TIFF and BigTIFF, first directory only
    bmp,     ///< Windows bitmap
    unknown  ///< Unrecognized signature
};

/**
 * @brief Converts an image format to its lower-case name.
 */
[[nodiscard]] inline std::string to_string(image_format format) {
    switch (format) {
        case image_format::jpeg:
            return "jpeg";
        case image_format::png:
            return "png";
        case image_format::gif:
            return "gif";
        case image_format::webp:
            return "webp";
        case image_format::tiff:
            return "tiff";
        case image_format::bmp:
            return "bmp";
        default:
            return "unknown";
    }
}

/**
 * @brief Returns the MIME content type for a format.
 */
[[nodiscard]] inline std::string content_type(image_format format) {
    switch (format) {
        case image_format::jpeg:
            return "image/jpeg";
        case image_format::png:
            return "image/png";
        case image_format::gif:
            return "image/gif";
        case image_format::webp:
            return "image/webp";
        case image_format::tiff:
            return "image/tiff";
        case image_format::bmp:
            return "image/bmp";
        default:
            return "application/octet-stream";
    }
}

/// Upper bound on the pixel memory a single decode may allocate (512 MiB)
inline constexpr std::uint64_t kMaxDecodedBytes = 512ULL * 1024 * 1024;

/**
 * @brief Checks a pixel buffer size against a byte budget.
 *
 * The product is computed in 64 bits so that header-declared dimensions
 * cannot overflow before the comparison.
 */
[[nodiscard]] inline bool within_pixel_budget(std::uint64_t width, std::uint64_t height,
                                              std::uint64_t bytes_per_pixel,
                                              std::uint64_t budget = kMaxDecodedBytes) noexcept {
    if (width == 0 || height == 0 || bytes_per_pixel == 0) return true;
    if (width > budget / height) return false;
    return width * height <= budget / bytes_per_pixel;
}

/**
 * @brief Parameters describing decoded pixel data.
 *
 * Pixel data handled by bitcrush is always 8 bits per sample and
 * interleaved (R1G1B1R2G2B2... for color).
 */
struct image_params {
    /// Image width in pixels
    uint32_t width{0};

    /// Image height in pixels
    uint32_t height{0};

    /// Number of samples per pixel: 1 for grayscale, 3 for RGB
    uint16_t samples_per_pixel{3};

    /// Bits per sample, always 8
    uint16_t bits_allocated{8};

    /// Largest edge libjpeg accepts (JPEG_MAX_DIMENSION)
    static constexpr uint32_t kMaxJpegDimension = 65500;

    /**
     * @brief Calculates the size of the pixel buffer in bytes.
     */
    [[nodiscard]] size_t frame_size_bytes() const noexcept {
        return static_cast<size_t>(width) * height * samples_per_pixel *
               ((bits_allocated + 7) / 8);
    }

    /**
     * @brief Bytes in one row of pixels.
     */
    [[nodiscard]] size_t row_stride() const noexcept {
        return static_cast<size_t>(width) * samples_per_pixel;
    }

    [[nodiscard]] bool is_grayscale() const noexcept {
        return samples_per_pixel == 1;
    }

    [[nodiscard]] bool is_color() const noexcept {
        return samples_per_pixel > 1;
    }

    /**
     * @brief Checks that dimensions and sample layout are usable at all.
     */
    [[nodiscard]] bool is_valid() const noexcept {
        if (width == 0 || height == 0) return false;
        if (bits_allocated != 8) return false;
        if (samples_per_pixel != 1 && samples_per_pixel != 3) return false;
        return true;
    }

    /**
     * @brief Validates image parameters for baseline JPEG compression.
     *
     * Requirements: 8-bit samples, grayscale or RGB, each edge at most
     * 65500 pixels.
     */
    [[nodiscard]] bool valid_for_jpeg() const noexcept {
        if (!is_valid()) return false;
        if (width > kMaxJpegDimension || height > kMaxJpegDimension) return false;
        return true;
    }

    /**
     * @brief Validates image parameters for PNG compression.
     */
    [[nodiscard]] bool valid_for_png() const noexcept {
        if (!is_valid()) return false;
        if (width > 0x7FFFFFFF || height > 0x7FFFFFFF) return false;
        return true;
    }
};

}  // namespace bitcrush::encoding::compression

#endif  // BITCRUSH_ENCODING_COMPRESSION_IMAGE_PARAMS_HPP
