#include "bitcrush/encoding/compression/bmp_codec.hpp"

#include <bitcrush/core/result.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <string>

namespace bitcrush::encoding::compression {

namespace {

constexpr size_t kFileHeaderSize = 14;
constexpr uint32_t kInfoHeaderSize = 40;

// Compression field values
constexpr uint32_t kBiRgb = 0;
constexpr uint32_t kBiBitfields = 3;

uint16_t read_le16(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

uint32_t read_le32(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

/**
 * @brief One color channel of a 16 or 32-bit bitfield pixel.
 */
struct channel_mask {
    uint32_t mask{0};
    int shift{0};
    uint64_t max{0};

    explicit channel_mask(uint32_t m) : mask(m) {
        if (mask != 0) {
            shift = std::countr_zero(mask);
            max = (uint64_t{1} << std::popcount(mask >> shift)) - 1;
        }
    }

    [[nodiscard]] uint8_t scale(uint32_t value) const {
        if (mask == 0 || max == 0) {
            return 0;
        }
        const uint64_t raw = (value & mask) >> shift;
        return static_cast<uint8_t>(std::min<uint64_t>(raw, max) * 255 / max);
    }
};

codec_result make_decode_error(const std::string& message) {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::decode_error, message);
}

}  // namespace

image_format bmp_codec::format() const noexcept {
    return image_format::bmp;
}

std::string_view bmp_codec::name() const noexcept {
    return "BMP";
}

std::string_view bmp_codec::mime_type() const noexcept {
    return "image/bmp";
}

bool bmp_codec::is_lossy() const noexcept {
    return false;
}

bool bmp_codec::can_encode(const image_params& /*params*/) const noexcept {
    return false;
}

bool bmp_codec::can_decode(std::span<const uint8_t> data) const noexcept {
    return data.size() >= 2 && data[0] == 'B' && data[1] == 'M';
}

codec_result bmp_codec::encode(
    std::span<const uint8_t> /*pixel_data*/,
    const image_params& /*params*/,
    const compression_options& /*options*/) const {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::encode_error, "BMP encoding is not supported");
}

codec_result bmp_codec::decode(std::span<const uint8_t> data) const {
    if (!can_decode(data)) {
        return make_decode_error("Missing BMP signature");
    }
    if (data.size() < kFileHeaderSize + kInfoHeaderSize) {
        return make_decode_error("BMP headers are truncated");
    }

    const uint32_t pixel_offset = read_le32(data, 10);
    const uint32_t header_size = read_le32(data, 14);
    if (header_size < kInfoHeaderSize || kFileHeaderSize + header_size > data.size()) {
        return make_decode_error("Unsupported BMP info header size: " +
                                 std::to_string(header_size));
    }

    const auto width = static_cast<int32_t>(read_le32(data, 18));
    const auto raw_height = static_cast<int32_t>(read_le32(data, 22));
    const uint16_t bits = read_le16(data, 28);
    const uint32_t compression = read_le32(data, 30);
    const uint32_t colors_used = read_le32(data, 46);

    if (width <= 0 || raw_height == 0) {
        return make_decode_error("BMP has no pixels");
    }

    // A negative height marks top-down row order
    const bool top_down = raw_height < 0;
    const uint64_t height = top_down ? static_cast<uint64_t>(-static_cast<int64_t>(raw_height))
                                     : static_cast<uint64_t>(raw_height);
    if (height > 0x7FFFFFFF) {
        return make_decode_error("BMP height out of range");
    }

    if (!within_pixel_budget(static_cast<uint64_t>(width), height, 3)) {
        return make_decode_error("BMP exceeds the decode budget: " + std::to_string(width) +
                                 "x" + std::to_string(height));
    }

    if (bits != 1 && bits != 4 && bits != 8 && bits != 16 && bits != 24 && bits != 32) {
        return make_decode_error("Unsupported BMP bit depth: " + std::to_string(bits));
    }
    if (compression != kBiRgb &&
        !(compression == kBiBitfields && (bits == 16 || bits == 32))) {
        return make_decode_error("Unsupported BMP compression: " + std::to_string(compression));
    }

    // Palette for indexed images, stored as B, G, R, reserved
    std::vector<std::array<uint8_t, 3>> palette;
    if (bits <= 8) {
        const uint32_t max_colors = 1u << bits;
        const uint32_t count =
            colors_used == 0 ? max_colors : std::min(colors_used, max_colors);
        const size_t palette_offset = kFileHeaderSize + header_size;
        if (palette_offset + static_cast<size_t>(count) * 4 > data.size()) {
            return make_decode_error("BMP palette is truncated");
        }
        palette.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            const size_t entry = palette_offset + static_cast<size_t>(i) * 4;
            palette.push_back({data[entry + 2], data[entry + 1], data[entry]});
        }
    }

    // Bitfield masks follow the 40-byte header (or sit inside V4/V5 headers)
    uint32_t red_mask = 0;
    uint32_t green_mask = 0;
    uint32_t blue_mask = 0;
    if (compression == kBiBitfields) {
        const size_t mask_offset = kFileHeaderSize + kInfoHeaderSize;
        if (mask_offset + 12 > data.size()) {
            return make_decode_error("BMP bitfield masks are truncated");
        }
        red_mask = read_le32(data, mask_offset);
        green_mask = read_le32(data, mask_offset + 4);
        blue_mask = read_le32(data, mask_offset + 8);
    } else if (bits == 16) {
        red_mask = 0x7C00;
        green_mask = 0x03E0;
        blue_mask = 0x001F;
    } else if (bits == 32) {
        red_mask = 0x00FF0000;
        green_mask = 0x0000FF00;
        blue_mask = 0x000000FF;
    }
    const channel_mask red(red_mask);
    const channel_mask green(green_mask);
    const channel_mask blue(blue_mask);

    // Rows are padded to 4 bytes
    const uint64_t row_bytes = ((static_cast<uint64_t>(width) * bits + 31) / 32) * 4;
    if (pixel_offset > data.size() || row_bytes * height > data.size() - pixel_offset) {
        return make_decode_error("BMP pixel data is truncated");
    }

    image_params params;
    params.width = static_cast<uint32_t>(width);
    params.height = static_cast<uint32_t>(height);
    params.samples_per_pixel = 3;
    params.bits_allocated = 8;

    std::vector<uint8_t> output(params.frame_size_bytes());

    for (uint32_t y = 0; y < params.height; ++y) {
        const uint64_t stored_row = top_down ? y : params.height - 1 - y;
        const size_t row = pixel_offset + static_cast<size_t>(stored_row * row_bytes);
        uint8_t* out = output.data() + static_cast<size_t>(y) * params.row_stride();

        for (uint32_t x = 0; x < params.width; ++x, out += 3) {
            switch (bits) {
                case 1:
                case 4:
                case 8: {
                    const size_t bit = static_cast<size_t>(x) * bits;
                    const uint8_t byte = data[row + bit / 8];
                    const uint32_t index =
                        (byte >> (8 - bits - (bit % 8))) & ((1u << bits) - 1);
                    if (index < palette.size()) {
                        std::copy(palette[index].begin(), palette[index].end(), out);
                    } else {
                        std::fill(out, out + 3, 0);
                    }
                    break;
                }
                case 24: {
                    const size_t offset = row + static_cast<size_t>(x) * 3;
                    out[0] = data[offset + 2];
                    out[1] = data[offset + 1];
                    out[2] = data[offset];
                    break;
                }
                default: {
                    const size_t offset = row + static_cast<size_t>(x) * (bits / 8);
                    const uint32_t value =
                        bits == 16 ? read_le16(data, offset) : read_le32(data, offset);
                    out[0] = red.scale(value);
                    out[1] = green.scale(value);
                    out[2] = blue.scale(value);
                    break;
                }
            }
        }
    }

    return bitcrush::ok<compression_result>(compression_result{std::move(output), params});
}

}  // namespace bitcrush::encoding::compression
