#include "bitcrush/encoding/compression/png_codec.hpp"

#include <bitcrush/core/result.hpp>

#include <algorithm>
#include <array>
#include <csetjmp>
#include <cstring>
#include <string>

#include <png.h>

namespace bitcrush::encoding::compression {

namespace {

constexpr std::array<uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

/**
 * @brief Error state shared with the libpng callbacks.
 */
struct png_error_state {
    std::string message;
};

void png_error_callback(png_structp png_ptr, png_const_charp message) {
    auto* state = static_cast<png_error_state*>(png_get_error_ptr(png_ptr));
    if (state != nullptr && message != nullptr) {
        state->message = message;
    }
    png_longjmp(png_ptr, 1);
}

void png_warning_callback(png_structp /*png_ptr*/, png_const_charp /*message*/) {}

/**
 * @brief Read cursor over an in-memory PNG stream.
 */
struct png_mem_reader {
    const uint8_t* data{nullptr};
    size_t size{0};
    size_t offset{0};
};

void png_read_callback(png_structp png_ptr, png_bytep out, png_size_t length) {
    auto* reader = static_cast<png_mem_reader*>(png_get_io_ptr(png_ptr));
    if (reader->offset + length > reader->size) {
        png_error(png_ptr, "Read past end of PNG data");
    }
    std::memcpy(out, reader->data + reader->offset, length);
    reader->offset += length;
}

struct png_mem_writer {
    std::vector<uint8_t> data;
};

void png_write_callback(png_structp png_ptr, png_bytep data, png_size_t length) {
    auto* writer = static_cast<png_mem_writer*>(png_get_io_ptr(png_ptr));
    writer->data.insert(writer->data.end(), data, data + length);
}

void png_flush_callback(png_structp /*png_ptr*/) {}

/**
 * @brief RAII owner of a libpng read struct and its info struct.
 */
class png_reader {
public:
    explicit png_reader(png_error_state* state) {
        png_ = png_create_read_struct(PNG_LIBPNG_VER_STRING, state,
                                      png_error_callback, png_warning_callback);
        if (png_ != nullptr) {
            info_ = png_create_info_struct(png_);
        }
    }

    ~png_reader() {
        if (png_ != nullptr) {
            png_destroy_read_struct(&png_, info_ != nullptr ? &info_ : nullptr, nullptr);
        }
    }

    png_reader(const png_reader&) = delete;
    png_reader& operator=(const png_reader&) = delete;

    [[nodiscard]] bool valid() const { return png_ != nullptr && info_ != nullptr; }
    png_structp png() { return png_; }
    png_infop info() { return info_; }

private:
    png_structp png_{nullptr};
    png_infop info_{nullptr};
};

/**
 * @brief RAII owner of a libpng write struct and its info struct.
 */
class png_writer {
public:
    explicit png_writer(png_error_state* state) {
        png_ = png_create_write_struct(PNG_LIBPNG_VER_STRING, state,
                                       png_error_callback, png_warning_callback);
        if (png_ != nullptr) {
            info_ = png_create_info_struct(png_);
        }
    }

    ~png_writer() {
        if (png_ != nullptr) {
            png_destroy_write_struct(&png_, info_ != nullptr ? &info_ : nullptr);
        }
    }

    png_writer(const png_writer&) = delete;
    png_writer& operator=(const png_writer&) = delete;

    [[nodiscard]] bool valid() const { return png_ != nullptr && info_ != nullptr; }
    png_structp png() { return png_; }
    png_infop info() { return info_; }

private:
    png_structp png_{nullptr};
    png_infop info_{nullptr};
};

codec_result make_encode_error(const std::string& message) {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::encode_error, message);
}

codec_result make_decode_error(const std::string& message) {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::decode_error, message);
}

}  // namespace

image_format png_codec::format() const noexcept {
    return image_format::png;
}

std::string_view png_codec::name() const noexcept {
    return "PNG";
}

std::string_view png_codec::mime_type() const noexcept {
    return "image/png";
}

bool png_codec::is_lossy() const noexcept {
    return false;
}

bool png_codec::can_encode(const image_params& params) const noexcept {
    return params.valid_for_png();
}

bool png_codec::can_decode(std::span<const uint8_t> data) const noexcept {
    return data.size() >= kPngSignature.size() &&
           std::equal(kPngSignature.begin(), kPngSignature.end(), data.begin());
}

codec_result png_codec::encode(
    std::span<const uint8_t> pixel_data,
    const image_params& params,
    const compression_options& options) const {

    if (!params.valid_for_png()) {
        return make_encode_error("Invalid parameters for PNG");
    }
    if (pixel_data.size() != params.frame_size_bytes()) {
        return make_encode_error(
            "Pixel data size mismatch: expected " +
            std::to_string(params.frame_size_bytes()) + ", got " +
            std::to_string(pixel_data.size()));
    }

    png_error_state state;
    png_mem_writer buffer;
    png_writer writer(&state);
    if (!writer.valid()) {
        return make_encode_error("Failed to create PNG write struct");
    }

    if (setjmp(png_jmpbuf(writer.png()))) {
        return make_encode_error("PNG compression failed: " + state.message);
    }

    png_set_write_fn(writer.png(), &buffer, png_write_callback, png_flush_callback);

    if (options.png_compression_level >= 0) {
        png_set_compression_level(writer.png(), std::min(options.png_compression_level, 9));
    }

    int color_type = params.is_grayscale() ? PNG_COLOR_TYPE_GRAY : PNG_COLOR_TYPE_RGB;
    png_set_IHDR(writer.png(), writer.info(), params.width, params.height, 8, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);

    png_write_info(writer.png(), writer.info());

    const size_t row_stride = params.row_stride();
    for (uint32_t y = 0; y < params.height; ++y) {
        png_write_row(writer.png(),
                      const_cast<png_bytep>(pixel_data.data() + y * row_stride));
    }

    png_write_end(writer.png(), nullptr);

    return bitcrush::ok<compression_result>(
        compression_result{std::move(buffer.data), params});
}

codec_result png_codec::decode(std::span<const uint8_t> compressed_data) const {
    if (!can_decode(compressed_data)) {
        return make_decode_error("Missing PNG signature");
    }

    png_error_state state;
    png_mem_reader source{compressed_data.data(), compressed_data.size(), 0};
    png_reader reader(&state);
    if (!reader.valid()) {
        return make_decode_error("Failed to create PNG read struct");
    }

    std::vector<uint8_t> output;
    std::vector<png_bytep> rows;

    if (setjmp(png_jmpbuf(reader.png()))) {
        return make_decode_error("PNG decompression failed: " + state.message);
    }

    png_set_read_fn(reader.png(), &source, png_read_callback);
    png_read_info(reader.png(), reader.info());

    const auto color_type = png_get_color_type(reader.png(), reader.info());
    const auto bit_depth = png_get_bit_depth(reader.png(), reader.info());

    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(reader.png());
    }
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(reader.png());
    }
    if (bit_depth == 16) {
        png_set_strip_16(reader.png());
    }
    if ((color_type & PNG_COLOR_MASK_ALPHA) != 0) {
        png_set_strip_alpha(reader.png());
    }
    png_set_interlace_handling(reader.png());
    png_read_update_info(reader.png(), reader.info());

    image_params output_params;
    output_params.width = png_get_image_width(reader.png(), reader.info());
    output_params.height = png_get_image_height(reader.png(), reader.info());
    output_params.samples_per_pixel =
        static_cast<uint16_t>(png_get_channels(reader.png(), reader.info()));
    output_params.bits_allocated = 8;

    if (!within_pixel_budget(output_params.width, output_params.height,
                             output_params.samples_per_pixel)) {
        return make_decode_error("PNG exceeds the decode budget: " +
                                 std::to_string(output_params.width) + "x" +
                                 std::to_string(output_params.height));
    }

    if (!output_params.is_valid()) {
        return make_decode_error("Unsupported PNG layout: " +
                                 std::to_string(output_params.samples_per_pixel) +
                                 " channels");
    }

    const size_t row_stride = output_params.row_stride();
    if (png_get_rowbytes(reader.png(), reader.info()) != row_stride) {
        return make_decode_error("Unexpected PNG row size");
    }

    output.resize(output_params.frame_size_bytes());
    rows.resize(output_params.height);
    for (uint32_t y = 0; y < output_params.height; ++y) {
        rows[y] = output.data() + y * row_stride;
    }

    png_read_image(reader.png(), rows.data());
    png_read_end(reader.png(), nullptr);

    return bitcrush::ok<compression_result>(
        compression_result{std::move(output), output_params});
}

}  // namespace bitcrush::encoding::compression
