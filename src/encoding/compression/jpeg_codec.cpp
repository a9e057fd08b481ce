#include "bitcrush/encoding/compression/jpeg_codec.hpp"

#include <bitcrush/core/result.hpp>

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>

#include <jpeglib.h>
#include <jerror.h>

namespace bitcrush::encoding::compression {

namespace {

/**
 * @brief libjpeg error manager that records the message and longjmps.
 */
struct jpeg_error_handler {
    jpeg_error_mgr pub;          // Public fields (must be first)
    jmp_buf setjmp_buffer;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<jpeg_error_handler*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->setjmp_buffer, 1);
}

// Corrupt-data warnings are not fatal; libjpeg fills in what it can
void jpeg_output_message([[maybe_unused]] j_common_ptr cinfo) {}

/**
 * @brief RAII wrapper for jpeg_compress_struct.
 */
class jpeg_compressor {
public:
    jpeg_compressor() {
        cinfo_.err = jpeg_std_error(&jerr_.pub);
        jerr_.pub.error_exit = jpeg_error_exit;
        jerr_.pub.output_message = jpeg_output_message;
        jerr_.message[0] = '\0';
        jpeg_create_compress(&cinfo_);
    }

    ~jpeg_compressor() {
        jpeg_destroy_compress(&cinfo_);
        std::free(buffer_);
    }

    jpeg_compressor(const jpeg_compressor&) = delete;
    jpeg_compressor& operator=(const jpeg_compressor&) = delete;

    jpeg_compress_struct* operator->() { return &cinfo_; }
    jpeg_compress_struct& get() { return cinfo_; }
    jpeg_error_handler& error() { return jerr_; }

    // Destination buffer owned by libjpeg, released in the destructor
    unsigned char** buffer() { return &buffer_; }
    unsigned long* buffer_size() { return &buffer_size_; }
    [[nodiscard]] const unsigned char* data() const { return buffer_; }
    [[nodiscard]] unsigned long size() const { return buffer_size_; }

private:
    jpeg_compress_struct cinfo_{};
    jpeg_error_handler jerr_{};
    unsigned char* buffer_{nullptr};
    unsigned long buffer_size_{0};
};

/**
 * @brief RAII wrapper for jpeg_decompress_struct.
 */
class jpeg_decompressor {
public:
    jpeg_decompressor() {
        cinfo_.err = jpeg_std_error(&jerr_.pub);
        jerr_.pub.error_exit = jpeg_error_exit;
        jerr_.pub.output_message = jpeg_output_message;
        jerr_.message[0] = '\0';
        jpeg_create_decompress(&cinfo_);
    }

    ~jpeg_decompressor() {
        jpeg_destroy_decompress(&cinfo_);
    }

    jpeg_decompressor(const jpeg_decompressor&) = delete;
    jpeg_decompressor& operator=(const jpeg_decompressor&) = delete;

    jpeg_decompress_struct* operator->() { return &cinfo_; }
    jpeg_decompress_struct& get() { return cinfo_; }
    jpeg_error_handler& error() { return jerr_; }

private:
    jpeg_decompress_struct cinfo_{};
    jpeg_error_handler jerr_{};
};

codec_result make_encode_error(const std::string& message) {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::encode_error, message);
}

codec_result make_decode_error(const std::string& message) {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::decode_error, message);
}

void set_sampling(jpeg_compress_struct& cinfo, int luma_h, int luma_v) {
    cinfo.comp_info[0].h_samp_factor = luma_h;
    cinfo.comp_info[0].v_samp_factor = luma_v;
    for (int c = 1; c < 3; ++c) {
        cinfo.comp_info[c].h_samp_factor = 1;
        cinfo.comp_info[c].v_samp_factor = 1;
    }
}

}  // namespace

/**
 * @brief PIMPL implementation for jpeg_codec.
 *
 * The setjmp targets live in these member functions so that no C++
 * object with a non-trivial destructor is created between setjmp and a
 * possible longjmp other than the RAII wrappers declared before it.
 */
class jpeg_codec::impl {
public:
    [[nodiscard]] codec_result encode(
        std::span<const uint8_t> pixel_data,
        const image_params& params,
        const compression_options& options) const {

        if (!params.valid_for_jpeg()) {
            return make_encode_error(
                "Invalid parameters for JPEG: " + std::to_string(params.width) +
                "x" + std::to_string(params.height) + ", " +
                std::to_string(params.samples_per_pixel) + " samples per pixel");
        }

        size_t expected_size = params.frame_size_bytes();
        if (pixel_data.size() != expected_size) {
            return make_encode_error(
                "Pixel data size mismatch: expected " + std::to_string(expected_size) +
                ", got " + std::to_string(pixel_data.size()));
        }

        jpeg_compressor compressor;

        if (setjmp(compressor.error().setjmp_buffer)) {
            return make_encode_error(
                std::string("JPEG compression failed: ") + compressor.error().message);
        }

        jpeg_mem_dest(&compressor.get(), compressor.buffer(), compressor.buffer_size());

        compressor->image_width = params.width;
        compressor->image_height = params.height;
        compressor->input_components = static_cast<int>(params.samples_per_pixel);
        compressor->in_color_space = params.is_grayscale() ? JCS_GRAYSCALE : JCS_RGB;

        jpeg_set_defaults(&compressor.get());
        jpeg_set_quality(&compressor.get(), std::clamp(options.quality, 1, 100), TRUE);

        if (params.is_color()) {
            switch (options.chroma_subsampling) {
                case 0:  // 4:4:4
                    set_sampling(compressor.get(), 1, 1);
                    break;
                case 1:  // 4:2:2
                    set_sampling(compressor.get(), 2, 1);
                    break;
                case 2:  // 4:2:0
                default:
                    set_sampling(compressor.get(), 2, 2);
                    break;
            }
        }

        jpeg_start_compress(&compressor.get(), TRUE);

        const size_t row_stride = params.row_stride();
        while (compressor->next_scanline < compressor->image_height) {
            JSAMPROW row = const_cast<JSAMPROW>(
                pixel_data.data() + compressor->next_scanline * row_stride);
            jpeg_write_scanlines(&compressor.get(), &row, 1);
        }

        jpeg_finish_compress(&compressor.get());

        std::vector<uint8_t> encoded(compressor.data(),
                                     compressor.data() + compressor.size());
        return bitcrush::ok<compression_result>(
            compression_result{std::move(encoded), params});
    }

    [[nodiscard]] codec_result decode(std::span<const uint8_t> compressed_data) const {
        if (compressed_data.empty()) {
            return make_decode_error("Empty compressed data");
        }

        jpeg_decompressor decompressor;
        std::vector<uint8_t> output;

        if (setjmp(decompressor.error().setjmp_buffer)) {
            return make_decode_error(
                std::string("JPEG decompression failed: ") + decompressor.error().message);
        }

        // Older libjpeg declares the source buffer non-const; it is only read
        jpeg_mem_src(&decompressor.get(),
                     const_cast<unsigned char*>(compressed_data.data()),
                     static_cast<unsigned long>(compressed_data.size()));

        if (jpeg_read_header(&decompressor.get(), TRUE) != JPEG_HEADER_OK) {
            return make_decode_error("Invalid JPEG header");
        }

        switch (decompressor->jpeg_color_space) {
            case JCS_GRAYSCALE:
                decompressor->out_color_space = JCS_GRAYSCALE;
                break;
            case JCS_CMYK:
            case JCS_YCCK:
                return make_decode_error("Unsupported JPEG color space: CMYK");
            default:
                decompressor->out_color_space = JCS_RGB;
                break;
        }

        const int channels = decompressor->out_color_space == JCS_GRAYSCALE ? 1 : 3;
        if (!within_pixel_budget(decompressor->image_width, decompressor->image_height,
                                 channels)) {
            return make_decode_error(
                "JPEG exceeds the decode budget: " +
                std::to_string(decompressor->image_width) + "x" +
                std::to_string(decompressor->image_height));
        }

        jpeg_start_decompress(&decompressor.get());

        image_params output_params;
        output_params.width = decompressor->output_width;
        output_params.height = decompressor->output_height;
        output_params.samples_per_pixel =
            static_cast<uint16_t>(decompressor->output_components);
        output_params.bits_allocated = 8;

        if (!output_params.is_valid()) {
            return make_decode_error("Unsupported JPEG component count: " +
                                     std::to_string(output_params.samples_per_pixel));
        }

        output.resize(output_params.frame_size_bytes());
        const size_t row_stride = output_params.row_stride();

        while (decompressor->output_scanline < decompressor->output_height) {
            JSAMPROW row = output.data() + decompressor->output_scanline * row_stride;
            jpeg_read_scanlines(&decompressor.get(), &row, 1);
        }

        jpeg_finish_decompress(&decompressor.get());

        return bitcrush::ok<compression_result>(
            compression_result{std::move(output), output_params});
    }
};

// jpeg_codec implementation

jpeg_codec::jpeg_codec() : impl_(std::make_unique<impl>()) {}

jpeg_codec::~jpeg_codec() = default;

jpeg_codec::jpeg_codec(jpeg_codec&&) noexcept = default;

jpeg_codec& jpeg_codec::operator=(jpeg_codec&&) noexcept = default;

image_format jpeg_codec::format() const noexcept {
    return image_format::jpeg;
}

std::string_view jpeg_codec::name() const noexcept {
    return "JPEG Baseline";
}

std::string_view jpeg_codec::mime_type() const noexcept {
    return "image/jpeg";
}

bool jpeg_codec::is_lossy() const noexcept {
    return true;
}

bool jpeg_codec::can_encode(const image_params& params) const noexcept {
    return params.valid_for_jpeg();
}

bool jpeg_codec::can_decode(std::span<const uint8_t> data) const noexcept {
    // SOI marker followed by the start of another marker
    return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

codec_result jpeg_codec::encode(
    std::span<const uint8_t> pixel_data,
    const image_params& params,
    const compression_options& options) const {
    return impl_->encode(pixel_data, params, options);
}

codec_result jpeg_codec::decode(std::span<const uint8_t> compressed_data) const {
    return impl_->decode(compressed_data);
}

}  // namespace bitcrush::encoding::compression
