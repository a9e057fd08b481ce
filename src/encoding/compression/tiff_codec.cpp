#include "bitcrush/encoding/compression/tiff_codec.hpp"

#include <bitcrush/core/result.hpp>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>

#include <tiffio.h>

namespace bitcrush::encoding::compression {

namespace {

/**
 * @brief Read cursor over an in-memory TIFF file.
 */
struct tiff_mem_reader {
    const uint8_t* data{nullptr};
    toff_t size{0};
    toff_t offset{0};
};

tmsize_t tiff_read_callback(thandle_t handle, void* out, tmsize_t length) {
    auto* reader = static_cast<tiff_mem_reader*>(handle);
    if (length <= 0 || reader->offset >= reader->size) {
        return 0;
    }
    const toff_t count = std::min<toff_t>(reader->size - reader->offset,
                                          static_cast<toff_t>(length));
    std::memcpy(out, reader->data + reader->offset, static_cast<size_t>(count));
    reader->offset += count;
    return static_cast<tmsize_t>(count);
}

tmsize_t tiff_write_callback(thandle_t /*handle*/, void* /*data*/, tmsize_t /*length*/) {
    return 0;
}

toff_t tiff_seek_callback(thandle_t handle, toff_t offset, int whence) {
    auto* reader = static_cast<tiff_mem_reader*>(handle);
    toff_t base = 0;
    if (whence == SEEK_CUR) {
        base = reader->offset;
    } else if (whence == SEEK_END) {
        base = reader->size;
    }
    // Negative relative offsets arrive as two's complement and wrap back
    const toff_t target = base + offset;
    if (target > reader->size) {
        return static_cast<toff_t>(-1);
    }
    reader->offset = target;
    return target;
}

int tiff_close_callback(thandle_t /*handle*/) {
    return 0;
}

toff_t tiff_size_callback(thandle_t handle) {
    return static_cast<tiff_mem_reader*>(handle)->size;
}

int tiff_map_callback(thandle_t /*handle*/, void** /*base*/, toff_t* /*size*/) {
    return 0;
}

void tiff_unmap_callback(thandle_t /*handle*/, void* /*base*/, toff_t /*size*/) {}

// libtiff reports through process-wide handlers; each decode collects its
// own messages through this thread-local slot
thread_local std::string* tiff_error_sink = nullptr;

void tiff_error_handler(thandle_t /*handle*/, const char* module, const char* format,
                        va_list args) {
    if (tiff_error_sink == nullptr) {
        return;
    }
    char buffer[512];
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    if (!tiff_error_sink->empty()) {
        tiff_error_sink->append("; ");
    }
    if (module != nullptr) {
        tiff_error_sink->append(module).append(": ");
    }
    tiff_error_sink->append(buffer);
}

void install_tiff_handlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        TIFFSetErrorHandler(nullptr);
        TIFFSetWarningHandler(nullptr);
        TIFFSetErrorHandlerExt(tiff_error_handler);
        TIFFSetWarningHandlerExt(nullptr);
    });
}

/**
 * @brief Routes libtiff errors on this thread into a string while alive.
 */
class tiff_error_capture {
public:
    tiff_error_capture() : previous_(tiff_error_sink) { tiff_error_sink = &message_; }
    ~tiff_error_capture() { tiff_error_sink = previous_; }

    tiff_error_capture(const tiff_error_capture&) = delete;
    tiff_error_capture& operator=(const tiff_error_capture&) = delete;

    [[nodiscard]] const std::string& message() const { return message_; }

private:
    std::string message_;
    std::string* previous_;
};

/**
 * @brief RAII owner of a TIFF handle.
 */
class tiff_handle {
public:
    explicit tiff_handle(tiff_mem_reader* source) {
        // "m" keeps libtiff from asking for a memory mapping
        tif_ = TIFFClientOpen("memory", "rm", static_cast<thandle_t>(source),
                              tiff_read_callback, tiff_write_callback, tiff_seek_callback,
                              tiff_close_callback, tiff_size_callback, tiff_map_callback,
                              tiff_unmap_callback);
    }

    ~tiff_handle() {
        if (tif_ != nullptr) {
            TIFFClose(tif_);
        }
    }

    tiff_handle(const tiff_handle&) = delete;
    tiff_handle& operator=(const tiff_handle&) = delete;

    [[nodiscard]] bool valid() const { return tif_ != nullptr; }
    TIFF* get() { return tif_; }

private:
    TIFF* tif_{nullptr};
};

codec_result make_decode_error(const std::string& message, const std::string& detail) {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::decode_error,
        detail.empty() ? message : message + ": " + detail);
}

bool tiff_signature(std::span<const uint8_t> data) {
    if (data.size() < 4) {
        return false;
    }
    // Classic TIFF (42) or BigTIFF (43), either byte order
    const bool little = data[0] == 'I' && data[1] == 'I' && data[3] == 0 &&
                        (data[2] == 42 || data[2] == 43);
    const bool big = data[0] == 'M' && data[1] == 'M' && data[2] == 0 &&
                     (data[3] == 42 || data[3] == 43);
    return little || big;
}

}  // namespace

image_format tiff_codec::format() const noexcept {
    return image_format::tiff;
}

std::string_view tiff_codec::name() const noexcept {
    return "TIFF";
}

std::string_view tiff_codec::mime_type() const noexcept {
    return "image/tiff";
}

bool tiff_codec::is_lossy() const noexcept {
    return false;
}

bool tiff_codec::can_encode(const image_params& /*params*/) const noexcept {
    return false;
}

bool tiff_codec::can_decode(std::span<const uint8_t> data) const noexcept {
    return tiff_signature(data);
}

codec_result tiff_codec::encode(
    std::span<const uint8_t> /*pixel_data*/,
    const image_params& /*params*/,
    const compression_options& /*options*/) const {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::encode_error, "TIFF encoding is not supported");
}

codec_result tiff_codec::decode(std::span<const uint8_t> compressed_data) const {
    if (!can_decode(compressed_data)) {
        return make_decode_error("Missing TIFF signature", "");
    }

    install_tiff_handlers();
    tiff_error_capture errors;

    tiff_mem_reader source{compressed_data.data(), compressed_data.size(), 0};
    tiff_handle tif(&source);
    if (!tif.valid()) {
        return make_decode_error("Invalid TIFF header", errors.message());
    }

    uint32_t width = 0;
    uint32_t height = 0;
    if (TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &width) != 1 ||
        TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &height) != 1 ||
        width == 0 || height == 0) {
        return make_decode_error("TIFF has no image dimensions", errors.message());
    }

    // The RGBA interface needs 4 bytes per pixel before conversion
    if (!within_pixel_budget(width, height, 4)) {
        return make_decode_error("TIFF exceeds the decode budget",
                                 std::to_string(width) + "x" + std::to_string(height));
    }

    uint16_t samples = 1;
    uint16_t photometric = PHOTOMETRIC_RGB;
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_SAMPLESPERPIXEL, &samples);
    if (TIFFGetField(tif.get(), TIFFTAG_PHOTOMETRIC, &photometric) != 1) {
        photometric = samples == 1 ? PHOTOMETRIC_MINISBLACK : PHOTOMETRIC_RGB;
    }

    std::vector<uint32_t> raster(static_cast<size_t>(width) * height);
    if (TIFFReadRGBAImageOriented(tif.get(), width, height, raster.data(),
                                  ORIENTATION_TOPLEFT, 1) != 1) {
        return make_decode_error("TIFF decompression failed", errors.message());
    }

    const bool grayscale = samples == 1 && (photometric == PHOTOMETRIC_MINISBLACK ||
                                            photometric == PHOTOMETRIC_MINISWHITE);

    image_params params;
    params.width = width;
    params.height = height;
    params.samples_per_pixel = grayscale ? 1 : 3;
    params.bits_allocated = 8;

    std::vector<uint8_t> output(params.frame_size_bytes());
    if (grayscale) {
        for (size_t i = 0; i < raster.size(); ++i) {
            output[i] = static_cast<uint8_t>(TIFFGetR(raster[i]));
        }
    } else {
        for (size_t i = 0; i < raster.size(); ++i) {
            output[i * 3 + 0] = static_cast<uint8_t>(TIFFGetR(raster[i]));
            output[i * 3 + 1] = static_cast<uint8_t>(TIFFGetG(raster[i]));
            output[i * 3 + 2] = static_cast<uint8_t>(TIFFGetB(raster[i]));
        }
    }

    return bitcrush::ok<compression_result>(compression_result{std::move(output), params});
}

}  // namespace bitcrush::encoding::compression
