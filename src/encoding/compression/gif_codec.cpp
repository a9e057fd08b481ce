#include "bitcrush/encoding/compression/gif_codec.hpp"

#include <bitcrush/core/result.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <string>

#include <gif_lib.h>

namespace bitcrush::encoding::compression {

namespace {

constexpr std::array<uint8_t, 6> kGif87a = {'G', 'I', 'F', '8', '7', 'a'};
constexpr std::array<uint8_t, 6> kGif89a = {'G', 'I', 'F', '8', '9', 'a'};

// Interlaced GIF rows arrive in four passes
constexpr std::array<int, 4> kInterlaceOffsets = {0, 4, 2, 1};
constexpr std::array<int, 4> kInterlaceJumps = {8, 8, 4, 2};

/**
 * @brief Read cursor over an in-memory GIF stream.
 */
struct gif_mem_reader {
    const uint8_t* data{nullptr};
    size_t size{0};
    size_t offset{0};
};

int gif_read_callback(GifFileType* gif, GifByteType* out, int length) {
    auto* reader = static_cast<gif_mem_reader*>(gif->UserData);
    if (length <= 0 || reader->offset >= reader->size) {
        return 0;
    }
    const size_t count = std::min(reader->size - reader->offset, static_cast<size_t>(length));
    std::memcpy(out, reader->data + reader->offset, count);
    reader->offset += count;
    return static_cast<int>(count);
}

std::string gif_error_text(int code) {
    const char* text = GifErrorString(code);
    return text != nullptr ? text : "giflib error " + std::to_string(code);
}

/**
 * @brief RAII owner of a giflib decoder handle.
 */
class gif_reader {
public:
    explicit gif_reader(gif_mem_reader* source) {
        gif_ = DGifOpen(source, gif_read_callback, &open_error_);
    }

    ~gif_reader() {
        if (gif_ != nullptr) {
            int close_error = 0;
            DGifCloseFile(gif_, &close_error);
        }
    }

    gif_reader(const gif_reader&) = delete;
    gif_reader& operator=(const gif_reader&) = delete;

    [[nodiscard]] bool valid() const { return gif_ != nullptr; }
    GifFileType* get() { return gif_; }
    GifFileType* operator->() { return gif_; }

    [[nodiscard]] std::string last_error() const {
        return gif_error_text(gif_ != nullptr ? gif_->Error : open_error_);
    }

private:
    GifFileType* gif_{nullptr};
    int open_error_{0};
};

codec_result make_decode_error(const std::string& message) {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::decode_error, message);
}

void put_color(uint8_t* pixel, const GifColorType& color) {
    pixel[0] = color.Red;
    pixel[1] = color.Green;
    pixel[2] = color.Blue;
}

/**
 * @brief Reads the image record the reader is positioned at onto the canvas.
 */
codec_result decode_frame(gif_reader& reader) {
    if (DGifGetImageDesc(reader.get()) == GIF_ERROR) {
        return make_decode_error("Invalid GIF image descriptor: " + reader.last_error());
    }

    const GifImageDesc& frame = reader->Image;
    const ColorMapObject* colors =
        frame.ColorMap != nullptr ? frame.ColorMap : reader->SColorMap;
    if (colors == nullptr) {
        return make_decode_error("GIF frame has no color map");
    }
    if (frame.Width <= 0 || frame.Height <= 0) {
        return make_decode_error("GIF frame has no pixels");
    }

    image_params params;
    params.width = static_cast<uint32_t>(reader->SWidth);
    params.height = static_cast<uint32_t>(reader->SHeight);
    params.samples_per_pixel = 3;
    params.bits_allocated = 8;

    std::vector<uint8_t> output(params.frame_size_bytes(), 0);
    const ColorMapObject* screen_colors = reader->SColorMap;
    if (screen_colors != nullptr && reader->SBackGroundColor < screen_colors->ColorCount) {
        const auto& background = screen_colors->Colors[reader->SBackGroundColor];
        for (size_t i = 0; i < output.size(); i += 3) {
            put_color(output.data() + i, background);
        }
    }

    std::vector<GifPixelType> line(static_cast<size_t>(frame.Width));

    // Frames may extend past the logical screen; those pixels are clipped
    auto paint_row = [&](int row) {
        const int64_t y = static_cast<int64_t>(frame.Top) + row;
        if (y < 0 || y >= static_cast<int64_t>(params.height)) {
            return;
        }
        for (int x = 0; x < frame.Width; ++x) {
            const int64_t sx = static_cast<int64_t>(frame.Left) + x;
            if (sx < 0 || sx >= static_cast<int64_t>(params.width) ||
                line[x] >= colors->ColorCount) {
                continue;
            }
            const size_t offset = (static_cast<size_t>(y) * params.width + sx) * 3;
            put_color(output.data() + offset, colors->Colors[line[x]]);
        }
    };

    auto read_row = [&](int row) -> bool {
        if (DGifGetLine(reader.get(), line.data(), frame.Width) == GIF_ERROR) {
            return false;
        }
        paint_row(row);
        return true;
    };

    if (frame.Interlace) {
        for (size_t pass = 0; pass < kInterlaceOffsets.size(); ++pass) {
            for (int row = kInterlaceOffsets[pass]; row < frame.Height;
                 row += kInterlaceJumps[pass]) {
                if (!read_row(row)) {
                    return make_decode_error("GIF decompression failed: " + reader.last_error());
                }
            }
        }
    } else {
        for (int row = 0; row < frame.Height; ++row) {
            if (!read_row(row)) {
                return make_decode_error("GIF decompression failed: " + reader.last_error());
            }
        }
    }

    return bitcrush::ok<compression_result>(compression_result{std::move(output), params});
}

}  // namespace

image_format gif_codec::format() const noexcept {
    return image_format::gif;
}

std::string_view gif_codec::name() const noexcept {
    return "GIF";
}

std::string_view gif_codec::mime_type() const noexcept {
    return "image/gif";
}

bool gif_codec::is_lossy() const noexcept {
    return false;
}

bool gif_codec::can_encode(const image_params& /*params*/) const noexcept {
    return false;
}

bool gif_codec::can_decode(std::span<const uint8_t> data) const noexcept {
    if (data.size() < kGif89a.size()) {
        return false;
    }
    return std::equal(kGif87a.begin(), kGif87a.end(), data.begin()) ||
           std::equal(kGif89a.begin(), kGif89a.end(), data.begin());
}

codec_result gif_codec::encode(
    std::span<const uint8_t> /*pixel_data*/,
    const image_params& /*params*/,
    const compression_options& /*options*/) const {
    return bitcrush::bitcrush_error<compression_result>(
        bitcrush::error_codes::encode_error, "GIF encoding is not supported");
}

codec_result gif_codec::decode(std::span<const uint8_t> compressed_data) const {
    if (!can_decode(compressed_data)) {
        return make_decode_error("Missing GIF signature");
    }

    gif_mem_reader source{compressed_data.data(), compressed_data.size(), 0};
    gif_reader reader(&source);
    if (!reader.valid()) {
        return make_decode_error("Invalid GIF header: " + reader.last_error());
    }

    if (reader->SWidth <= 0 || reader->SHeight <= 0) {
        return make_decode_error("GIF logical screen is empty");
    }
    if (!within_pixel_budget(static_cast<uint64_t>(reader->SWidth),
                             static_cast<uint64_t>(reader->SHeight), 3)) {
        return make_decode_error("GIF exceeds the decode budget: " +
                                 std::to_string(reader->SWidth) + "x" +
                                 std::to_string(reader->SHeight));
    }

    GifRecordType record = UNDEFINED_RECORD_TYPE;
    do {
        if (DGifGetRecordType(reader.get(), &record) == GIF_ERROR) {
            return make_decode_error("GIF record read failed: " + reader.last_error());
        }

        switch (record) {
            case IMAGE_DESC_RECORD_TYPE:
                return decode_frame(reader);

            case EXTENSION_RECORD_TYPE: {
                int code = 0;
                GifByteType* block = nullptr;
                if (DGifGetExtension(reader.get(), &code, &block) == GIF_ERROR) {
                    return make_decode_error("GIF extension read failed: " +
                                             reader.last_error());
                }
                while (block != nullptr) {
                    if (DGifGetExtensionNext(reader.get(), &block) == GIF_ERROR) {
                        return make_decode_error("GIF extension read failed: " +
                                                 reader.last_error());
                    }
                }
                break;
            }

            default:
                break;
        }
    } while (record != TERMINATE_RECORD_TYPE);

    return make_decode_error("GIF contains no image");
}

}  // namespace bitcrush::encoding::compression
