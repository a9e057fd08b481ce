/**
 * @file artifact_id.cpp
 * @brief Implementation of artifact identifier generation
 */

#include <bitcrush/core/artifact_id.hpp>

#include <array>
#include <stdexcept>

namespace bitcrush {

namespace {

/// Maps an ASCII character to its base32 value, or -1
constexpr int decode_char(char c) noexcept {
    if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
    }
    for (std::size_t i = 0; i < artifact_id_generator::kAlphabet.size(); ++i) {
        if (artifact_id_generator::kAlphabet[i] == c) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

/// Encodes 40 bits as 8 base32 characters
void encode_40_bits(std::uint64_t value, char* out) {
    for (int i = 7; i >= 0; --i) {
        out[i] = artifact_id_generator::kAlphabet[value & 0x1F];
        value >>= 5;
    }
}

} // namespace

artifact_id_generator::artifact_id_generator(std::shared_ptr<random_source> random)
    : random_(std::move(random)) {
    if (!random_) {
        throw std::invalid_argument("artifact_id_generator requires a random source");
    }
}

std::string artifact_id_generator::generate() {
    return generate(std::chrono::system_clock::now());
}

std::string artifact_id_generator::generate(std::chrono::system_clock::time_point when) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count();
    std::uint64_t now_ms = since_epoch > 0 ? static_cast<std::uint64_t>(since_epoch) : 0;
    std::uint64_t timestamp = next_timestamp(now_ms);

    std::array<std::uint8_t, 10> entropy{};
    random_->fill(entropy.data(), entropy.size());

    std::string id(kLength, '0');

    std::uint64_t ts = timestamp;
    for (int i = static_cast<int>(kTimestampLength) - 1; i >= 0; --i) {
        id[static_cast<std::size_t>(i)] = kAlphabet[ts & 0x1F];
        ts >>= 5;
    }

    // 80 random bits as two 40-bit groups
    std::uint64_t high = 0;
    std::uint64_t low = 0;
    for (std::size_t i = 0; i < 5; ++i) {
        high = (high << 8) | entropy[i];
        low = (low << 8) | entropy[i + 5];
    }
    encode_40_bits(high, id.data() + kTimestampLength);
    encode_40_bits(low, id.data() + kTimestampLength + 8);

    return id;
}

std::uint64_t artifact_id_generator::next_timestamp(std::uint64_t now_ms) noexcept {
    if (now_ms > kMaxTimestamp) {
        now_ms = kMaxTimestamp;
    }
    auto last = last_timestamp_.load(std::memory_order_relaxed);
    while (true) {
        auto next = now_ms > last ? now_ms : last;
        if (last_timestamp_.compare_exchange_weak(last, next,
                                                  std::memory_order_relaxed)) {
            return next;
        }
    }
}

bool artifact_id_generator::is_valid(std::string_view text) noexcept {
    if (text.size() != kLength) {
        return false;
    }
    for (char c : text) {
        if (decode_char(c) < 0) {
            return false;
        }
    }
    // 26 characters carry 130 bits; the top two must be zero
    return decode_char(text.front()) <= 7;
}

std::optional<std::string> artifact_id_generator::normalize(std::string_view text) {
    if (!is_valid(text)) {
        return std::nullopt;
    }
    std::string canonical;
    canonical.reserve(kLength);
    for (char c : text) {
        canonical.push_back(kAlphabet[static_cast<std::size_t>(decode_char(c))]);
    }
    return canonical;
}

std::optional<std::uint64_t> artifact_id_generator::timestamp_ms(std::string_view text) {
    if (!is_valid(text)) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < kTimestampLength; ++i) {
        value = (value << 5) | static_cast<std::uint64_t>(decode_char(text[i]));
    }
    return value;
}

} // namespace bitcrush
