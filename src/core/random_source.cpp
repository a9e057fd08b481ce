/**
 * @file random_source.cpp
 * @brief Implementation of the random_source family
 */

#include <bitcrush/core/random_source.hpp>

namespace bitcrush {

void random_source::fill(std::uint8_t* out, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::uint8_t>(uniform(0, 256));
    }
}

// ─────────────────────────────────────────────────────
// mt_random_source
// ─────────────────────────────────────────────────────

mt_random_source::mt_random_source() : engine_(std::random_device{}()) {}

mt_random_source::mt_random_source(std::uint64_t seed) : engine_(seed) {}

std::uint64_t mt_random_source::uniform(std::uint64_t low, std::uint64_t high) {
    if (high <= low) {
        return low;
    }
    std::uniform_int_distribution<std::uint64_t> dist(low, high - 1);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(engine_);
}

// ─────────────────────────────────────────────────────
// fixed_random_source
// ─────────────────────────────────────────────────────

fixed_random_source::fixed_random_source(std::vector<std::uint64_t> values)
    : values_(std::move(values)) {}

std::uint64_t fixed_random_source::uniform(std::uint64_t low, std::uint64_t high) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (high <= low || values_.empty()) {
        ++position_;
        return low;
    }

    auto value = values_[position_ % values_.size()];
    ++position_;

    // Values already inside the range are returned as-is
    if (value >= low && value < high) {
        return value;
    }
    return low + value % (high - low);
}

std::size_t fixed_random_source::draws() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_;
}

std::shared_ptr<random_source> make_default_random_source() {
    return std::make_shared<mt_random_source>();
}

} // namespace bitcrush
