/**
 * @file random_source.hpp
 * @brief Injectable source of uniformly distributed integers
 *
 * Every randomized decision in bitcrush (intermediate dimensions, JPEG
 * quality, identifier entropy) draws from a random_source so that tests
 * can replace the entropy with a fixed or range-constrained sequence.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace bitcrush {

/**
 * @class random_source
 * @brief Abstract uniform integer generator
 *
 * Implementations must be safe to call from multiple threads.
 */
class random_source {
public:
    virtual ~random_source() = default;

    /**
     * @brief Draw a value uniformly from the half-open range [low, high)
     * @param low Inclusive lower bound
     * @param high Exclusive upper bound, must be greater than low
     * @return Value in [low, high); low when the range is empty
     */
    [[nodiscard]] virtual std::uint64_t uniform(std::uint64_t low,
                                                std::uint64_t high) = 0;

    /**
     * @brief Fill a buffer with random bytes
     * @param out Destination buffer
     * @param size Number of bytes to write
     */
    virtual void fill(std::uint8_t* out, std::size_t size);

protected:
    random_source() = default;
    random_source(const random_source&) = default;
    random_source& operator=(const random_source&) = default;
};

/**
 * @class mt_random_source
 * @brief Default random_source backed by std::mt19937_64
 *
 * Seeded once from std::random_device. Calls are serialized by an
 * internal mutex.
 */
class mt_random_source final : public random_source {
public:
    mt_random_source();

    /// Construct with an explicit seed
    explicit mt_random_source(std::uint64_t seed);

    [[nodiscard]] std::uint64_t uniform(std::uint64_t low,
                                        std::uint64_t high) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/**
 * @class fixed_random_source
 * @brief Deterministic random_source replaying a fixed sequence
 *
 * Each call consumes the next value of the sequence (wrapping around) and
 * clamps it into the requested range. With an empty sequence every call
 * returns the lower bound.
 */
class fixed_random_source final : public random_source {
public:
    explicit fixed_random_source(std::vector<std::uint64_t> values);

    [[nodiscard]] std::uint64_t uniform(std::uint64_t low,
                                        std::uint64_t high) override;

    /// Number of values drawn so far
    [[nodiscard]] std::size_t draws() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::uint64_t> values_;
    std::size_t position_{0};
};

/**
 * @brief Create the process default random source
 * @return Shared mt_random_source seeded from std::random_device
 */
[[nodiscard]] std::shared_ptr<random_source> make_default_random_source();

} // namespace bitcrush
