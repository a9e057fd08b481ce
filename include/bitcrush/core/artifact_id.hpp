/**
 * @file artifact_id.hpp
 * @brief Generation and validation of artifact identifiers
 *
 * Artifact identifiers are ULIDs: a 48-bit millisecond Unix timestamp
 * followed by 80 bits of randomness, rendered as 26 characters of
 * Crockford base32. They sort lexicographically by creation time and
 * never contain the '.' used to separate the display extension.
 */

#pragma once

#include "bitcrush/core/random_source.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bitcrush {

/**
 * @class artifact_id_generator
 * @brief Mints fresh artifact identifiers
 *
 * The timestamp component never decreases between calls on the same
 * generator, even if the system clock steps backwards.
 *
 * Thread Safety: generate() may be called concurrently.
 *
 * @par Example
 * @code
 * artifact_id_generator ids(make_default_random_source());
 * std::string id = ids.generate();  // e.g. "01HF7Z3Q8Y4N6M2K1J0H9G8F7E"
 * @endcode
 */
class artifact_id_generator {
public:
    /// Length of a textual identifier
    static constexpr std::size_t kLength = 26;

    /// Number of characters encoding the timestamp
    static constexpr std::size_t kTimestampLength = 10;

    /// Crockford base32 alphabet
    static constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    /// Largest timestamp representable in 48 bits
    static constexpr std::uint64_t kMaxTimestamp = (std::uint64_t{1} << 48) - 1;

    explicit artifact_id_generator(std::shared_ptr<random_source> random);

    artifact_id_generator(const artifact_id_generator&) = delete;
    artifact_id_generator& operator=(const artifact_id_generator&) = delete;

    /**
     * @brief Generate an identifier stamped with the current time
     * @return 26-character identifier
     */
    [[nodiscard]] std::string generate();

    /**
     * @brief Generate an identifier stamped with the given time
     * @param when Creation time
     * @return 26-character identifier
     */
    [[nodiscard]] std::string generate(std::chrono::system_clock::time_point when);

    /**
     * @brief Check whether a string is a well-formed identifier
     *
     * Accepts upper or lower case letters of the Crockford alphabet.
     */
    [[nodiscard]] static bool is_valid(std::string_view text) noexcept;

    /**
     * @brief Validate and convert to canonical (upper case) form
     * @param text Candidate identifier
     * @return Canonical identifier, or nullopt if malformed
     */
    [[nodiscard]] static std::optional<std::string> normalize(std::string_view text);

    /**
     * @brief Decode the millisecond timestamp of an identifier
     * @param text Identifier
     * @return Milliseconds since the Unix epoch, or nullopt if malformed
     */
    [[nodiscard]] static std::optional<std::uint64_t> timestamp_ms(std::string_view text);

private:
    [[nodiscard]] std::uint64_t next_timestamp(std::uint64_t now_ms) noexcept;

    std::shared_ptr<random_source> random_;
    std::atomic<std::uint64_t> last_timestamp_{0};
};

} // namespace bitcrush
