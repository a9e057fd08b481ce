/**
 * @file artifact_store.hpp
 * @brief Thread-safe in-memory store of degraded images
 *
 * The store maps artifact identifiers to immutable artifacts for the
 * lifetime of the process. Entries are never evicted or deleted.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bitcrush::storage {

// ─────────────────────────────────────────────────────
// Artifact
// ─────────────────────────────────────────────────────

/**
 * @struct artifact
 * @brief Encoded image bytes together with their MIME type
 */
struct artifact {
    /// MIME type of data, e.g. "image/jpeg"
    std::string content_type;

    /// Encoded file contents
    std::vector<std::uint8_t> data;

    [[nodiscard]] std::size_t size() const noexcept { return data.size(); }
};

// ─────────────────────────────────────────────────────
// Store Statistics
// ─────────────────────────────────────────────────────

/**
 * @struct store_stats
 * @brief Snapshot of store counters
 */
struct store_stats {
    std::size_t artifact_count{0};   ///< Number of stored artifacts
    std::size_t total_bytes{0};      ///< Sum of artifact payload sizes
    std::uint64_t insertions{0};     ///< Inserts since construction
    std::uint64_t hits{0};           ///< Successful lookups
    std::uint64_t misses{0};         ///< Lookups of absent ids
};

// ─────────────────────────────────────────────────────
// Artifact Store
// ─────────────────────────────────────────────────────

/**
 * @class artifact_store
 * @brief Append-only identifier to artifact map
 *
 * A single std::shared_mutex guards the map. Lookups take a shared lock
 * and may run concurrently; inserts take an exclusive lock. An insert
 * under an existing identifier replaces the previous artifact.
 *
 * The store is shared between request handlers through std::shared_ptr.
 *
 * @par Example
 * @code
 * auto store = std::make_shared<artifact_store>();
 * store->insert(id, artifact{"image/jpeg", std::move(bytes)});
 * if (auto found = store->find(id)) {
 *     // found->data holds the bytes
 * }
 * @endcode
 */
class artifact_store {
public:
    artifact_store() = default;

    artifact_store(const artifact_store&) = delete;
    artifact_store& operator=(const artifact_store&) = delete;

    /**
     * @brief Store an artifact, replacing any previous entry for the id
     * @param id Artifact identifier
     * @param item Artifact to store
     */
    void insert(std::string id, artifact item);

    /**
     * @brief Look up an artifact
     * @param id Artifact identifier
     * @return Copy of the stored artifact, or nullopt if absent
     */
    [[nodiscard]] std::optional<artifact> find(std::string_view id) const;

    /// Check whether an identifier is present
    [[nodiscard]] bool contains(std::string_view id) const;

    /// Number of stored artifacts
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] bool empty() const;

    /// Sum of stored payload sizes in bytes
    [[nodiscard]] std::size_t total_bytes() const;

    [[nodiscard]] store_stats stats() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, artifact> artifacts_;
    std::size_t total_bytes_{0};

    std::atomic<std::uint64_t> insertions_{0};
    mutable std::atomic<std::uint64_t> hits_{0};
    mutable std::atomic<std::uint64_t> misses_{0};
};

}  // namespace bitcrush::storage
