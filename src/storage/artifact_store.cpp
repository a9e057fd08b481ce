/**
 * @file artifact_store.cpp
 * @brief Implementation of the in-memory artifact store
 */

#include "bitcrush/storage/artifact_store.hpp"

#include <mutex>

namespace bitcrush::storage {

void artifact_store::insert(std::string id, artifact item) {
    std::unique_lock lock(mutex_);

    auto [it, inserted] = artifacts_.try_emplace(std::move(id));
    if (!inserted) {
        total_bytes_ -= it->second.size();
    }
    total_bytes_ += item.size();
    it->second = std::move(item);

    insertions_.fetch_add(1, std::memory_order_relaxed);
}

std::optional<artifact> artifact_store::find(std::string_view id) const {
    std::shared_lock lock(mutex_);

    auto it = artifacts_.find(std::string(id));
    if (it == artifacts_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second;
}

bool artifact_store::contains(std::string_view id) const {
    std::shared_lock lock(mutex_);
    return artifacts_.find(std::string(id)) != artifacts_.end();
}

std::size_t artifact_store::size() const {
    std::shared_lock lock(mutex_);
    return artifacts_.size();
}

bool artifact_store::empty() const {
    std::shared_lock lock(mutex_);
    return artifacts_.empty();
}

std::size_t artifact_store::total_bytes() const {
    std::shared_lock lock(mutex_);
    return total_bytes_;
}

store_stats artifact_store::stats() const {
    store_stats result;
    {
        std::shared_lock lock(mutex_);
        result.artifact_count = artifacts_.size();
        result.total_bytes = total_bytes_;
    }
    result.insertions = insertions_.load(std::memory_order_relaxed);
    result.hits = hits_.load(std::memory_order_relaxed);
    result.misses = misses_.load(std::memory_order_relaxed);
    return result;
}

}  // namespace bitcrush::storage
