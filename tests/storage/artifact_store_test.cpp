/**
 * @file artifact_store_test.cpp
 * @brief Unit tests for the in-memory artifact store
 */

#include <bitcrush/storage/artifact_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace bitcrush::storage;

namespace {

artifact make_artifact(std::size_t size, std::uint8_t fill = 0xAA) {
    return artifact{"image/jpeg", std::vector<std::uint8_t>(size, fill)};
}

}  // namespace

TEST_CASE("artifact_store starts empty", "[storage]") {
    artifact_store store;

    REQUIRE(store.empty());
    REQUIRE(store.size() == 0);
    REQUIRE(store.total_bytes() == 0);
    REQUIRE_FALSE(store.contains("anything"));
}

TEST_CASE("artifact_store insert and find", "[storage]") {
    artifact_store store;
    store.insert("A", make_artifact(10, 1));

    SECTION("stored item is returned") {
        auto found = store.find("A");
        REQUIRE(found.has_value());
        REQUIRE(found->content_type == "image/jpeg");
        REQUIRE(found->size() == 10);
        REQUIRE(found->data[0] == 1);
    }

    SECTION("absent item is nullopt") {
        REQUIRE_FALSE(store.find("B").has_value());
    }

    SECTION("lookups are case sensitive") {
        store.insert("abc", make_artifact(1));
        REQUIRE(store.contains("abc"));
        REQUIRE_FALSE(store.contains("ABC"));
    }

    SECTION("found copies are independent of the store") {
        auto found = store.find("A");
        REQUIRE(found.has_value());
        found->data.clear();
        REQUIRE(store.find("A")->size() == 10);
    }
}

TEST_CASE("artifact_store overwrite replaces the value", "[storage]") {
    artifact_store store;
    store.insert("A", make_artifact(10));
    store.insert("A", make_artifact(4, 2));

    REQUIRE(store.size() == 1);
    REQUIRE(store.total_bytes() == 4);
    REQUIRE(store.find("A")->data[0] == 2);
}

TEST_CASE("artifact_store statistics", "[storage]") {
    artifact_store store;
    store.insert("A", make_artifact(3));
    store.insert("B", make_artifact(5));

    (void)store.find("A");
    (void)store.find("A");
    (void)store.find("missing");

    auto stats = store.stats();
    REQUIRE(stats.artifact_count == 2);
    REQUIRE(stats.total_bytes == 8);
    REQUIRE(stats.insertions == 2);
    REQUIRE(stats.hits == 2);
    REQUIRE(stats.misses == 1);
}

TEST_CASE("artifact_store concurrent access", "[storage][concurrency]") {
    artifact_store store;
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 200;

    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&store, w] {
            for (int i = 0; i < kPerWriter; ++i) {
                store.insert(std::to_string(w) + "-" + std::to_string(i), make_artifact(2));
            }
        });
    }
    for (int r = 0; r < 2; ++r) {
        threads.emplace_back([&store] {
            for (int i = 0; i < kPerWriter; ++i) {
                (void)store.find("0-" + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(store.size() == kWriters * kPerWriter);
    REQUIRE(store.total_bytes() == kWriters * kPerWriter * 2);
    for (int w = 0; w < kWriters; ++w) {
        REQUIRE(store.contains(std::to_string(w) + "-" + std::to_string(kPerWriter - 1)));
    }
}
