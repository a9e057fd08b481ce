/**
 * @file artifact_id_test.cpp
 * @brief Unit tests for artifact_id_generator
 */

#include <bitcrush/core/artifact_id.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace bitcrush;

namespace {

bool uses_alphabet(const std::string& id) {
    return std::all_of(id.begin(), id.end(), [](char c) {
        return artifact_id_generator::kAlphabet.find(c) != std::string_view::npos;
    });
}

}  // namespace

TEST_CASE("artifact_id_generator produces well formed ids", "[core][id]") {
    artifact_id_generator ids(std::make_shared<mt_random_source>(1));

    auto id = ids.generate();

    REQUIRE(id.size() == artifact_id_generator::kLength);
    REQUIRE(uses_alphabet(id));
    REQUIRE(artifact_id_generator::is_valid(id));
}

TEST_CASE("artifact_id_generator ids are unique", "[core][id]") {
    artifact_id_generator ids(make_default_random_source());
    std::set<std::string> seen;

    for (int i = 0; i < 1000; ++i) {
        seen.insert(ids.generate());
    }

    REQUIRE(seen.size() == 1000);
}

TEST_CASE("artifact_id_generator is safe across threads", "[core][id]") {
    artifact_id_generator ids(make_default_random_source());
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    std::vector<std::vector<std::string>> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                results[t].push_back(ids.generate());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> seen;
    for (const auto& batch : results) {
        seen.insert(batch.begin(), batch.end());
    }
    REQUIRE(seen.size() == kThreads * kPerThread);
}

TEST_CASE("artifact_id_generator encodes the timestamp", "[core][id]") {
    artifact_id_generator ids(std::make_shared<mt_random_source>(3));
    const auto when = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

    auto id = ids.generate(when);
    auto ts = artifact_id_generator::timestamp_ms(id);

    REQUIRE(ts.has_value());
    REQUIRE(*ts == 1700000000123ULL);

    SECTION("timestamps never go backwards") {
        auto earlier = ids.generate(when - std::chrono::seconds(10));
        REQUIRE(*artifact_id_generator::timestamp_ms(earlier) == 1700000000123ULL);
    }

    SECTION("ids sort by creation time") {
        auto later = ids.generate(when + std::chrono::seconds(1));
        REQUIRE(later > id);
    }
}

TEST_CASE("artifact_id_generator validation", "[core][id]") {
    SECTION("rejects wrong length") {
        REQUIRE_FALSE(artifact_id_generator::is_valid(""));
        REQUIRE_FALSE(artifact_id_generator::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FA"));
        REQUIRE_FALSE(artifact_id_generator::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAVV"));
    }

    SECTION("rejects characters outside the alphabet") {
        REQUIRE_FALSE(artifact_id_generator::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FAU"));
        REQUIRE_FALSE(artifact_id_generator::is_valid("01ARZ3NDEKTSV4RRFFQ69G5FA!"));
        REQUIRE_FALSE(artifact_id_generator::is_valid("../../../../etc/passwd00000"));
    }

    SECTION("rejects overflowing first character") {
        REQUIRE_FALSE(artifact_id_generator::is_valid("81ARZ3NDEKTSV4RRFFQ69G5FAV"));
    }

    SECTION("accepts lower case") {
        REQUIRE(artifact_id_generator::is_valid("01arz3ndektsv4rrffq69g5fav"));
    }
}

TEST_CASE("artifact_id_generator::normalize", "[core][id]") {
    auto canonical = artifact_id_generator::normalize("01arz3ndektsv4rrffq69g5fav");
    REQUIRE(canonical.has_value());
    REQUIRE(*canonical == "01ARZ3NDEKTSV4RRFFQ69G5FAV");

    REQUIRE_FALSE(artifact_id_generator::normalize("not-an-id").has_value());
}

TEST_CASE("artifact_id_generator requires a random source", "[core][id]") {
    REQUIRE_THROWS_AS(artifact_id_generator(nullptr), std::invalid_argument);
}
