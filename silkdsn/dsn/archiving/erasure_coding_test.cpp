// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "erasure_coding.hpp"

#include <algorithm>
#include <random>

#include <catch2/catch_test_macros.hpp>

namespace silkdsn::dsn {

static std::vector<Bytes> random_shards(size_t count, size_t size, uint64_t seed) {
    std::mt19937_64 rng{seed};
    std::uniform_int_distribution<int> byte_dist{0, 255};
    std::vector<Bytes> shards;
    for (size_t i{0}; i < count; ++i) {
        Bytes shard(size, 0);
        for (auto& b : shard) {
            b = static_cast<uint8_t>(byte_dist(rng));
        }
        shards.push_back(std::move(shard));
    }
    return shards;
}

TEST_CASE("ErasureCoding.extend", "[silkdsn][dsn][erasure_coding]") {
    const auto source{random_shards(4, 16, 1)};
    const auto parity{ErasureCoding::extend(source)};
    REQUIRE(parity);
    REQUIRE(parity->size() == 4);
    for (const auto& shard : *parity) {
        CHECK(shard.size() == 16);
    }

    // Constant data stays constant: the interpolating polynomial is the constant itself
    const std::vector<Bytes> constant(3, Bytes(8, 0x5a));
    const auto constant_parity{ErasureCoding::extend(constant)};
    REQUIRE(constant_parity);
    for (const auto& shard : *constant_parity) {
        CHECK(shard == Bytes(8, 0x5a));
    }
}

TEST_CASE("ErasureCoding.extend errors", "[silkdsn][dsn][erasure_coding]") {
    CHECK(ErasureCoding::extend({}).error() == ErasureCodingError::kWrongShardCount);
    CHECK(ErasureCoding::extend(random_shards(129, 4, 2)).error() == ErasureCodingError::kWrongShardCount);
    std::vector<Bytes> uneven{Bytes(4, 0), Bytes(5, 0)};
    CHECK(ErasureCoding::extend(uneven).error() == ErasureCodingError::kShardSizeMismatch);
}

TEST_CASE("ErasureCoding.recover_source from any half", "[silkdsn][dsn][erasure_coding]") {
    constexpr size_t kSource{128};
    const auto source{random_shards(kSource, 32, 3)};
    const auto parity{ErasureCoding::extend(source)};
    REQUIRE(parity);

    std::vector<std::optional<Bytes>> shards;
    for (const auto& shard : source) shards.emplace_back(shard);
    for (const auto& shard : *parity) shards.emplace_back(shard);

    SECTION("all source shards") {
        for (size_t i{kSource}; i < shards.size(); ++i) shards[i].reset();
    }
    SECTION("all parity shards") {
        for (size_t i{0}; i < kSource; ++i) shards[i].reset();
    }
    SECTION("random mix") {
        std::mt19937_64 rng{4};
        std::vector<size_t> positions(shards.size());
        for (size_t i{0}; i < positions.size(); ++i) positions[i] = i;
        std::shuffle(positions.begin(), positions.end(), rng);
        for (size_t i{0}; i < kSource; ++i) shards[positions[i]].reset();
    }

    const auto recovered{ErasureCoding::recover_source(shards)};
    REQUIRE(recovered);
    CHECK(*recovered == source);
}

TEST_CASE("ErasureCoding.recover_source below threshold", "[silkdsn][dsn][erasure_coding]") {
    const auto source{random_shards(8, 4, 5)};
    const auto parity{ErasureCoding::extend(source)};
    REQUIRE(parity);

    std::vector<std::optional<Bytes>> shards(16);
    for (size_t i{0}; i < 7; ++i) {
        shards[2 * i + 1] = i < 4 ? source[2 * i + 1] : (*parity)[2 * i + 1 - 8];
    }
    CHECK(ErasureCoding::recover_source(shards).error() == ErasureCodingError::kNotEnoughShards);
    CHECK(ErasureCoding::recover_source(std::vector<std::optional<Bytes>>(15)).error() == ErasureCodingError::kWrongShardCount);
}

}  // namespace silkdsn::dsn
