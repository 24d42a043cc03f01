// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <span>
#include <vector>

#include <tl/expected.hpp>

#include <silkdsn/core/common/bytes.hpp>

namespace silkdsn::dsn {

enum class ErasureCodingError {
    kWrongShardCount,
    kShardSizeMismatch,
    kNotEnoughShards,
};

/**
 * Systematic Reed-Solomon code over GF(2^8) with rate 1/2.
 *
 * Given k source shards, shard i is the value at x = i of the unique polynomial of degree < k
 * passing through them (computed byte-wise), parity shard j its value at x = k + j.
 * Any k out of the 2k shards are enough to recover all of them.
 */
class ErasureCoding {
  public:
    //! \brief Compute the parity shards of the given source shards
    //! \pre all shards have the same size and 2 * source.size() <= 256
    static tl::expected<std::vector<Bytes>, ErasureCodingError> extend(std::span<const Bytes> source);

    //! \brief Recover the source shards out of an even-sized set of shards, source ones first
    static tl::expected<std::vector<Bytes>, ErasureCodingError> recover_source(std::span<const std::optional<Bytes>> shards);
};

}  // namespace silkdsn::dsn
