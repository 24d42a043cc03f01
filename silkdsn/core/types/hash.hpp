// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstring>

#include <evmc/evmc.hpp>

#include <silkdsn/core/common/assert.hpp>
#include <silkdsn/core/common/base.hpp>
#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/core/common/util.hpp>

namespace silkdsn {

//! 32-byte digest: block hashes, segment commitments and segment header hashes
class Hash : public evmc::bytes32 {
  public:
    using evmc::bytes32::bytes32;

    Hash() = default;
    explicit Hash(ByteView bv) {
        SILKDSN_ASSERT(bv.size() == kHashLength);
        std::memcpy(bytes, bv.data(), kHashLength);
    }
    explicit Hash(const ethash::hash256& digest) { std::memcpy(bytes, digest.bytes, kHashLength); }

    static Hash keccak(ByteView data) { return Hash{keccak256(data)}; }

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    operator ByteView() const { return ByteView{bytes, kHashLength}; }
};

static_assert(sizeof(Hash) == kHashLength);

}  // namespace silkdsn
