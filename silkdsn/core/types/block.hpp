// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <silkdsn/core/common/base.hpp>
#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/core/common/decoding_result.hpp>
#include <silkdsn/core/types/hash.hpp>

namespace silkdsn {

struct BlockHeader {
    static constexpr size_t kEncodedSize{sizeof(uint64_t) + kHashLength + kHashLength + sizeof(uint64_t)};

    BlockNum number{0};
    Hash parent_hash{};
    Hash body_root{};  // keccak-256 of the body bytes
    uint64_t timestamp{0};

    Hash hash() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

struct Block {
    BlockHeader header;
    Bytes body;

    friend bool operator==(const Block&, const Block&) = default;
};

//! \brief Builds a block whose header commits to the given body
Block make_block(BlockNum number, const Hash& parent_hash, uint64_t timestamp, Bytes body);

void encode(Bytes& to, const BlockHeader& header);
Bytes encode(const Block& block);

//! \brief Decodes a fixed-size header from the front of from and advances it
DecodingResult decode(ByteView& from, BlockHeader& to) noexcept;

//! \brief Decodes a whole encoded block: a header followed by the body, checking the body root
DecodingResult decode(ByteView from, Block& to);

}  // namespace silkdsn
