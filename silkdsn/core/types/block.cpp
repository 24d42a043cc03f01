// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <cstring>

#include <silkdsn/core/common/endian.hpp>

namespace silkdsn {

Hash BlockHeader::hash() const {
    Bytes encoded;
    encode(encoded, *this);
    return Hash::keccak(encoded);
}

Block make_block(BlockNum number, const Hash& parent_hash, uint64_t timestamp, Bytes body) {
    Block block;
    block.header.number = number;
    block.header.parent_hash = parent_hash;
    block.header.body_root = Hash::keccak(body);
    block.header.timestamp = timestamp;
    block.body = std::move(body);
    return block;
}

void encode(Bytes& to, const BlockHeader& header) {
    to.reserve(to.size() + BlockHeader::kEncodedSize);
    endian::append_little_u64(to, header.number);
    to.append(header.parent_hash.bytes, kHashLength);
    to.append(header.body_root.bytes, kHashLength);
    endian::append_little_u64(to, header.timestamp);
}

Bytes encode(const Block& block) {
    Bytes out;
    out.reserve(BlockHeader::kEncodedSize + block.body.size());
    encode(out, block.header);
    out.append(block.body);
    return out;
}

DecodingResult decode(ByteView& from, BlockHeader& to) noexcept {
    if (from.size() < BlockHeader::kEncodedSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const uint8_t* p{from.data()};
    to.number = endian::load_little_u64(p);
    p += sizeof(uint64_t);
    std::memcpy(to.parent_hash.bytes, p, kHashLength);
    p += kHashLength;
    std::memcpy(to.body_root.bytes, p, kHashLength);
    p += kHashLength;
    to.timestamp = endian::load_little_u64(p);
    from.remove_prefix(BlockHeader::kEncodedSize);
    return {};
}

DecodingResult decode(ByteView from, Block& to) {
    if (DecodingResult res{decode(from, to.header)}; !res) {
        return res;
    }
    if (Hash::keccak(from) != to.header.body_root) {
        return tl::unexpected{DecodingError::kInvalidBodyRoot};
    }
    to.body = Bytes{from};
    return {};
}

}  // namespace silkdsn
