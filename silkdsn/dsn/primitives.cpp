// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "primitives.hpp"

#include <algorithm>
#include <cstring>

#include <silkdsn/core/common/endian.hpp>

namespace silkdsn::dsn {

PieceIndex SegmentIndex::first_piece_index() const {
    return PieceIndex{value_ * kNumPieces};
}

PieceIndex SegmentIndex::last_piece_index() const {
    return PieceIndex{value_ * kNumPieces + kNumPieces - 1};
}

std::vector<PieceIndex> SegmentIndex::segment_piece_indexes() const {
    std::vector<PieceIndex> indexes;
    indexes.reserve(kNumPieces);
    for (uint64_t i{first_piece_index().value()}; i <= last_piece_index().value(); ++i) {
        indexes.emplace_back(i);
    }
    return indexes;
}

std::vector<PieceIndex> SegmentIndex::segment_piece_indexes_source_first() const {
    std::vector<PieceIndex> indexes{segment_piece_indexes()};
    std::stable_partition(indexes.begin(), indexes.end(), [](const PieceIndex& index) { return index.is_source(); });
    return indexes;
}

std::optional<Piece> Piece::from_bytes(ByteView data) {
    if (data.size() != kPieceSize) {
        return std::nullopt;
    }
    return Piece{Bytes{data}};
}

Piece Piece::assemble(ByteView record, ByteView witness) {
    SILKDSN_ASSERT(record.size() == kRecordSize && witness.size() == kWitnessSize);
    Bytes data;
    data.reserve(kPieceSize);
    data.append(record);
    data.append(witness);
    return Piece{std::move(data)};
}

Hash SegmentHeader::hash() const {
    return Hash::keccak(encode(*this));
}

Bytes encode(const SegmentHeader& header) {
    Bytes out;
    out.reserve(SegmentHeader::kEncodedSize);
    endian::append_little_u64(out, header.segment_index.value());
    out.append(header.segment_commitment.bytes, kHashLength);
    out.append(header.prev_segment_header_hash.bytes, kHashLength);
    endian::append_little_u64(out, header.last_archived_block.number);
    out.push_back(header.last_archived_block.is_partial() ? 1 : 0);
    endian::append_little_u32(out, header.last_archived_block.partial_archived.value_or(0));
    return out;
}

DecodingResult decode(ByteView from, SegmentHeader& to) noexcept {
    if (from.size() < SegmentHeader::kEncodedSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    if (from.size() > SegmentHeader::kEncodedSize) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    const uint8_t* p{from.data()};
    to.segment_index = SegmentIndex{endian::load_little_u64(p)};
    p += sizeof(uint64_t);
    std::memcpy(to.segment_commitment.bytes, p, kHashLength);
    p += kHashLength;
    std::memcpy(to.prev_segment_header_hash.bytes, p, kHashLength);
    p += kHashLength;
    to.last_archived_block.number = endian::load_little_u64(p);
    p += sizeof(uint64_t);
    const uint8_t partial_flag{*p++};
    const uint32_t partial_archived{endian::load_little_u32(p)};
    switch (partial_flag) {
        case 0:
            if (partial_archived != 0) {
                return tl::unexpected{DecodingError::kInvalidFieldset};
            }
            to.last_archived_block.partial_archived = std::nullopt;
            break;
        case 1:
            to.last_archived_block.partial_archived = partial_archived;
            break;
        default:
            return tl::unexpected{DecodingError::kInvalidFieldset};
    }
    return {};
}

}  // namespace silkdsn::dsn
