// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <silkdsn/core/common/base.hpp>
#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/core/common/decoding_result.hpp>
#include <silkdsn/core/types/hash.hpp>

namespace silkdsn::dsn {

//! Number of source records in a segment, which is also the reconstruction threshold
inline constexpr size_t kNumRawRecords{128};
//! Number of pieces in an archived segment (source + parity)
inline constexpr size_t kNumPieces{2 * kNumRawRecords};
//! Size of one record in bytes
inline constexpr size_t kRecordSize{512};
//! Depth of the Merkle tree built over the records of an archived segment
inline constexpr size_t kWitnessDepth{8};
//! Merkle inclusion proof of a record: one sibling hash per tree level
inline constexpr size_t kWitnessSize{kWitnessDepth * kHashLength};
inline constexpr size_t kPieceSize{kRecordSize + kWitnessSize};
//! Source bytes carried by one segment
inline constexpr size_t kRecordedHistorySegmentSize{kNumRawRecords * kRecordSize};

static_assert((size_t{1} << kWitnessDepth) == kNumPieces);

class PieceIndex;

class SegmentIndex {
  public:
    constexpr SegmentIndex() = default;
    constexpr explicit SegmentIndex(uint64_t value) : value_{value} {}

    constexpr uint64_t value() const { return value_; }

    PieceIndex first_piece_index() const;
    PieceIndex last_piece_index() const;

    //! All the piece indexes of this segment in position order
    std::vector<PieceIndex> segment_piece_indexes() const;

    //! All the piece indexes of this segment, source pieces before parity pieces
    std::vector<PieceIndex> segment_piece_indexes_source_first() const;

    std::string to_string() const { return std::to_string(value_); }

    friend auto operator<=>(const SegmentIndex&, const SegmentIndex&) = default;

  private:
    uint64_t value_{0};
};

class PieceIndex {
  public:
    constexpr PieceIndex() = default;
    constexpr explicit PieceIndex(uint64_t value) : value_{value} {}

    constexpr uint64_t value() const { return value_; }

    constexpr SegmentIndex segment_index() const { return SegmentIndex{value_ / kNumPieces}; }

    //! Position within the archived segment
    constexpr size_t position() const { return static_cast<size_t>(value_ % kNumPieces); }

    constexpr bool is_source() const { return position() < kNumRawRecords; }

    std::string to_string() const { return std::to_string(value_); }

    friend auto operator<=>(const PieceIndex&, const PieceIndex&) = default;

  private:
    uint64_t value_{0};
};

//! Fixed-size piece: a record followed by its Merkle witness
class Piece {
  public:
    //! Build a piece out of a buffer having exactly kPieceSize bytes
    static std::optional<Piece> from_bytes(ByteView data);

    //! Assemble a piece from its record and witness parts
    static Piece assemble(ByteView record, ByteView witness);

    ByteView bytes() const { return data_; }
    ByteView record() const { return bytes().substr(0, kRecordSize); }
    ByteView witness() const { return bytes().substr(kRecordSize, kWitnessSize); }

    friend bool operator==(const Piece&, const Piece&) = default;

  private:
    explicit Piece(Bytes data) : data_{std::move(data)} {}

    Bytes data_;
};

struct LastArchivedBlock {
    BlockNum number{0};
    //! Bytes of the block archived so far, empty when the block is fully archived
    std::optional<uint32_t> partial_archived;

    bool is_partial() const { return partial_archived.has_value(); }

    friend bool operator==(const LastArchivedBlock&, const LastArchivedBlock&) = default;
};

//! Version 0 header of an archived segment
struct SegmentHeader {
    static constexpr size_t kEncodedSize{sizeof(uint64_t) + kHashLength + kHashLength + sizeof(uint64_t) + 1 + sizeof(uint32_t)};

    SegmentIndex segment_index;
    //! Merkle root over the records of the archived segment
    Hash segment_commitment;
    Hash prev_segment_header_hash;
    LastArchivedBlock last_archived_block;

    Hash hash() const;

    friend bool operator==(const SegmentHeader&, const SegmentHeader&) = default;
};

Bytes encode(const SegmentHeader& header);
DecodingResult decode(ByteView from, SegmentHeader& to) noexcept;

}  // namespace silkdsn::dsn
