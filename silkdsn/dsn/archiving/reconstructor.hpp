// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include <silkdsn/core/common/base.hpp>
#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/dsn/primitives.hpp>

namespace silkdsn::dsn {

enum class ReconstructorError {
    kIncorrectPiecesLength,      // not exactly kNumPieces slots
    kNotEnoughPieces,            // less than kNumRawRecords pieces
    kSegmentDecoding,            // erasure decoding or segment item decoding failed
    kInconsistentBlockSequence,  // items do not follow the blocks of previous segments
};

struct ReconstructedContents {
    //! Header of the previous segment, carried by every segment but the first one
    std::optional<SegmentHeader> segment_header;
    //! Complete blocks in increasing number order
    std::vector<std::pair<BlockNum, Bytes>> blocks;
};

//! Turns archived segments back into blocks.
//! A block split across segments is carried over to the next add_segment call: a fresh instance
//! silently drops the bytes of a block whose beginning it has never seen.
class Reconstructor {
  public:
    //! \param pieces one slot per position of the archived segment, empty if the piece is missing
    tl::expected<ReconstructedContents, ReconstructorError> add_segment(std::span<const std::optional<Piece>> pieces);

  private:
    struct PartialBlock {
        BlockNum number{0};
        Bytes bytes;
    };

    tl::expected<void, ReconstructorError> follow_parent_header(const SegmentHeader& parent);

    std::optional<PartialBlock> partial_block_;
    std::optional<BlockNum> next_block_number_;
    bool drop_carried_block_{false};
};

}  // namespace silkdsn::dsn
