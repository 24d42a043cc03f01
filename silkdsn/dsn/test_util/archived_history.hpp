// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <silkdsn/core/common/base.hpp>
#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/core/types/block.hpp>
#include <silkdsn/dsn/primitives.hpp>

namespace silkdsn::dsn::test_util {

struct ArchivedSegment {
    SegmentHeader header;
    //! kRecordedHistorySegmentSize bytes of segment source data
    Bytes source;
    //! kNumPieces pieces in position order
    std::vector<Piece> pieces;

    std::vector<std::optional<Piece>> all_pieces() const { return {pieces.begin(), pieces.end()}; }
};

//! Minimal archiver producing archived segments out of a sequence of blocks numbered from 0
class ArchivedHistoryBuilder {
  public:
    void add_block(ByteView encoded_block);

    //! Seal the segment being filled even if it is not full
    void finish();

    const std::vector<ArchivedSegment>& segments() const { return segments_; }
    std::vector<SegmentHeader> segment_headers() const;

  private:
    void open_segment();
    void seal_segment();

    std::vector<ArchivedSegment> segments_;
    Bytes current_;
    bool open_{false};
    BlockNum next_block_number_{0};
    LastArchivedBlock last_archived_block_;
};

//! Build a chain of count blocks with pseudo-random bodies of varying size
std::vector<Block> make_chain(size_t count, size_t average_body_size, uint64_t seed = 0);

//! Archive the given chain and seal the last segment
ArchivedHistoryBuilder archive_chain(const std::vector<Block>& chain);

}  // namespace silkdsn::dsn::test_util
