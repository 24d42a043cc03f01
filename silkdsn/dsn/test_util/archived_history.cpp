// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "archived_history.hpp"

#include <random>

#include <silkdsn/core/common/assert.hpp>
#include <silkdsn/dsn/archiving/erasure_coding.hpp>
#include <silkdsn/dsn/archiving/segment_item.hpp>
#include <silkdsn/dsn/crypto/merkle_commitment.hpp>

namespace silkdsn::dsn::test_util {

void ArchivedHistoryBuilder::add_block(ByteView encoded_block) {
    const BlockNum number{next_block_number_++};
    size_t archived{0};
    while (true) {
        if (!open_) {
            open_segment();
        }
        const size_t remaining{kRecordedHistorySegmentSize - current_.size()};
        if (remaining <= SegmentItem::kHeaderSize) {
            seal_segment();
            continue;
        }
        const size_t room{remaining - SegmentItem::kHeaderSize};
        const size_t left{encoded_block.size() - archived};
        if (left <= room) {
            const auto type{archived == 0 ? SegmentItemType::kBlock : SegmentItemType::kBlockEnd};
            encode(current_, SegmentItem{type, Bytes{encoded_block.substr(archived)}});
            last_archived_block_ = {.number = number, .partial_archived = std::nullopt};
            return;
        }
        const auto type{archived == 0 ? SegmentItemType::kBlockStart : SegmentItemType::kBlockContinuation};
        encode(current_, SegmentItem{type, Bytes{encoded_block.substr(archived, room)}});
        archived += room;
        last_archived_block_ = {.number = number, .partial_archived = static_cast<uint32_t>(archived)};
        seal_segment();
    }
}

void ArchivedHistoryBuilder::finish() {
    if (open_) {
        seal_segment();
    }
}

std::vector<SegmentHeader> ArchivedHistoryBuilder::segment_headers() const {
    std::vector<SegmentHeader> headers;
    headers.reserve(segments_.size());
    for (const auto& segment : segments_) {
        headers.push_back(segment.header);
    }
    return headers;
}

void ArchivedHistoryBuilder::open_segment() {
    current_.clear();
    current_.reserve(kRecordedHistorySegmentSize);
    if (!segments_.empty()) {
        encode(current_, SegmentItem{SegmentItemType::kParentSegmentHeader, encode(segments_.back().header)});
    }
    open_ = true;
}

void ArchivedHistoryBuilder::seal_segment() {
    current_.resize(kRecordedHistorySegmentSize, 0);

    std::vector<Bytes> records;
    records.reserve(kNumPieces);
    for (size_t i{0}; i < kNumRawRecords; ++i) {
        records.push_back(current_.substr(i * kRecordSize, kRecordSize));
    }
    auto parity{ErasureCoding::extend(records)};
    SILKDSN_ASSERT(parity.has_value());
    records.insert(records.end(), parity->begin(), parity->end());

    const SegmentCommitment commitment{build_segment_commitment(records)};

    ArchivedSegment segment;
    segment.header.segment_index = SegmentIndex{segments_.size()};
    segment.header.segment_commitment = commitment.root;
    if (!segments_.empty()) {
        segment.header.prev_segment_header_hash = segments_.back().header.hash();
    }
    segment.header.last_archived_block = last_archived_block_;
    segment.source = std::move(current_);
    segment.pieces.reserve(kNumPieces);
    for (size_t position{0}; position < kNumPieces; ++position) {
        segment.pieces.push_back(Piece::assemble(records[position], commitment.witnesses[position]));
    }
    segments_.push_back(std::move(segment));

    current_ = Bytes{};
    open_ = false;
}

std::vector<Block> make_chain(size_t count, size_t average_body_size, uint64_t seed) {
    std::mt19937_64 rng{seed};
    std::uniform_int_distribution<size_t> size_dist{average_body_size / 2, average_body_size + average_body_size / 2};
    std::uniform_int_distribution<int> byte_dist{0, 255};

    std::vector<Block> chain;
    chain.reserve(count);
    Hash parent_hash{};
    for (size_t number{0}; number < count; ++number) {
        Bytes body(size_dist(rng), 0);
        for (auto& b : body) {
            b = static_cast<uint8_t>(byte_dist(rng));
        }
        chain.push_back(make_block(number, parent_hash, 1'700'000'000 + 6 * number, std::move(body)));
        parent_hash = chain.back().header.hash();
    }
    return chain;
}

ArchivedHistoryBuilder archive_chain(const std::vector<Block>& chain) {
    ArchivedHistoryBuilder builder;
    for (const auto& block : chain) {
        builder.add_block(encode(block));
    }
    builder.finish();
    return builder;
}

}  // namespace silkdsn::dsn::test_util
