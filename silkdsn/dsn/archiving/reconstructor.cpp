// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "reconstructor.hpp"

#include <algorithm>

#include <silkdsn/infra/common/log.hpp>

#include "erasure_coding.hpp"
#include "segment_item.hpp"

namespace silkdsn::dsn {

tl::expected<ReconstructedContents, ReconstructorError> Reconstructor::add_segment(std::span<const std::optional<Piece>> pieces) {
    if (pieces.size() != kNumPieces) {
        return tl::unexpected{ReconstructorError::kIncorrectPiecesLength};
    }
    const auto available = static_cast<size_t>(std::count_if(pieces.begin(), pieces.end(), [](const auto& p) { return p.has_value(); }));
    if (available < kNumRawRecords) {
        return tl::unexpected{ReconstructorError::kNotEnoughPieces};
    }

    std::vector<std::optional<Bytes>> shards(kNumPieces);
    for (size_t position{0}; position < kNumPieces; ++position) {
        if (pieces[position]) {
            shards[position] = Bytes{pieces[position]->record()};
        }
    }
    const auto source_records{ErasureCoding::recover_source(shards)};
    if (!source_records) {
        return tl::unexpected{ReconstructorError::kSegmentDecoding};
    }

    Bytes segment;
    segment.reserve(kRecordedHistorySegmentSize);
    for (const auto& record : *source_records) {
        segment.append(record);
    }

    std::vector<SegmentItem> items;
    if (!decode(segment, items)) {
        return tl::unexpected{ReconstructorError::kSegmentDecoding};
    }

    ReconstructedContents contents;
    for (size_t i{0}; i < items.size(); ++i) {
        SegmentItem& item{items[i]};
        switch (item.type) {
            case SegmentItemType::kParentSegmentHeader: {
                SegmentHeader parent;
                if (i != 0 || contents.segment_header) {
                    return tl::unexpected{ReconstructorError::kInconsistentBlockSequence};
                }
                if (!decode(item.payload, parent)) {
                    return tl::unexpected{ReconstructorError::kSegmentDecoding};
                }
                if (auto res{follow_parent_header(parent)}; !res) {
                    return tl::unexpected{res.error()};
                }
                contents.segment_header = parent;
                break;
            }
            case SegmentItemType::kBlock:
            case SegmentItemType::kBlockStart: {
                // A carried block must be terminated before any new block starts
                if (partial_block_ || drop_carried_block_) {
                    return tl::unexpected{ReconstructorError::kInconsistentBlockSequence};
                }
                const BlockNum number{next_block_number_.value_or(kEarliestBlockNum)};
                next_block_number_ = number + 1;
                if (item.type == SegmentItemType::kBlock) {
                    contents.blocks.emplace_back(number, std::move(item.payload));
                } else {
                    partial_block_ = PartialBlock{number, std::move(item.payload)};
                }
                break;
            }
            case SegmentItemType::kBlockContinuation:
            case SegmentItemType::kBlockEnd: {
                if (partial_block_) {
                    partial_block_->bytes.append(item.payload);
                    if (item.type == SegmentItemType::kBlockEnd) {
                        contents.blocks.emplace_back(partial_block_->number, std::move(partial_block_->bytes));
                        partial_block_.reset();
                    }
                } else if (drop_carried_block_) {
                    if (item.type == SegmentItemType::kBlockEnd) {
                        drop_carried_block_ = false;
                    }
                } else {
                    return tl::unexpected{ReconstructorError::kInconsistentBlockSequence};
                }
                break;
            }
            case SegmentItemType::kPadding:
                break;
        }
    }

    SILKDSN_TRACE << "Reconstructor: segment decoded"
                  << log::Args{"items", std::to_string(items.size()), "blocks", std::to_string(contents.blocks.size())};
    return contents;
}

tl::expected<void, ReconstructorError> Reconstructor::follow_parent_header(const SegmentHeader& parent) {
    const LastArchivedBlock& last{parent.last_archived_block};
    if (partial_block_) {
        if (!last.is_partial() || last.number != partial_block_->number) {
            return tl::unexpected{ReconstructorError::kInconsistentBlockSequence};
        }
    } else if (drop_carried_block_) {
        if (!last.is_partial() || last.number + 1 != next_block_number_) {
            return tl::unexpected{ReconstructorError::kInconsistentBlockSequence};
        }
    } else if (next_block_number_) {
        if (last.is_partial() || last.number + 1 != *next_block_number_) {
            return tl::unexpected{ReconstructorError::kInconsistentBlockSequence};
        }
    } else {
        // First segment seen by this instance: skip the remainder of a block started earlier
        drop_carried_block_ = last.is_partial();
    }
    next_block_number_ = last.number + 1;
    return {};
}

}  // namespace silkdsn::dsn
