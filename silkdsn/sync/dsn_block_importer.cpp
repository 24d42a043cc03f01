// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dsn_block_importer.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <magic_enum.hpp>

#include <silkdsn/dsn/archiving/reconstructor.hpp>
#include <silkdsn/dsn/error.hpp>
#include <silkdsn/infra/common/ensure.hpp>
#include <silkdsn/infra/common/log.hpp>

namespace silkdsn::sync {

using dsn::SyncError;
using dsn::SyncErrorCode;

DsnBlockImporter::DsnBlockImporter(DsnSyncSettings settings,
                                   dsn::DsnClient& dsn_client,
                                   dsn::SegmentHeaderStore& segment_header_store,
                                   const dsn::CommitmentVerifier& commitment_verifier,
                                   ChainClient& chain,
                                   ImportQueue& import_queue,
                                   const dsn::PeerPieceAvailability* peer_piece_availability)
    : settings_{settings},
      segment_header_store_{segment_header_store},
      chain_{chain},
      import_queue_{import_queue},
      header_downloader_{dsn_client},
      piece_provider_{std::make_shared<dsn::PieceProvider>(
          dsn_client,
          std::make_shared<dsn::SegmentCommitmentPieceValidator>(segment_header_store, commitment_verifier),
          peer_piece_availability)},
      pieces_fetcher_{piece_provider_, settings.piece_retries} {}

Task<uint64_t> DsnBlockImporter::run() {
    try {
        const uint64_t imported{co_await import_segments()};
        set_state(State::kDone);
        SILKDSN_INFO << "DsnBlockImporter: import from DSN completed" << log::Args{"blocks", std::to_string(imported)};
        co_return imported;
    } catch (const std::exception& ex) {
        set_state(State::kFailed);
        SILKDSN_ERROR << "DsnBlockImporter: import from DSN failed" << log::Args{"error", ex.what()};
        throw;
    }
}

Task<uint64_t> DsnBlockImporter::import_segments() {
    queued_blocks_ = 0;
    last_queued_block_.reset();

    const std::vector<dsn::SegmentHeader> segment_headers{co_await header_downloader_.get_segment_headers()};
    SILKDSN_DEBUG << "DsnBlockImporter: found segment headers" << log::Args{"count", std::to_string(segment_headers.size())};
    if (segment_headers.empty()) {
        co_return 0;
    }

    try {
        segment_header_store_.add_segment_headers(segment_headers);
    } catch (const std::invalid_argument& ex) {
        throw SyncError{SyncErrorCode::kChainMismatch, std::string{"downloaded segment headers conflict with stored ones: "} + ex.what()};
    }
    set_state(State::kHeadersFetched);

    dsn::Reconstructor reconstructor;
    // Skip the first segment, everyone has it locally
    for (size_t i{1}; i < segment_headers.size(); ++i) {
        const dsn::SegmentHeader& header{segment_headers[i]};
        const bool last_segment{i + 1 == segment_headers.size()};

        SILKDSN_TRACE << "DsnBlockImporter: checking segment header"
                      << log::Args{"segment", header.segment_index.to_string(),
                                   "last_archived_block", std::to_string(header.last_archived_block.number),
                                   "partial", header.last_archived_block.is_partial() ? "true" : "false"};
        if (can_skip_segment(header, last_segment)) {
            SILKDSN_DEBUG << "DsnBlockImporter: segment already imported" << log::Args{"segment", header.segment_index.to_string()};
            // Blocks continuing from the skipped segment are already imported as well
            reconstructor = dsn::Reconstructor{};
            continue;
        }

        set_state(State::kProcessingSegment, header.segment_index);
        const std::vector<std::optional<dsn::Piece>> pieces{co_await pieces_fetcher_.fetch(header.segment_index)};

        auto contents{reconstructor.add_segment(pieces)};
        if (!contents) {
            throw SyncError{SyncErrorCode::kReconstruction,
                            "segment " + header.segment_index.to_string() + ": " + std::string{magic_enum::enum_name(contents.error())}};
        }
        SILKDSN_TRACE << "DsnBlockImporter: segment reconstructed"
                      << log::Args{"segment", header.segment_index.to_string(), "blocks", std::to_string(contents->blocks.size())};

        co_await queue_blocks(std::move(contents->blocks), last_segment);
    }

    co_return queued_blocks_;
}

bool DsnBlockImporter::can_skip_segment(const dsn::SegmentHeader& header, bool last_segment) const {
    const BlockNum best_block_num{chain_.best_block_number()};
    const dsn::LastArchivedBlock& last_archived_block{header.last_archived_block};
    if (last_archived_block.number <= best_block_num) {
        return true;
    }
    // Only a part of the very next block is available and no segment follows to complete it
    return last_archived_block.number == best_block_num + 1 && last_archived_block.is_partial() && last_segment;
}

Task<void> DsnBlockImporter::queue_blocks(std::vector<std::pair<BlockNum, Bytes>> blocks, bool last_segment) {
    std::vector<IncomingBlock> blocks_to_import;
    BlockNum best_block_num{chain_.best_block_number()};
    for (const auto& [block_num, block_bytes] : blocks) {
        if (block_num <= best_block_num) {
            check_known_block(block_num, block_bytes);
            continue;
        }

        // Limit the number of queued blocks
        while (block_num > best_block_num && block_num - best_block_num >= settings_.queued_blocks_limit) {
            if (!blocks_to_import.empty()) {
                submit(BlockOrigin::kNetworkInitialSync, std::move(blocks_to_import));
                blocks_to_import.clear();
            }
            SILKDSN_TRACE << "DsnBlockImporter: queued blocks reached the limit, waiting before retrying"
                          << log::Args{"block", std::to_string(block_num), "best", std::to_string(best_block_num)};
            best_block_num = co_await wait_for_blocks_to_import();
        }
        if (block_num <= best_block_num) {
            // Imported from another source while waiting
            check_known_block(block_num, block_bytes);
            continue;
        }

        const BlockNum expected_block_num{std::max(best_block_num, last_queued_block_.value_or(best_block_num)) + 1};
        if (block_num != expected_block_num) {
            throw SyncError{SyncErrorCode::kChainMismatch,
                            "block " + std::to_string(block_num) + " does not follow block " + std::to_string(expected_block_num - 1)};
        }

        blocks_to_import.push_back(make_incoming_block(block_num, block_bytes));
        last_queued_block_ = block_num;
        ++queued_blocks_;
        if (settings_.log_progress_every != 0 && queued_blocks_ % settings_.log_progress_every == 0) {
            SILKDSN_INFO << "DsnBlockImporter: adding blocks to the import queue" << log::Args{"block", std::to_string(block_num)};
        }
    }

    if (blocks_to_import.empty()) {
        SILKDSN_DEBUG << "DsnBlockImporter: no new block in segment";
        co_return;
    }

    if (last_segment) {
        set_state(State::kDraining);
        IncomingBlock last_block{std::move(blocks_to_import.back())};
        blocks_to_import.pop_back();
        if (!blocks_to_import.empty()) {
            submit(BlockOrigin::kNetworkInitialSync, std::move(blocks_to_import));
        }
        // Notify the regular sync that bulk import is over
        std::vector<IncomingBlock> broadcast;
        broadcast.push_back(std::move(last_block));
        submit(BlockOrigin::kNetworkBroadcast, std::move(broadcast));
    } else {
        submit(BlockOrigin::kNetworkInitialSync, std::move(blocks_to_import));
    }
}

Task<BlockNum> DsnBlockImporter::wait_for_blocks_to_import() {
    boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};
    timer.expires_after(settings_.wait_for_blocks_to_import);
    co_await timer.async_wait(boost::asio::use_awaitable);
    co_return chain_.best_block_number();
}

void DsnBlockImporter::check_known_block(BlockNum block_num, ByteView block_bytes) const {
    if (block_num != 0 && !settings_.verify_imported_blocks) {
        return;
    }
    const std::optional<Bytes> local_bytes{chain_.block_bytes(block_num)};
    if (!local_bytes) {
        if (block_num == 0) {
            throw SyncError{SyncErrorCode::kChainMismatch, "genesis block not found locally"};
        }
        return;
    }
    if (ByteView{*local_bytes} != block_bytes) {
        throw SyncError{SyncErrorCode::kChainMismatch,
                        block_num == 0 ? std::string{"wrong genesis block"} : "block " + std::to_string(block_num) + " differs from the local chain"};
    }
}

IncomingBlock DsnBlockImporter::make_incoming_block(BlockNum block_num, ByteView block_bytes) const {
    Block block;
    if (const auto result{decode(block_bytes, block)}; !result) {
        throw SyncError{SyncErrorCode::kReconstruction,
                        "cannot decode block " + std::to_string(block_num) + ": " + std::string{magic_enum::enum_name(result.error())}};
    }
    if (block.header.number != block_num) {
        throw SyncError{SyncErrorCode::kChainMismatch,
                        "block " + std::to_string(block_num) + " has number " + std::to_string(block.header.number) + " in its header"};
    }
    return IncomingBlock{
        .hash = block.header.hash(),
        .header = block.header,
        .body = std::move(block.body),
        .import_existing = settings_.force,
    };
}

void DsnBlockImporter::submit(BlockOrigin origin, std::vector<IncomingBlock> blocks) {
    ensure(!blocks.empty(), "DsnBlockImporter: empty batch submitted");
    SILKDSN_DEBUG << "DsnBlockImporter: submitting blocks"
                  << log::Args{"origin", std::string{magic_enum::enum_name(origin)},
                               "first", std::to_string(blocks.front().header.number),
                               "last", std::to_string(blocks.back().header.number)};
    import_queue_.import_blocks(origin, std::move(blocks));
}

void DsnBlockImporter::set_state(State state, std::optional<dsn::SegmentIndex> segment_index) {
    state_ = state;
    log::Args args{"state", std::string{magic_enum::enum_name(state)}};
    if (segment_index) {
        args.emplace_back("segment");
        args.emplace_back(segment_index->to_string());
    }
    SILKDSN_DEBUG << "DsnBlockImporter: state changed" << args;
}

}  // namespace silkdsn::sync
