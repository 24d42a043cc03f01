// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <silkdsn/core/common/base.hpp>
#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/dsn/crypto/commitment_verifier.hpp>
#include <silkdsn/dsn/dsn_client.hpp>
#include <silkdsn/dsn/peer_piece_availability.hpp>
#include <silkdsn/dsn/piece_provider.hpp>
#include <silkdsn/dsn/piece_validator.hpp>
#include <silkdsn/dsn/primitives.hpp>
#include <silkdsn/dsn/segment_header_downloader.hpp>
#include <silkdsn/dsn/segment_header_store.hpp>
#include <silkdsn/infra/concurrency/task.hpp>

#include "dsn_sync_settings.hpp"
#include "import_queue.hpp"
#include "segment_pieces_fetcher.hpp"

namespace silkdsn::sync {

/**
 * Imports the archived history from the DSN into the local chain.
 *
 * Segment headers are downloaded and stored first, then segments are processed in increasing index
 * order starting from 1 (segment 0 is known locally): the pieces of each segment are retrieved and
 * validated, the segment is reconstructed and its new blocks are queued for import. Segments whose
 * blocks are already imported are skipped without retrieving any piece.
 *
 * Block submission is paused as long as the queued blocks are too far ahead of the best imported one.
 * The very last block is submitted alone as a broadcast block, handing over to the regular sync.
 *
 * The services passed by reference are owned by the caller and must outlive any work left on the
 * executor, the importer itself may be destroyed as soon as run() completes.
 */
class DsnBlockImporter {
  public:
    enum class State {
        kIdle,
        kHeadersFetched,
        kProcessingSegment,
        kDraining,
        kDone,
        kFailed,
    };

    DsnBlockImporter(DsnSyncSettings settings,
                     dsn::DsnClient& dsn_client,
                     dsn::SegmentHeaderStore& segment_header_store,
                     const dsn::CommitmentVerifier& commitment_verifier,
                     ChainClient& chain,
                     ImportQueue& import_queue,
                     const dsn::PeerPieceAvailability* peer_piece_availability = nullptr);

    DsnBlockImporter(const DsnBlockImporter&) = delete;
    DsnBlockImporter& operator=(const DsnBlockImporter&) = delete;

    //! \brief Run the import once
    //! \return the number of blocks queued for import
    //! \throws dsn::SyncError if the import cannot complete
    Task<uint64_t> run();

    State state() const { return state_; }
    const dsn::PieceProviderStatistics& piece_statistics() const { return piece_provider_->statistics(); }

  private:
    Task<uint64_t> import_segments();

    //! \return true if the segment has no block to import
    bool can_skip_segment(const dsn::SegmentHeader& header, bool last_segment) const;

    //! \brief Queue the new blocks of a reconstructed segment, waiting for the import queue if needed
    Task<void> queue_blocks(std::vector<std::pair<BlockNum, Bytes>> blocks, bool last_segment);

    //! \brief Give the import queue some time to drain, then return the new best block
    Task<BlockNum> wait_for_blocks_to_import();

    //! \brief Compare a reconstructed block already present locally with the local copy
    void check_known_block(BlockNum block_num, ByteView block_bytes) const;

    IncomingBlock make_incoming_block(BlockNum block_num, ByteView block_bytes) const;

    void submit(BlockOrigin origin, std::vector<IncomingBlock> blocks);

    void set_state(State state, std::optional<dsn::SegmentIndex> segment_index = std::nullopt);

    DsnSyncSettings settings_;
    dsn::SegmentHeaderStore& segment_header_store_;
    ChainClient& chain_;
    ImportQueue& import_queue_;
    dsn::SegmentHeaderDownloader header_downloader_;
    // Shared with the piece fetches, which may outlive a failed run
    std::shared_ptr<dsn::PieceProvider> piece_provider_;
    SegmentPiecesFetcher pieces_fetcher_;

    std::atomic<State> state_{State::kIdle};
    uint64_t queued_blocks_{0};
    std::optional<BlockNum> last_queued_block_;
};

}  // namespace silkdsn::sync
