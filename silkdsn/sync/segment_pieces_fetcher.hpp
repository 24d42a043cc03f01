// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <silkdsn/dsn/piece_provider.hpp>
#include <silkdsn/dsn/primitives.hpp>
#include <silkdsn/infra/concurrency/async_semaphore.hpp>
#include <silkdsn/infra/concurrency/task.hpp>

namespace silkdsn::sync {

/**
 * Retrieves enough pieces of a segment to reconstruct it.
 *
 * One fetch task is spawned per piece of the segment, source pieces first. At most kNumRawRecords
 * fetches run at the same time: source pieces get their permit upfront while parity pieces wait for
 * a permit returned by a fetch which did not produce a usable piece. A usable piece consumes its
 * permit for good, so parity fetches only replace failed ones.
 *
 * Once kNumRawRecords pieces are collected, or a fetch fails unexpectedly, waiting fetches are
 * interrupted and fetches still in flight are left to complete: their pieces are discarded. Those
 * fetches share the ownership of the PieceProvider, so the fetcher may be destroyed before they end.
 */
class SegmentPiecesFetcher {
  public:
    explicit SegmentPiecesFetcher(std::shared_ptr<dsn::PieceProvider> provider, size_t piece_retries = 0)
        : provider_{std::move(provider)}, retry_policy_{dsn::RetryPolicy::limited(piece_retries)} {}

    //! \return kNumPieces slots by position, holding at least kNumRawRecords pieces unless too few were available
    Task<std::vector<std::optional<dsn::Piece>>> fetch(dsn::SegmentIndex segment_index);

  private:
    struct Collector;

    static Task<void> fetch_piece(std::shared_ptr<dsn::PieceProvider> provider,
                                  dsn::RetryPolicy retry_policy,
                                  std::shared_ptr<Collector> collector,
                                  dsn::PieceIndex piece_index,
                                  std::optional<concurrency::SemaphorePermit> permit);

    std::shared_ptr<dsn::PieceProvider> provider_;
    dsn::RetryPolicy retry_policy_;
};

}  // namespace silkdsn::sync
