// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include <silkdsn/dsn/dsn_client.hpp>

#include "archived_history.hpp"

namespace silkdsn::dsn::test_util {

//! DsnClient serving an archived history, with knobs to simulate misbehaving peers
class FakeDsnClient : public DsnClient {
  public:
    explicit FakeDsnClient(std::vector<ArchivedSegment> segments, std::vector<PeerId> peers = {"peer-a", "peer-b", "peer-c"})
        : segments_{std::move(segments)}, peers_{std::move(peers)} {}

    Task<std::vector<PeerId>> connected_peers(size_t limit) override;
    Task<std::optional<Piece>> fetch_piece(PieceIndex piece_index, std::optional<PeerId> peer) override;
    Task<std::vector<SegmentHeader>> fetch_last_segment_headers(const PeerId& peer, size_t count) override;
    Task<std::vector<SegmentHeader>> fetch_segment_headers(const PeerId& peer, std::vector<SegmentIndex> segment_indexes) override;

    //! Pieces nobody has
    std::set<PieceIndex> missing_pieces;
    //! Pieces whose requests fail with a network error
    std::set<PieceIndex> failing_pieces;
    //! Pieces returned with a tampered record
    std::set<PieceIndex> corrupted_pieces;
    //! Peers failing every request with a network error
    std::set<PeerId> unreachable_peers;
    //! Pieces whose requests fail with an error other than a network one
    std::set<PieceIndex> broken_pieces;
    //! Pieces served only after the given delay
    std::map<PieceIndex, std::chrono::milliseconds> delayed_pieces;
    //! Peers returning segment headers which do not chain up
    std::set<PeerId> lying_peers;
    //! Index that lying peers give to their newest segment header
    std::optional<SegmentIndex> advertised_tip;

    std::vector<PieceIndex> requested_pieces() const;

  private:
    std::vector<ArchivedSegment> segments_;
    std::vector<PeerId> peers_;
    mutable std::mutex mutex_;
    std::vector<PieceIndex> requested_pieces_;
};

}  // namespace silkdsn::dsn::test_util
