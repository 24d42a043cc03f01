// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "dsn_client.hpp"
#include "piece_availability_filter.hpp"
#include "primitives.hpp"

namespace silkdsn::dsn {

//! Pieces advertised by connected peers, used to route piece requests.
//! A single lock serializes all the accesses, peer filter updates are infrequent.
class PeerPieceAvailability {
  public:
    static constexpr size_t kConnectedPeersNumberLimit{50};

    explicit PeerPieceAvailability(size_t peers_limit = kConnectedPeersNumberLimit) : peers_limit_{peers_limit} {}

    //! \brief Replace the filter of a peer, evicting a random peer when over the limit
    //! \details The eviction choice is seeded by the updated peer id, so it is reproducible
    void update(const PeerId& peer_id, const FilterSnapshot& snapshot);

    //! \return true if the peer was tracked
    bool remove(const PeerId& peer_id);

    //! \return the peers possibly having the piece, sorted by id
    std::vector<PeerId> peers_with_piece(PieceIndex piece_index) const;

    size_t size() const;

  private:
    const size_t peers_limit_;
    mutable std::mutex mutex_;
    absl::flat_hash_map<PeerId, PieceAvailabilityFilter> filters_;
};

}  // namespace silkdsn::dsn
