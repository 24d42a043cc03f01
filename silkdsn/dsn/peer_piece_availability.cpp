// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "peer_piece_availability.hpp"

#include <algorithm>
#include <random>

#include <silkdsn/core/common/bytes_to_string.hpp>
#include <silkdsn/core/common/endian.hpp>
#include <silkdsn/core/common/util.hpp>
#include <silkdsn/infra/common/log.hpp>

namespace silkdsn::dsn {

static uint64_t eviction_seed(const PeerId& peer_id) {
    const ethash::hash256 h{keccak256(string_view_to_byte_view(peer_id))};
    return endian::load_little_u64(h.bytes);
}

void PeerPieceAvailability::update(const PeerId& peer_id, const FilterSnapshot& snapshot) {
    auto filter{PieceAvailabilityFilter::from_snapshot(snapshot)};
    if (!filter) {
        SILKDSN_WARN << "PeerPieceAvailability: invalid filter snapshot ignored"
                     << log::Args{"peer", peer_id, "values", std::to_string(snapshot.values.size()), "length", std::to_string(snapshot.length)};
        return;
    }

    std::scoped_lock lock{mutex_};
    filters_.insert_or_assign(peer_id, std::move(*filter));

    if (filters_.size() <= peers_limit_) {
        return;
    }

    // Hash map iteration order is unspecified, sort the ids to make the choice reproducible
    std::vector<PeerId> peers;
    peers.reserve(filters_.size());
    for (const auto& [id, _] : filters_) {
        peers.push_back(id);
    }
    std::sort(peers.begin(), peers.end());

    std::mt19937_64 rng{eviction_seed(peer_id)};
    std::uniform_int_distribution<size_t> distribution{0, peers.size() - 1};
    const PeerId& evicted{peers[distribution(rng)]};
    filters_.erase(evicted);
    SILKDSN_DEBUG << "PeerPieceAvailability: evicted peer" << log::Args{"peer", evicted};
}

bool PeerPieceAvailability::remove(const PeerId& peer_id) {
    std::scoped_lock lock{mutex_};
    return filters_.erase(peer_id) > 0;
}

std::vector<PeerId> PeerPieceAvailability::peers_with_piece(PieceIndex piece_index) const {
    std::vector<PeerId> peers;
    {
        std::scoped_lock lock{mutex_};
        for (const auto& [peer_id, filter] : filters_) {
            if (filter.contains(piece_index)) {
                peers.push_back(peer_id);
            }
        }
    }
    std::sort(peers.begin(), peers.end());
    return peers;
}

size_t PeerPieceAvailability::size() const {
    std::scoped_lock lock{mutex_};
    return filters_.size();
}

}  // namespace silkdsn::dsn
