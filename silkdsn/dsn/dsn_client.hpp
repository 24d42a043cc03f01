// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <silkdsn/infra/concurrency/task.hpp>

#include "primitives.hpp"

namespace silkdsn::dsn {

using PeerId = std::string;

//! Requests to the distributed storage network.
//! Every call throws NetworkError when the transport fails, timeouts included.
class DsnClient {
  public:
    virtual ~DsnClient() = default;

    virtual Task<std::vector<PeerId>> connected_peers(size_t limit) = 0;

    //! \brief Fetch a piece from the given peer or, without a peer, via DHT routing
    //! \return the piece as received, not yet validated, or nothing if not found
    virtual Task<std::optional<Piece>> fetch_piece(PieceIndex piece_index, std::optional<PeerId> peer) = 0;

    //! \brief Ask a peer for the newest segment headers it knows, newest first
    virtual Task<std::vector<SegmentHeader>> fetch_last_segment_headers(const PeerId& peer, size_t count) = 0;

    //! \brief Ask a peer for the segment headers with the given indexes
    virtual Task<std::vector<SegmentHeader>> fetch_segment_headers(const PeerId& peer, std::vector<SegmentIndex> segment_indexes) = 0;
};

}  // namespace silkdsn::dsn
