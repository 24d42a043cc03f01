// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include <silkdsn/infra/concurrency/task.hpp>

#include "dsn_client.hpp"
#include "peer_piece_availability.hpp"
#include "piece_validator.hpp"
#include "primitives.hpp"

namespace silkdsn::dsn {

//! How many sources a single piece request may try
class RetryPolicy {
  public:
    //! The primary source plus the given number of alternates
    static constexpr RetryPolicy limited(size_t retries) { return RetryPolicy{retries}; }

    constexpr size_t max_attempts() const { return retries_ + 1; }

  private:
    constexpr explicit RetryPolicy(size_t retries) : retries_{retries} {}

    size_t retries_;
};

struct PieceProviderStatistics {
    std::atomic<uint64_t> requested{0};
    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> not_found{0};
    std::atomic<uint64_t> network_errors{0};
};

//! Retrieves single pieces from the network, returning only validated ones
class PieceProvider {
  public:
    //! \param validator optional, without it pieces are returned as received
    //! \param availability optional index of peers advertising pieces, without it requests use DHT routing only
    PieceProvider(DsnClient& client, std::shared_ptr<PieceValidator> validator, const PeerPieceAvailability* availability = nullptr)
        : client_{client}, validator_{std::move(validator)}, availability_{availability} {}

    //! \return the piece if some source provided a valid one, nothing otherwise
    //! \details Network errors and invalid pieces count as a miss for the tried source
    Task<std::optional<Piece>> get_piece(PieceIndex piece_index, RetryPolicy retry_policy);

    const PieceProviderStatistics& statistics() const { return statistics_; }

  private:
    DsnClient& client_;
    std::shared_ptr<PieceValidator> validator_;
    const PeerPieceAvailability* availability_;
    PieceProviderStatistics statistics_;
};

}  // namespace silkdsn::dsn
