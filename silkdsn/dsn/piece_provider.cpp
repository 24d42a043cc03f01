// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "piece_provider.hpp"

#include <vector>

#include <silkdsn/infra/common/log.hpp>

#include "error.hpp"

namespace silkdsn::dsn {

Task<std::optional<Piece>> PieceProvider::get_piece(PieceIndex piece_index, RetryPolicy retry_policy) {
    ++statistics_.requested;

    // Peers advertising the piece go first, DHT routing is the last resort
    std::vector<std::optional<PeerId>> sources;
    if (availability_) {
        for (auto& peer : availability_->peers_with_piece(piece_index)) {
            sources.emplace_back(std::move(peer));
        }
    }
    sources.emplace_back(std::nullopt);
    if (sources.size() > retry_policy.max_attempts()) {
        sources.resize(retry_policy.max_attempts());
    }

    for (const auto& source : sources) {
        const std::string source_name{source ? *source : "dht"};
        std::optional<Piece> piece;
        try {
            piece = co_await client_.fetch_piece(piece_index, source);
        } catch (const NetworkError& ex) {
            ++statistics_.network_errors;
            SILKDSN_TRACE << "PieceProvider: piece request failed"
                          << log::Args{"piece", piece_index.to_string(), "source", source_name, "error", ex.what()};
            continue;
        }
        if (!piece) {
            ++statistics_.not_found;
            SILKDSN_TRACE << "PieceProvider: piece not found" << log::Args{"piece", piece_index.to_string(), "source", source_name};
            continue;
        }
        if (validator_) {
            const auto validation{co_await validator_->validate(piece_index, *piece)};
            if (!validation) {
                ++statistics_.rejected;
                SILKDSN_WARN << "PieceProvider: received invalid piece"
                             << log::Args{"piece", piece_index.to_string(), "source", source_name};
                continue;
            }
        }
        ++statistics_.received;
        co_return piece;
    }
    co_return std::nullopt;
}

}  // namespace silkdsn::dsn
