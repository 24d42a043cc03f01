// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fake_dsn_client.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <silkdsn/dsn/error.hpp>

namespace silkdsn::dsn::test_util {

Task<std::vector<PeerId>> FakeDsnClient::connected_peers(size_t limit) {
    std::vector<PeerId> peers{peers_.begin(), peers_.begin() + static_cast<std::ptrdiff_t>(std::min(limit, peers_.size()))};
    co_return peers;
}

Task<std::optional<Piece>> FakeDsnClient::fetch_piece(PieceIndex piece_index, std::optional<PeerId> peer) {
    {
        std::scoped_lock lock{mutex_};
        requested_pieces_.push_back(piece_index);
    }
    if (const auto delay{delayed_pieces.find(piece_index)}; delay != delayed_pieces.end()) {
        boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};
        timer.expires_after(delay->second);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
    if (broken_pieces.contains(piece_index)) {
        throw std::runtime_error{"malformed piece response"};
    }
    if ((peer && unreachable_peers.contains(*peer)) || failing_pieces.contains(piece_index)) {
        throw NetworkError{"piece request timed out"};
    }
    const uint64_t segment_index{piece_index.segment_index().value()};
    if (missing_pieces.contains(piece_index) || segment_index >= segments_.size()) {
        co_return std::nullopt;
    }
    const Piece& piece{segments_[segment_index].pieces[piece_index.position()]};
    if (corrupted_pieces.contains(piece_index)) {
        Bytes record{piece.record()};
        record[0] ^= 0xff;
        co_return Piece::assemble(record, piece.witness());
    }
    co_return piece;
}

Task<std::vector<SegmentHeader>> FakeDsnClient::fetch_last_segment_headers(const PeerId& peer, size_t count) {
    if (unreachable_peers.contains(peer)) {
        throw NetworkError{"peer unreachable"};
    }
    std::vector<SegmentHeader> headers;
    for (auto it{segments_.rbegin()}; it != segments_.rend() && headers.size() < count; ++it) {
        headers.push_back(it->header);
    }
    if (lying_peers.contains(peer) && advertised_tip && !headers.empty()) {
        headers.front().segment_index = *advertised_tip;
    }
    co_return headers;
}

Task<std::vector<SegmentHeader>> FakeDsnClient::fetch_segment_headers(const PeerId& peer, std::vector<SegmentIndex> segment_indexes) {
    if (unreachable_peers.contains(peer)) {
        throw NetworkError{"peer unreachable"};
    }
    std::vector<SegmentHeader> headers;
    for (const auto& index : segment_indexes) {
        if (index.value() >= segments_.size()) {
            break;
        }
        SegmentHeader header{segments_[index.value()].header};
        if (lying_peers.contains(peer)) {
            header.last_archived_block.number += 1;
        }
        headers.push_back(header);
    }
    co_return headers;
}

std::vector<PieceIndex> FakeDsnClient::requested_pieces() const {
    std::scoped_lock lock{mutex_};
    return requested_pieces_;
}

}  // namespace silkdsn::dsn::test_util
