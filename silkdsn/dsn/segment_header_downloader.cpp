// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_header_downloader.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <string>
#include <utility>

#include <silkdsn/infra/common/log.hpp>

#include "error.hpp"

namespace silkdsn::dsn {

Task<std::vector<SegmentHeader>> SegmentHeaderDownloader::get_segment_headers() {
    const std::vector<PeerId> peers{co_await client_.connected_peers(kSegmentHeaderConsensusInitialNodes)};
    if (peers.empty()) {
        throw NetworkError{"no connected peers to download segment headers from"};
    }

    const std::vector<Tip> tips{co_await find_tips(peers)};
    if (tips.empty()) {
        SILKDSN_INFO << "SegmentHeaderDownloader: no segment headers available yet";
        co_return std::vector<SegmentHeader>{};
    }

    // A tip whose chain cannot be verified is abandoned for the next best one
    for (size_t i{0}; i + 1 < tips.size(); ++i) {
        try {
            co_return co_await download_chain(tips[i]);
        } catch (const NetworkError& ex) {
            SILKDSN_WARN << "SegmentHeaderDownloader: abandoning newest segment header candidate"
                         << log::Args{"segment", tips[i].header.segment_index.to_string(), "error", ex.what()};
        }
    }
    co_return co_await download_chain(tips.back());
}

Task<std::vector<SegmentHeader>> SegmentHeaderDownloader::download_chain(const Tip& tip) {
    const uint64_t tip_index{tip.header.segment_index.value()};
    if (tip_index == std::numeric_limits<uint64_t>::max()) {
        throw NetworkError{"newest segment header has an invalid index"};
    }
    SILKDSN_INFO << "SegmentHeaderDownloader: found newest segment header"
                 << log::Args{"segment", std::to_string(tip_index), "peers", std::to_string(tip.peers.size())};

    // Newest first, only headers verified against their successor are added
    std::vector<SegmentHeader> headers{tip.header};
    size_t peer_cursor{0};
    uint64_t next_missing{tip_index};  // all headers at or above this index are known
    while (next_missing > 0) {
        const uint64_t batch_size{std::min<uint64_t>(next_missing, kSegmentHeadersPerRequest)};
        std::vector<SegmentIndex> indexes;
        indexes.reserve(batch_size);
        for (uint64_t i{0}; i < batch_size; ++i) {
            indexes.emplace_back(next_missing - 1 - i);
        }

        bool downloaded{false};
        for (size_t attempt{0}; attempt < tip.peers.size() && !downloaded; ++attempt) {
            const PeerId& peer{tip.peers[peer_cursor]};
            peer_cursor = (peer_cursor + 1) % tip.peers.size();

            std::vector<SegmentHeader> batch;
            try {
                batch = co_await client_.fetch_segment_headers(peer, indexes);
            } catch (const NetworkError& ex) {
                SILKDSN_DEBUG << "SegmentHeaderDownloader: request failed" << log::Args{"peer", peer, "error", ex.what()};
                continue;
            }
            if (!verify_batch(batch, indexes, headers.back())) {
                SILKDSN_WARN << "SegmentHeaderDownloader: peer sent inconsistent segment headers" << log::Args{"peer", peer};
                continue;
            }
            headers.insert(headers.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
            downloaded = true;
        }
        if (!downloaded) {
            throw NetworkError{"cannot download segment headers below index " + std::to_string(next_missing)};
        }
        next_missing -= batch_size;
        SILKDSN_DEBUG << "SegmentHeaderDownloader: downloaded segment headers" << log::Args{"from", std::to_string(next_missing)};
    }

    std::reverse(headers.begin(), headers.end());
    if (headers.front().prev_segment_header_hash != Hash{}) {
        throw NetworkError{"first segment header has a parent"};
    }
    co_return headers;
}

Task<std::vector<SegmentHeaderDownloader::Tip>> SegmentHeaderDownloader::find_tips(const std::vector<PeerId>& peers) {
    std::vector<Tip> candidates;
    size_t answers{0};
    for (const auto& peer : peers) {
        std::vector<SegmentHeader> last_headers;
        try {
            last_headers = co_await client_.fetch_last_segment_headers(peer, kLastSegmentHeadersRequested);
        } catch (const NetworkError& ex) {
            SILKDSN_DEBUG << "SegmentHeaderDownloader: last headers request failed" << log::Args{"peer", peer, "error", ex.what()};
            continue;
        }
        ++answers;
        if (last_headers.empty()) {
            continue;
        }
        const auto newest{std::max_element(last_headers.begin(), last_headers.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.segment_index < rhs.segment_index;
        })};
        auto candidate{std::find_if(candidates.begin(), candidates.end(), [&](const Tip& tip) { return tip.header == *newest; })};
        if (candidate == candidates.end()) {
            candidates.push_back(Tip{*newest, {peer}});
        } else {
            candidate->peers.push_back(peer);
        }
    }
    if (answers == 0) {
        throw NetworkError{"no peer answered the segment headers request"};
    }

    // Most voted first, then the highest segment index
    std::stable_sort(candidates.begin(), candidates.end(), [](const Tip& lhs, const Tip& rhs) {
        if (lhs.peers.size() != rhs.peers.size()) {
            return lhs.peers.size() > rhs.peers.size();
        }
        return lhs.header.segment_index > rhs.header.segment_index;
    });
    co_return candidates;
}

bool SegmentHeaderDownloader::verify_batch(std::span<const SegmentHeader> batch, std::span<const SegmentIndex> indexes, const SegmentHeader& successor) {
    if (batch.size() != indexes.size()) {
        return false;
    }
    const SegmentHeader* next{&successor};
    for (size_t i{0}; i < batch.size(); ++i) {
        if (batch[i].segment_index != indexes[i] || batch[i].hash() != next->prev_segment_header_hash) {
            return false;
        }
        next = &batch[i];
    }
    return true;
}

}  // namespace silkdsn::dsn
