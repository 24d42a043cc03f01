// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <span>
#include <vector>

#include <silkdsn/infra/concurrency/task.hpp>

#include "dsn_client.hpp"
#include "primitives.hpp"

namespace silkdsn::dsn {

/**
 * Downloads the whole list of segment headers.
 *
 * The newest header is agreed upon by asking several peers, then the older headers are
 * downloaded backwards and checked against it through the chain of header hashes. When that
 * chain cannot be downloaded, the next most voted newest header is tried.
 */
class SegmentHeaderDownloader {
  public:
    static constexpr size_t kSegmentHeaderConsensusInitialNodes{20};
    static constexpr size_t kLastSegmentHeadersRequested{2};
    static constexpr size_t kSegmentHeadersPerRequest{1000};

    explicit SegmentHeaderDownloader(DsnClient& client) : client_{client} {}

    //! \return headers ordered by segment index starting at 0 without gaps, possibly empty
    //! \throws NetworkError if no peer can supply the headers
    Task<std::vector<SegmentHeader>> get_segment_headers();

  private:
    struct Tip {
        SegmentHeader header;
        std::vector<PeerId> peers;
    };

    //! \return the candidate newest headers, most voted first, empty if all peers have no header at all
    Task<std::vector<Tip>> find_tips(const std::vector<PeerId>& peers);

    //! \brief Download the headers below the tip from the peers which voted for it
    //! \throws NetworkError if the tip index is invalid or its chain cannot be downloaded
    Task<std::vector<SegmentHeader>> download_chain(const Tip& tip);

    //! \brief Check the downloaded batch against the indexes requested and the already known successor
    static bool verify_batch(std::span<const SegmentHeader> batch, std::span<const SegmentIndex> indexes, const SegmentHeader& successor);

    DsnClient& client_;
};

}  // namespace silkdsn::dsn
