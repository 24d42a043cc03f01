// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <silkdsn/core/common/base.hpp>
#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/core/types/block.hpp>
#include <silkdsn/core/types/hash.hpp>

namespace silkdsn::sync {

//! Tag of a batch submitted to the import queue
enum class BlockOrigin {
    kNetworkInitialSync,  // bulk import of historical blocks
    kNetworkBroadcast,    // block announced by a peer, hands over to the regular sync
};

struct IncomingBlock {
    Hash hash;
    BlockHeader header;
    Bytes body;
    bool import_existing{false};
    bool allow_missing_state{false};
    bool skip_execution{false};
};

//! Downstream consumer verifying and executing blocks
class ImportQueue {
  public:
    virtual ~ImportQueue() = default;

    //! Enqueue blocks for import, the outcome is notified by the queue itself
    virtual void import_blocks(BlockOrigin origin, std::vector<IncomingBlock> blocks) = 0;
};

//! Read access to the local chain
class ChainClient {
  public:
    virtual ~ChainClient() = default;

    //! Highest block imported so far, it never decreases
    virtual BlockNum best_block_number() const = 0;

    //! \return the encoded block, nothing if unknown
    virtual std::optional<Bytes> block_bytes(BlockNum block_num) const = 0;
};

}  // namespace silkdsn::sync
