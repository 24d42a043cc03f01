// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <vector>

#include <silkdsn/core/types/block.hpp>
#include <silkdsn/sync/import_queue.hpp>

namespace silkdsn::sync::test_util {

//! In-memory chain holding the encoded blocks from genesis up to the best one
class FakeChain : public ChainClient {
  public:
    explicit FakeChain(const std::vector<Block>& blocks);

    BlockNum best_block_number() const override;
    std::optional<Bytes> block_bytes(BlockNum block_num) const override;

    //! Append a block on top of the best one
    void import_block(const IncomingBlock& block);

    //! Replace the local copy of a block
    void overwrite(BlockNum block_num, Bytes block_bytes);

    size_t best_block_queries() const { return best_block_queries_; }

  private:
    mutable std::mutex mutex_;
    std::vector<Bytes> blocks_;
    mutable std::atomic<size_t> best_block_queries_{0};
};

//! ImportQueue recording the submitted batches, optionally importing them into a FakeChain right away
class RecordingImportQueue : public ImportQueue {
  public:
    struct Batch {
        BlockOrigin origin;
        std::vector<IncomingBlock> blocks;
    };

    explicit RecordingImportQueue(FakeChain& chain) : chain_{chain} {}

    void import_blocks(BlockOrigin origin, std::vector<IncomingBlock> blocks) override;

    //! Import into the chain the blocks recorded while auto import was off
    void import_pending();

    //! Numbers of all the submitted blocks in submission order
    std::vector<BlockNum> submitted_block_numbers() const;

    const std::vector<Batch>& batches() const { return batches_; }

    bool auto_import{true};

  private:
    FakeChain& chain_;
    std::vector<Batch> batches_;
    size_t imported_batches_{0};
};

}  // namespace silkdsn::sync::test_util
