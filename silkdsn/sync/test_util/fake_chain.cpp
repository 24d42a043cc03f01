// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fake_chain.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace silkdsn::sync::test_util {

FakeChain::FakeChain(const std::vector<Block>& blocks) {
    if (blocks.empty()) {
        throw std::invalid_argument{"FakeChain needs at least the genesis block"};
    }
    for (const auto& block : blocks) {
        blocks_.push_back(encode(block));
    }
}

BlockNum FakeChain::best_block_number() const {
    ++best_block_queries_;
    std::scoped_lock lock{mutex_};
    return blocks_.size() - 1;
}

std::optional<Bytes> FakeChain::block_bytes(BlockNum block_num) const {
    std::scoped_lock lock{mutex_};
    if (block_num >= blocks_.size()) {
        return std::nullopt;
    }
    return blocks_[block_num];
}

void FakeChain::import_block(const IncomingBlock& block) {
    std::scoped_lock lock{mutex_};
    if (block.header.number != blocks_.size()) {
        throw std::logic_error{"FakeChain: block " + std::to_string(block.header.number) + " does not extend the chain"};
    }
    blocks_.push_back(encode(Block{block.header, block.body}));
}

void FakeChain::overwrite(BlockNum block_num, Bytes block_bytes) {
    std::scoped_lock lock{mutex_};
    blocks_.at(block_num) = std::move(block_bytes);
}

void RecordingImportQueue::import_blocks(BlockOrigin origin, std::vector<IncomingBlock> blocks) {
    batches_.push_back(Batch{origin, std::move(blocks)});
    if (auto_import) {
        import_pending();
    }
}

void RecordingImportQueue::import_pending() {
    for (; imported_batches_ < batches_.size(); ++imported_batches_) {
        for (const auto& block : batches_[imported_batches_].blocks) {
            chain_.import_block(block);
        }
    }
}

std::vector<BlockNum> RecordingImportQueue::submitted_block_numbers() const {
    std::vector<BlockNum> numbers;
    for (const auto& batch : batches_) {
        for (const auto& block : batch.blocks) {
            numbers.push_back(block.header.number);
        }
    }
    return numbers;
}

}  // namespace silkdsn::sync::test_util
