// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>

#include <silkdsn/core/common/base.hpp>

namespace silkdsn::sync {

struct DsnSyncSettings {
    bool enabled{false};                      // Whether historical blocks are imported from the DSN at all
    bool force{false};                        // Import blocks even if the chain already has them
    BlockNum queued_blocks_limit{2048};       // Max gap between queued and imported blocks before pausing
    std::chrono::milliseconds wait_for_blocks_to_import{1000};
    size_t piece_retries{0};                  // Alternate sources tried for each piece
    bool verify_imported_blocks{false};       // Compare every already imported block, not only genesis
    uint64_t log_progress_every{1000};        // Log progress every given number of queued blocks
};

}  // namespace silkdsn::sync
