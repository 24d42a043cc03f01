// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dsn_sync_options.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace silkdsn::cmd::common {

void add_dsn_sync_options(CLI::App& cli, sync::DsnSyncSettings& settings) {
    cli.add_flag("--sync-from-dsn", settings.enabled,
                 "Import the archived history from the DSN before the regular sync")
        ->capture_default_str();

    auto& dsn_opts = *cli.add_option_group("DSN sync", "Options of the block import from the DSN");
    dsn_opts.add_flag("--dsn.force", settings.force,
                      "Import blocks even if they are already present in the local chain")
        ->capture_default_str();
    dsn_opts.add_option("--dsn.queued-blocks-limit", settings.queued_blocks_limit,
                        "Max number of blocks queued ahead of the best imported block before pausing")
        ->capture_default_str()
        ->check(CLI::Range(uint64_t{1}, uint64_t{1'000'000}));
    dsn_opts.add_option_function<uint32_t>(
                "--dsn.import-wait",
                [&settings](const uint32_t& millis) { settings.wait_for_blocks_to_import = std::chrono::milliseconds{millis}; },
                "Time to wait for the queued blocks to be imported when the limit is reached (in milliseconds)")
        ->default_str(std::to_string(settings.wait_for_blocks_to_import.count()))
        ->check(CLI::Range(1u, 60'000u));
    dsn_opts.add_option("--dsn.piece-retries", settings.piece_retries,
                        "Number of alternate sources tried for each piece")
        ->capture_default_str()
        ->check(CLI::Range(size_t{0}, size_t{16}));
    dsn_opts.add_flag("--dsn.verify-imported", settings.verify_imported_blocks,
                      "Compare every already imported block with the reconstructed one, not only genesis")
        ->capture_default_str();
}

}  // namespace silkdsn::cmd::common
