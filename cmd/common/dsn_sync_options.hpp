// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <silkdsn/sync/dsn_sync_settings.hpp>

namespace silkdsn::cmd::common {

void add_dsn_sync_options(CLI::App& cli, sync::DsnSyncSettings& settings);

}  // namespace silkdsn::cmd::common
