// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <silkdsn/infra/common/log.hpp>

namespace silkdsn::cmd::common {

//! \brief Adds the "Log" option group, which fills log_settings when cli is parsed
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

}  // namespace silkdsn::cmd::common
