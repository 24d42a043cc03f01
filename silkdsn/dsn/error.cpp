// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <magic_enum.hpp>

namespace silkdsn::dsn {

std::string_view to_string(SyncErrorCode code) {
    return magic_enum::enum_name(code);
}

SyncError::SyncError(SyncErrorCode code, const std::string& message)
    : Error<SyncErrorCode>(code, std::string{to_string(code)} + ": " + message) {}

}  // namespace silkdsn::dsn
