// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace silkdsn {

//! Reasons for rejecting an encoded block, piece, segment item or segment header
enum class [[nodiscard]] DecodingError {
    kInputTooShort,
    kInputTooLong,
    kInvalidTag,
    kInvalidFieldset,
    kInvalidBodyRoot,
};

using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace silkdsn
