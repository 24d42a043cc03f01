// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

namespace silkdsn {

using BlockNum = uint64_t;

inline constexpr BlockNum kEarliestBlockNum{0};

inline constexpr size_t kHashLength{32};

}  // namespace silkdsn
