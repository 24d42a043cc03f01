// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ethash/keccak.hpp>

#include <silkdsn/core/common/bytes.hpp>

namespace silkdsn {

inline ethash::hash256 keccak256(ByteView data) { return ethash::keccak256(data.data(), data.size()); }

}  // namespace silkdsn
