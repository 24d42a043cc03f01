// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

namespace silkdsn::endian {

void append_little_u32(Bytes& out, uint32_t value) {
    uint8_t buffer[sizeof(uint32_t)];
    store_little_u32(buffer, value);
    out.append(buffer, sizeof(buffer));
}

void append_little_u64(Bytes& out, uint64_t value) {
    uint8_t buffer[sizeof(uint64_t)];
    store_little_u64(buffer, value);
    out.append(buffer, sizeof(buffer));
}

}  // namespace silkdsn::endian
