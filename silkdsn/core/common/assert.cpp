// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <iostream>

namespace silkdsn {

void assertion_failed(const char* expr, const char* file, int line) {
    std::cerr << file << ":" << line << ": assertion '" << expr << "' failed" << std::endl;
    std::abort();
}

}  // namespace silkdsn
