// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace silkdsn {

//! \brief Prints the failed expression with its location to std::cerr and aborts
[[noreturn]] void assertion_failed(const char* expr, const char* file, int line);

}  // namespace silkdsn

//! Checks a condition that only a programming error can break, also when NDEBUG is defined
#define SILKDSN_ASSERT(expr)                                          \
    do {                                                              \
        if (!(expr)) [[unlikely]] {                                   \
            ::silkdsn::assertion_failed(#expr, __FILE__, __LINE__);  \
        }                                                             \
    } while (false)
