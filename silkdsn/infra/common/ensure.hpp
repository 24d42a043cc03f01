// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace silkdsn {

//! \brief Throws std::logic_error with the given message when condition does not hold
template <unsigned int N>
inline void ensure(bool condition, const char (&message)[N]) {
    if (!condition) [[unlikely]] {
        throw std::logic_error(message);
    }
}

//! \brief Throws std::logic_error when an internal consistency check fails
//! \param describe builds the message, it is only called on failure
inline void ensure_invariant(bool condition, const std::function<std::string()>& describe) {
    if (!condition) [[unlikely]] {
        throw std::logic_error("Invariant violation: " + describe());
    }
}

//! \brief Throws std::invalid_argument when the input provided by the caller is unacceptable
//! \param describe builds the message, it is only called on failure
inline void ensure_pre_condition(bool condition, const std::function<std::string()>& describe) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument("Pre-condition violation: " + describe());
    }
}

}  // namespace silkdsn
