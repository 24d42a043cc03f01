// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>

#include <silkdsn/core/types/hash.hpp>
#include <silkdsn/dsn/primitives.hpp>

namespace silkdsn::dsn {

//! Proves that a piece belongs to the archived segment bound by a commitment
class CommitmentVerifier {
  public:
    virtual ~CommitmentVerifier() = default;

    //! \param position the position of the piece within its archived segment
    virtual bool verify(size_t position, const Piece& piece, const Hash& segment_commitment) const = 0;
};

}  // namespace silkdsn::dsn
