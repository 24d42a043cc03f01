// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

#include <silkdsn/infra/concurrency/task.hpp>

#include "crypto/commitment_verifier.hpp"
#include "primitives.hpp"
#include "segment_header_store.hpp"

namespace silkdsn::dsn {

enum class PieceValidationError {
    kUnknownSegment,
    kInvalidPieceProof,
};

//! Decides whether a piece received from an untrusted peer is authentic
class PieceValidator {
  public:
    virtual ~PieceValidator() = default;

    virtual Task<tl::expected<void, PieceValidationError>> validate(PieceIndex piece_index, const Piece& piece) = 0;
};

//! Validates pieces against the commitment of their segment found in the header store.
//! Read-only, safe to use from many concurrent fetches.
class SegmentCommitmentPieceValidator : public PieceValidator {
  public:
    SegmentCommitmentPieceValidator(const SegmentHeaderStore& segment_header_store, const CommitmentVerifier& verifier)
        : segment_header_store_{segment_header_store}, verifier_{verifier} {}

    Task<tl::expected<void, PieceValidationError>> validate(PieceIndex piece_index, const Piece& piece) override;

  private:
    const SegmentHeaderStore& segment_header_store_;
    const CommitmentVerifier& verifier_;
};

}  // namespace silkdsn::dsn
