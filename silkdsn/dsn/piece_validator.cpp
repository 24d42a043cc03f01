// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "piece_validator.hpp"

#include <silkdsn/infra/common/log.hpp>

namespace silkdsn::dsn {

Task<tl::expected<void, PieceValidationError>> SegmentCommitmentPieceValidator::validate(PieceIndex piece_index, const Piece& piece) {
    const SegmentIndex segment_index{piece_index.segment_index()};
    const auto segment_header{segment_header_store_.get(segment_index)};
    if (!segment_header) {
        SILKDSN_ERROR << "PieceValidator: no segment header for piece"
                      << log::Args{"piece", piece_index.to_string(), "segment", segment_index.to_string()};
        co_return tl::unexpected{PieceValidationError::kUnknownSegment};
    }

    if (!verifier_.verify(piece_index.position(), piece, segment_header->segment_commitment)) {
        SILKDSN_WARN << "PieceValidator: piece does not match segment commitment"
                     << log::Args{"piece", piece_index.to_string(), "segment", segment_index.to_string()};
        co_return tl::unexpected{PieceValidationError::kInvalidPieceProof};
    }

    co_return tl::expected<void, PieceValidationError>{};
}

}  // namespace silkdsn::dsn
