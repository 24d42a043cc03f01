// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <span>
#include <vector>

#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/core/types/hash.hpp>

#include "commitment_verifier.hpp"

namespace silkdsn::dsn {

struct SegmentCommitment {
    //! Merkle root over the keccak-256 hashes of all the records
    Hash root;
    //! kWitnessSize bytes per record: sibling hashes from the leaf level up
    std::vector<Bytes> witnesses;
};

//! \brief Build the Merkle tree over the kNumPieces records of an archived segment
//! \pre records.size() == kNumPieces
SegmentCommitment build_segment_commitment(std::span<const Bytes> records);

class MerkleCommitmentVerifier : public CommitmentVerifier {
  public:
    bool verify(size_t position, const Piece& piece, const Hash& segment_commitment) const override;
};

}  // namespace silkdsn::dsn
