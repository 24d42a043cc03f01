// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "merkle_commitment.hpp"

#include <silkdsn/core/common/assert.hpp>

namespace silkdsn::dsn {

static Hash hash_pair(const Hash& left, const Hash& right) {
    Bytes data;
    data.reserve(2 * kHashLength);
    data.append(left.bytes, kHashLength);
    data.append(right.bytes, kHashLength);
    return Hash::keccak(data);
}

SegmentCommitment build_segment_commitment(std::span<const Bytes> records) {
    SILKDSN_ASSERT(records.size() == kNumPieces);

    std::vector<std::vector<Hash>> levels;
    levels.reserve(kWitnessDepth + 1);
    std::vector<Hash> leaves;
    leaves.reserve(records.size());
    for (const auto& record : records) {
        leaves.push_back(Hash::keccak(record));
    }
    levels.push_back(std::move(leaves));
    while (levels.back().size() > 1) {
        const auto& lower{levels.back()};
        std::vector<Hash> upper;
        upper.reserve(lower.size() / 2);
        for (size_t i{0}; i < lower.size(); i += 2) {
            upper.push_back(hash_pair(lower[i], lower[i + 1]));
        }
        levels.push_back(std::move(upper));
    }

    SegmentCommitment commitment{.root = levels.back().front(), .witnesses = {}};
    commitment.witnesses.reserve(records.size());
    for (size_t position{0}; position < records.size(); ++position) {
        Bytes witness;
        witness.reserve(kWitnessSize);
        size_t index{position};
        for (size_t depth{0}; depth < kWitnessDepth; ++depth) {
            const Hash& sibling{levels[depth][index ^ 1]};
            witness.append(sibling.bytes, kHashLength);
            index >>= 1;
        }
        commitment.witnesses.push_back(std::move(witness));
    }
    return commitment;
}

bool MerkleCommitmentVerifier::verify(size_t position, const Piece& piece, const Hash& segment_commitment) const {
    if (position >= kNumPieces) {
        return false;
    }
    Hash node{Hash::keccak(piece.record())};
    const ByteView witness{piece.witness()};
    size_t index{position};
    for (size_t depth{0}; depth < kWitnessDepth; ++depth) {
        const Hash sibling{ByteView{witness.substr(depth * kHashLength, kHashLength)}};
        node = (index & 1) ? hash_pair(sibling, node) : hash_pair(node, sibling);
        index >>= 1;
    }
    return node == segment_commitment;
}

}  // namespace silkdsn::dsn
