// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "merkle_commitment.hpp"

#include <catch2/catch_test_macros.hpp>

namespace silkdsn::dsn {

static std::vector<Bytes> sample_records() {
    std::vector<Bytes> records;
    for (size_t i{0}; i < kNumPieces; ++i) {
        records.emplace_back(kRecordSize, static_cast<uint8_t>(i));
    }
    return records;
}

TEST_CASE("MerkleCommitmentVerifier", "[silkdsn][dsn][crypto]") {
    const auto records{sample_records()};
    const SegmentCommitment commitment{build_segment_commitment(records)};
    REQUIRE(commitment.witnesses.size() == kNumPieces);

    const MerkleCommitmentVerifier verifier;

    SECTION("every piece verifies at its own position") {
        for (size_t position : {size_t{0}, size_t{1}, size_t{127}, size_t{128}, size_t{255}}) {
            const Piece piece{Piece::assemble(records[position], commitment.witnesses[position])};
            CHECK(verifier.verify(position, piece, commitment.root));
        }
    }

    SECTION("wrong position") {
        const Piece piece{Piece::assemble(records[3], commitment.witnesses[3])};
        CHECK_FALSE(verifier.verify(4, piece, commitment.root));
        CHECK_FALSE(verifier.verify(kNumPieces, piece, commitment.root));
    }

    SECTION("tampered record") {
        Bytes record{records[10]};
        record[0] ^= 0x01;
        CHECK_FALSE(verifier.verify(10, Piece::assemble(record, commitment.witnesses[10]), commitment.root));
    }

    SECTION("tampered witness") {
        Bytes witness{commitment.witnesses[10]};
        witness.back() ^= 0x01;
        CHECK_FALSE(verifier.verify(10, Piece::assemble(records[10], witness), commitment.root));
    }

    SECTION("another commitment") {
        const Piece piece{Piece::assemble(records[10], commitment.witnesses[10])};
        CHECK_FALSE(verifier.verify(10, piece, Hash::keccak(Bytes{0x00})));
    }
}

}  // namespace silkdsn::dsn
