// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <silkdsn/core/common/bytes.hpp>

#include "primitives.hpp"

namespace silkdsn::dsn {

//! Filter as exchanged with peers: raw bucket slots and number of stored items
struct FilterSnapshot {
    Bytes values;
    uint64_t length{0};
};

/**
 * Cuckoo filter over piece indexes: 4 slots per bucket, 8-bit fingerprints.
 * Membership answers have false positives but no false negatives.
 */
class PieceAvailabilityFilter {
  public:
    static constexpr size_t kBucketSize{4};
    static constexpr size_t kMaxKicks{500};

    //! \param capacity expected number of items, rounded up to a power of two number of buckets
    explicit PieceAvailabilityFilter(size_t capacity);

    //! \return false if the filter is too full, in which case it is left unchanged
    bool insert(PieceIndex piece_index);
    bool contains(PieceIndex piece_index) const;
    bool remove(PieceIndex piece_index);

    size_t size() const { return length_; }
    bool empty() const { return length_ == 0; }

    FilterSnapshot export_snapshot() const;

    //! \return nothing if the snapshot is not a valid filter encoding
    static std::optional<PieceAvailabilityFilter> from_snapshot(const FilterSnapshot& snapshot);

  private:
    struct Location {
        size_t bucket{0};
        uint8_t fingerprint{0};
    };

    PieceAvailabilityFilter() = default;

    size_t num_buckets() const { return slots_.size() / kBucketSize; }
    Location locate(PieceIndex piece_index) const;
    size_t alternate_bucket(size_t bucket, uint8_t fingerprint) const;
    bool bucket_contains(size_t bucket, uint8_t fingerprint) const;
    bool bucket_insert(size_t bucket, uint8_t fingerprint);

    std::vector<uint8_t> slots_;  // 0 marks an empty slot
    size_t length_{0};
};

}  // namespace silkdsn::dsn
