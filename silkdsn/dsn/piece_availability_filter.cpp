// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "piece_availability_filter.hpp"

#include <algorithm>
#include <bit>
#include <tuple>
#include <utility>

#include <silkdsn/core/common/endian.hpp>
#include <silkdsn/core/common/util.hpp>

namespace silkdsn::dsn {

PieceAvailabilityFilter::PieceAvailabilityFilter(size_t capacity) {
    // Keep the load factor below 95%
    const size_t min_buckets{std::max<size_t>(1, (capacity * 100 / 95 + kBucketSize - 1) / kBucketSize)};
    slots_.assign(std::bit_ceil(min_buckets) * kBucketSize, 0);
}

PieceAvailabilityFilter::Location PieceAvailabilityFilter::locate(PieceIndex piece_index) const {
    Bytes key;
    endian::append_little_u64(key, piece_index.value());
    const ethash::hash256 h{keccak256(key)};
    const uint8_t fingerprint{h.bytes[8] == 0 ? uint8_t{1} : h.bytes[8]};
    const size_t bucket{static_cast<size_t>(endian::load_little_u64(h.bytes)) & (num_buckets() - 1)};
    return {bucket, fingerprint};
}

size_t PieceAvailabilityFilter::alternate_bucket(size_t bucket, uint8_t fingerprint) const {
    const uint32_t fingerprint_hash{static_cast<uint32_t>(fingerprint) * 0x5bd1e995u};
    return (bucket ^ fingerprint_hash) & (num_buckets() - 1);
}

bool PieceAvailabilityFilter::bucket_contains(size_t bucket, uint8_t fingerprint) const {
    const auto begin{slots_.begin() + static_cast<std::ptrdiff_t>(bucket * kBucketSize)};
    return std::find(begin, begin + kBucketSize, fingerprint) != begin + kBucketSize;
}

bool PieceAvailabilityFilter::bucket_insert(size_t bucket, uint8_t fingerprint) {
    for (size_t i{0}; i < kBucketSize; ++i) {
        uint8_t& slot{slots_[bucket * kBucketSize + i]};
        if (slot == 0) {
            slot = fingerprint;
            return true;
        }
    }
    return false;
}

bool PieceAvailabilityFilter::insert(PieceIndex piece_index) {
    auto [bucket, fingerprint] = locate(piece_index);
    if (bucket_insert(bucket, fingerprint) || bucket_insert(alternate_bucket(bucket, fingerprint), fingerprint)) {
        ++length_;
        return true;
    }

    // Relocate fingerprints, remembering the swaps to undo them on failure
    std::vector<std::pair<size_t, uint8_t>> swaps;
    bucket = alternate_bucket(bucket, fingerprint);
    for (size_t kick{0}; kick < kMaxKicks; ++kick) {
        const size_t slot_index{bucket * kBucketSize + (piece_index.value() + kick) % kBucketSize};
        swaps.emplace_back(slot_index, slots_[slot_index]);
        std::swap(fingerprint, slots_[slot_index]);
        bucket = alternate_bucket(bucket, fingerprint);
        if (bucket_insert(bucket, fingerprint)) {
            ++length_;
            return true;
        }
    }
    for (auto it{swaps.rbegin()}; it != swaps.rend(); ++it) {
        slots_[it->first] = it->second;
    }
    return false;
}

bool PieceAvailabilityFilter::contains(PieceIndex piece_index) const {
    const auto [bucket, fingerprint] = locate(piece_index);
    return bucket_contains(bucket, fingerprint) || bucket_contains(alternate_bucket(bucket, fingerprint), fingerprint);
}

bool PieceAvailabilityFilter::remove(PieceIndex piece_index) {
    const auto [bucket, fingerprint] = locate(piece_index);
    for (const size_t b : {bucket, alternate_bucket(bucket, fingerprint)}) {
        const auto begin{slots_.begin() + static_cast<std::ptrdiff_t>(b * kBucketSize)};
        const auto it{std::find(begin, begin + kBucketSize, fingerprint)};
        if (it != begin + kBucketSize) {
            *it = 0;
            --length_;
            return true;
        }
    }
    return false;
}

FilterSnapshot PieceAvailabilityFilter::export_snapshot() const {
    return FilterSnapshot{Bytes{slots_.data(), slots_.size()}, length_};
}

std::optional<PieceAvailabilityFilter> PieceAvailabilityFilter::from_snapshot(const FilterSnapshot& snapshot) {
    const size_t size{snapshot.values.size()};
    if (size == 0 || size % kBucketSize != 0 || !std::has_single_bit(size / kBucketSize)) {
        return std::nullopt;
    }
    const auto occupied = static_cast<uint64_t>(std::count_if(snapshot.values.begin(), snapshot.values.end(), [](uint8_t v) { return v != 0; }));
    if (occupied != snapshot.length) {
        return std::nullopt;
    }
    PieceAvailabilityFilter filter;
    filter.slots_.assign(snapshot.values.begin(), snapshot.values.end());
    filter.length_ = static_cast<size_t>(snapshot.length);
    return filter;
}

}  // namespace silkdsn::dsn
