// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_header_store.hpp"

#include <mutex>
#include <string>

#include <silkdsn/infra/common/ensure.hpp>

namespace silkdsn::dsn {

void InMemorySegmentHeaderStore::add_segment_headers(std::span<const SegmentHeader> headers) {
    std::unique_lock lock{mutex_};

    // Check everything first so that a rejected call leaves the store untouched
    uint64_t expected_new_index{headers_.size()};
    for (const auto& header : headers) {
        const uint64_t index{header.segment_index.value()};
        if (index < headers_.size()) {
            ensure_pre_condition(headers_[index] == header, [&]() {
                return "conflicting segment header for index " + std::to_string(index);
            });
            continue;
        }
        ensure_pre_condition(index == expected_new_index, [&]() {
            return "segment header " + std::to_string(index) + " leaves a gap, expected " + std::to_string(expected_new_index);
        });
        ++expected_new_index;
    }

    for (const auto& header : headers) {
        if (header.segment_index.value() == headers_.size()) {
            headers_.push_back(header);
        }
    }
}

std::optional<SegmentHeader> InMemorySegmentHeaderStore::get(SegmentIndex segment_index) const {
    std::shared_lock lock{mutex_};
    if (segment_index.value() >= headers_.size()) {
        return std::nullopt;
    }
    return headers_[segment_index.value()];
}

std::optional<SegmentIndex> InMemorySegmentHeaderStore::max_segment_index() const {
    std::shared_lock lock{mutex_};
    if (headers_.empty()) {
        return std::nullopt;
    }
    return SegmentIndex{headers_.size() - 1};
}

}  // namespace silkdsn::dsn
