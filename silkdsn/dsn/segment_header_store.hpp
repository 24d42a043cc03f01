// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <shared_mutex>
#include <span>
#include <vector>

#include "primitives.hpp"

namespace silkdsn::dsn {

//! Narrow access to the persisted segment headers
class SegmentHeaderStore {
  public:
    virtual ~SegmentHeaderStore() = default;

    //! \brief Append headers, writing again an already stored header is a no-op
    //! \throws std::invalid_argument if headers leave a gap or conflict with stored ones
    virtual void add_segment_headers(std::span<const SegmentHeader> headers) = 0;

    virtual std::optional<SegmentHeader> get(SegmentIndex segment_index) const = 0;

    virtual std::optional<SegmentIndex> max_segment_index() const = 0;
};

class InMemorySegmentHeaderStore : public SegmentHeaderStore {
  public:
    void add_segment_headers(std::span<const SegmentHeader> headers) override;
    std::optional<SegmentHeader> get(SegmentIndex segment_index) const override;
    std::optional<SegmentIndex> max_segment_index() const override;

  private:
    mutable std::shared_mutex mutex_;
    std::vector<SegmentHeader> headers_;
};

}  // namespace silkdsn::dsn
