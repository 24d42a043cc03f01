// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <silkdsn/core/common/bytes.hpp>
#include <silkdsn/core/common/decoding_result.hpp>

namespace silkdsn::dsn {

//! Kind of a chunk of segment source data
enum class SegmentItemType : uint8_t {
    kPadding = 0,                // end of the item list, the rest of the segment is zero filled
    kBlock = 1,                  // complete block
    kBlockStart = 2,             // first bytes of a block continuing into the next segment
    kBlockContinuation = 3,      // middle bytes of a carried block continuing further
    kBlockEnd = 4,               // last bytes of a carried block
    kParentSegmentHeader = 5,    // encoded header of the previous segment
};

struct SegmentItem {
    //! tag:u8 | length:u32le
    static constexpr size_t kHeaderSize{1 + sizeof(uint32_t)};

    SegmentItemType type{SegmentItemType::kPadding};
    Bytes payload;

    friend bool operator==(const SegmentItem&, const SegmentItem&) = default;
};

void encode(Bytes& to, const SegmentItem& item);

//! \brief Decodes the items found in segment source data up to the first padding
DecodingResult decode(ByteView from, std::vector<SegmentItem>& to);

}  // namespace silkdsn::dsn
