// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_item.hpp"

#include <algorithm>

#include <silkdsn/core/common/endian.hpp>

namespace silkdsn::dsn {

void encode(Bytes& to, const SegmentItem& item) {
    to.push_back(static_cast<uint8_t>(item.type));
    endian::append_little_u32(to, static_cast<uint32_t>(item.payload.size()));
    to.append(item.payload);
}

DecodingResult decode(ByteView from, std::vector<SegmentItem>& to) {
    to.clear();
    while (from.size() >= SegmentItem::kHeaderSize) {
        const uint8_t tag{from[0]};
        if (tag == static_cast<uint8_t>(SegmentItemType::kPadding)) {
            break;
        }
        if (tag > static_cast<uint8_t>(SegmentItemType::kParentSegmentHeader)) {
            return tl::unexpected{DecodingError::kInvalidTag};
        }
        const uint32_t length{endian::load_little_u32(&from[1])};
        from.remove_prefix(SegmentItem::kHeaderSize);
        if (length > from.size()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        to.push_back({static_cast<SegmentItemType>(tag), Bytes{from.substr(0, length)}});
        from.remove_prefix(length);
    }
    // Past the last item the segment is zero filled
    if (std::any_of(from.begin(), from.end(), [](uint8_t b) { return b != 0; })) {
        return tl::unexpected{DecodingError::kInvalidFieldset};
    }
    return {};
}

}  // namespace silkdsn::dsn
