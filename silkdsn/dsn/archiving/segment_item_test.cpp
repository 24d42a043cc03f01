// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_item.hpp"

#include <catch2/catch_test_macros.hpp>

namespace silkdsn::dsn {

TEST_CASE("SegmentItem decoding", "[silkdsn][dsn][segment_item]") {
    const std::vector<SegmentItem> items{
        {SegmentItemType::kBlockEnd, Bytes{0x01, 0x02}},
        {SegmentItemType::kBlock, Bytes{}},
        {SegmentItemType::kBlockStart, Bytes(300, 0x07)},
    };
    Bytes data;
    for (const auto& item : items) {
        encode(data, item);
    }
    CHECK(data.size() == 3 * SegmentItem::kHeaderSize + 302);

    std::vector<SegmentItem> decoded;

    SECTION("followed by zero padding") {
        data.resize(1024, 0);
        REQUIRE(decode(data, decoded));
        CHECK(decoded == items);
    }

    SECTION("padding shorter than an item header") {
        data.resize(data.size() + SegmentItem::kHeaderSize - 1, 0);
        REQUIRE(decode(data, decoded));
        CHECK(decoded == items);
    }

    SECTION("garbage shorter than an item header") {
        data.resize(data.size() + SegmentItem::kHeaderSize - 1, 0);
        data[data.size() - 2] = 0x01;
        const auto res{decode(data, decoded)};
        REQUIRE_FALSE(res);
        CHECK(res.error() == DecodingError::kInvalidFieldset);
    }

    SECTION("garbage after the padding tag") {
        data.resize(1024, 0);
        data[1000] = 0xff;
        const auto res{decode(data, decoded)};
        REQUIRE_FALSE(res);
        CHECK(res.error() == DecodingError::kInvalidFieldset);
    }

    SECTION("unknown tag") {
        data.push_back(0x06);
        data.resize(data.size() + 8, 0);
        const auto res{decode(data, decoded)};
        REQUIRE_FALSE(res);
        CHECK(res.error() == DecodingError::kInvalidTag);
    }

    SECTION("truncated payload") {
        data.resize(data.size() - 1);
        const auto res{decode(data, decoded)};
        REQUIRE_FALSE(res);
        CHECK(res.error() == DecodingError::kInputTooShort);
    }
}

}  // namespace silkdsn::dsn
