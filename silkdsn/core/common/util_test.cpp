// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <catch2/catch_test_macros.hpp>
#include <evmc/hex.hpp>

#include <silkdsn/core/types/hash.hpp>

#include "bytes_to_string.hpp"
#include "endian.hpp"

namespace silkdsn {

TEST_CASE("keccak256", "[silkdsn][core][util]") {
    // Well-known digest of the empty input
    const Hash empty{keccak256(ByteView{})};
    CHECK(evmc::hex(ByteView{empty}) == "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");

    CHECK(Hash::keccak(Bytes{0x01}) != Hash::keccak(Bytes{0x02}));
    CHECK(Hash::keccak(Bytes{0x01}) == Hash{ByteView{Hash::keccak(Bytes{0x01})}});
}

TEST_CASE("string_view_to_byte_view", "[silkdsn][core][util]") {
    CHECK(string_view_to_byte_view("").empty());
    CHECK(string_view_to_byte_view("peer-a") == ByteView{Bytes{'p', 'e', 'e', 'r', '-', 'a'}});
    CHECK(keccak256(string_view_to_byte_view("abc")).bytes[0] == 0x4e);
}

TEST_CASE("Little endian append", "[silkdsn][core][endian]") {
    Bytes out;
    endian::append_little_u32(out, 0x01020304);
    endian::append_little_u64(out, 0x0a0b0c0d0e0f1011);
    CHECK(evmc::hex(out) == "04030201" "11100f0e0d0c0b0a");
    CHECK(endian::load_little_u32(out.data()) == 0x01020304);
    CHECK(endian::load_little_u64(out.data() + 4) == 0x0a0b0c0d0e0f1011);
}

}  // namespace silkdsn
