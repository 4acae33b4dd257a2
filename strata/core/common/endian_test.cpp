// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

#include <catch2/catch_test_macros.hpp>

namespace strata::endian {

TEST_CASE("32-bit Endian", "[strata][core][common][endian]") {
    uint8_t bytes[4];
    uint32_t value{0x12345678};

    store_big_u32(bytes, value);
    CHECK(bytes[0] == 0x12);
    CHECK(bytes[1] == 0x34);
    CHECK(bytes[2] == 0x56);
    CHECK(bytes[3] == 0x78);

    CHECK(load_big_u32(bytes) == value);
}

TEST_CASE("64-bit Endian", "[strata][core][common][endian]") {
    uint8_t bytes[8];
    uint64_t value{0x123456789abcdef0};

    store_big_u64(bytes, value);
    CHECK(bytes[0] == 0x12);
    CHECK(bytes[7] == 0xf0);
    CHECK(load_big_u64(bytes) == value);
    CHECK(load_little_u64(bytes) == 0xf0debc9a78563412);

    store_little_u64(bytes, value);
    CHECK(bytes[0] == 0xf0);
    CHECK(bytes[7] == 0x12);
}

TEST_CASE("Compact big endian form", "[strata][core][common][endian]") {
    CHECK(to_big_compact(uint64_t{0}).empty());
    CHECK(Bytes{to_big_compact(uint64_t{0x5485ffde})} == Bytes{0x54, 0x85, 0xff, 0xde});

    uint64_t block_num{0};
    const Bytes compact{0x54, 0x85, 0xff, 0xde};
    REQUIRE(from_big_compact(compact, block_num));
    CHECK(block_num == 1418067934u);

    SECTION("empty input is zero") {
        uint64_t out{42};
        REQUIRE(from_big_compact(ByteView{}, out));
        CHECK(out == 0);
    }

    SECTION("leading zero is rejected") {
        const Bytes leading_zero{0x00, 0x01};
        CHECK(from_big_compact(leading_zero, block_num) == tl::unexpected{DecodingError::kLeadingZero});
    }

    SECTION("too long input overflows") {
        const Bytes nine_bytes(9, 0x01);
        CHECK(from_big_compact(nine_bytes, block_num) == tl::unexpected{DecodingError::kOverflow});
    }
}

}  // namespace strata::endian
