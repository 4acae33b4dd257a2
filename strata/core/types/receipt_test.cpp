// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <catch2/catch_test_macros.hpp>

#include <strata/core/common/util.hpp>

namespace strata {

using namespace evmc::literals;

TEST_CASE("Log RLP", "[strata][core][types]") {
    Log log{
        .address = 0xea674fdde714fd979de3edf0f56aa9716b898ec8_address,
        .topics = {
            Hash{0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32},
            Hash{0x0000000000000000000000000000000000000000000000000000000000000001_bytes32},
        },
        .data = *from_hex("0x0000000000000000000000000000000000000000000000000de0b6b3a7640000"),
    };

    Bytes encoded;
    rlp::encode(encoded, log);
    CHECK(rlp::length(log) == encoded.size());

    ByteView view{encoded};
    Log decoded;
    REQUIRE(rlp::decode(view, decoded));
    CHECK(view.empty());
    CHECK(decoded == log);
}

TEST_CASE("Receipt RLP", "[strata][core][types]") {
    Receipt receipt{
        .type = TransactionType::kDynamicFee,
        .success = true,
        .cumulative_gas_used = 21'000,
    };

    SECTION("without logs") {
        Bytes encoded;
        rlp::encode(encoded, receipt);
        ByteView view{encoded};
        Receipt decoded;
        REQUIRE(rlp::decode(view, decoded));
        CHECK(decoded == receipt);
    }

    SECTION("with logs") {
        receipt.logs.push_back(Log{.address = 0x8d12a197cb00d4747a1fe03395095ce2a5cc6819_address, .data = Bytes{0x01}});
        receipt.logs.push_back(Log{
            .address = 0x8d12a197cb00d4747a1fe03395095ce2a5cc6819_address,
            .topics = {Hash{0xf341246adaac6f497bc2a656f546ab9e182111d630394f0c57c710a59a2cb567_bytes32}},
        });
        Bytes encoded;
        rlp::encode(encoded, receipt);
        CHECK(rlp::length(receipt) == encoded.size());
        ByteView view{encoded};
        Receipt decoded;
        REQUIRE(rlp::decode(view, decoded));
        CHECK(view.empty());
        CHECK(decoded == receipt);
    }

    SECTION("truncated") {
        Bytes encoded;
        rlp::encode(encoded, receipt);
        encoded.pop_back();
        ByteView view{encoded};
        Receipt decoded;
        CHECK_FALSE(rlp::decode(view, decoded));
    }
}

}  // namespace strata
