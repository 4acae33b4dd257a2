// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <catch2/catch_test_macros.hpp>

#include <strata/core/common/util.hpp>

namespace strata {

using namespace evmc::literals;

// Signed example transaction from EIP-155
static constexpr std::string_view kEip155SignedTxHex{
    "f86c098504a817c800825208943535353535353535353535353535353535353535880de0b6b3a7640000"
    "8025a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276a067cbe9d8997f"
    "761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83"};

TEST_CASE("Legacy Transaction RLP", "[strata][core][types]") {
    const Bytes encoded{*from_hex(kEip155SignedTxHex)};
    ByteView view{encoded};
    Transaction txn;
    REQUIRE(rlp::decode(view, txn));
    CHECK(view.empty());

    CHECK(txn.type == TransactionType::kLegacy);
    CHECK(txn.chain_id == intx::uint256{1});
    CHECK(txn.nonce == 9);
    CHECK(txn.max_fee_per_gas == intx::uint256{20'000'000'000});
    CHECK(txn.max_priority_fee_per_gas == txn.max_fee_per_gas);
    CHECK(txn.gas_limit == 21'000);
    CHECK(txn.to == 0x3535353535353535353535353535353535353535_address);
    CHECK(txn.value == intx::uint256{1'000'000'000'000'000'000});
    CHECK(txn.data.empty());
    CHECK_FALSE(txn.odd_y_parity);

    Bytes re_encoded;
    rlp::encode(re_encoded, txn);
    CHECK(re_encoded == encoded);
    CHECK(rlp::length(txn) == encoded.size());
    CHECK(txn.hash() == Hash::keccak(encoded));
}

TEST_CASE("Legacy Transaction without chain id", "[strata][core][types]") {
    Transaction txn{};
    txn.nonce = 3;
    txn.max_priority_fee_per_gas = 1'000'000'000;
    txn.max_fee_per_gas = 1'000'000'000;
    txn.gas_limit = 90'000;
    txn.odd_y_parity = true;
    txn.r = 1;
    txn.s = 2;

    Bytes encoded;
    rlp::encode(encoded, txn);
    ByteView view{encoded};
    Transaction decoded;
    REQUIRE(rlp::decode(view, decoded));
    CHECK_FALSE(decoded.chain_id);
    CHECK_FALSE(decoded.to);
    CHECK(decoded == txn);
}

TEST_CASE("Dynamic fee Transaction RLP", "[strata][core][types]") {
    Transaction txn{};
    txn.type = TransactionType::kDynamicFee;
    txn.chain_id = 1;
    txn.nonce = 42;
    txn.max_priority_fee_per_gas = 2'000'000'000;
    txn.max_fee_per_gas = 30'000'000'000;
    txn.gas_limit = 100'000;
    txn.to = 0x727fc6a68321b754475c668a6abfb6e9e71c169a_address;
    txn.value = 7;
    txn.data = *from_hex("a9059cbb");
    txn.odd_y_parity = true;
    txn.r = intx::from_string<intx::uint256>("0xbe67e0a07db67da8d446f76add590e54b6e92cb6b8f9835aeb67540579a27717");
    txn.s = intx::from_string<intx::uint256>("0x2d690516512020171c1ec870f6ff45398cc8609250326be89915fb538e7bd718");

    Bytes encoded;
    rlp::encode(encoded, txn);
    REQUIRE(!encoded.empty());
    CHECK(encoded[0] == static_cast<uint8_t>(TransactionType::kDynamicFee));
    CHECK(rlp::length(txn) == encoded.size());

    ByteView view{encoded};
    Transaction decoded;
    REQUIRE(rlp::decode(view, decoded));
    CHECK(view.empty());
    CHECK(decoded == txn);
}

TEST_CASE("Transaction decoding errors", "[strata][core][types]") {
    Transaction txn;

    SECTION("empty input") {
        ByteView view{};
        CHECK(rlp::decode(view, txn) == tl::unexpected{DecodingError::kInputTooShort});
    }

    SECTION("unsupported transaction type") {
        const Bytes encoded{*from_hex("01c0")};
        ByteView view{encoded};
        CHECK(rlp::decode(view, txn) == tl::unexpected{DecodingError::kUnsupportedTransactionType});
    }

    SECTION("invalid v") {
        Bytes encoded{*from_hex(kEip155SignedTxHex)};
        // v is the single byte after the empty data string
        const auto v_pos{encoded.find(Bytes{0x80, 0x25})};
        REQUIRE(v_pos != Bytes::npos);
        encoded[v_pos + 1] = 0x1a;
        ByteView view{encoded};
        CHECK(rlp::decode(view, txn) == tl::unexpected{DecodingError::kInvalidVInSignature});
    }
}

}  // namespace strata
