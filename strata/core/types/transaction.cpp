// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <strata/core/rlp/encode.hpp>

namespace strata {

Hash Transaction::hash() const {
    Bytes rlp;
    rlp::encode(rlp, *this);
    return Hash::keccak(rlp);
}

namespace rlp {

    // EIP-155 v value
    static intx::uint256 legacy_v(const Transaction& txn) {
        if (txn.chain_id) {
            return intx::uint256{txn.odd_y_parity} + 35 + 2 * *txn.chain_id;
        }
        return intx::uint256{txn.odd_y_parity} + 27;
    }

    static size_t to_length(const std::optional<evmc::address>& to) {
        return to ? kAddressLength + 1 : 1;
    }

    static void encode_to(Bytes& out, const std::optional<evmc::address>& to) {
        if (to) {
            encode(out, ByteView{to->bytes});
        } else {
            out.push_back(kEmptyStringCode);
        }
    }

    static Header legacy_header(const Transaction& txn) {
        Header h{.list = true};
        h.payload_length += length(txn.nonce);
        h.payload_length += length(txn.max_fee_per_gas);
        h.payload_length += length(txn.gas_limit);
        h.payload_length += to_length(txn.to);
        h.payload_length += length(txn.value);
        h.payload_length += length(ByteView{txn.data});
        h.payload_length += length(legacy_v(txn));
        h.payload_length += length(txn.r);
        h.payload_length += length(txn.s);
        return h;
    }

    static Header dynamic_fee_header(const Transaction& txn) {
        Header h{.list = true};
        h.payload_length += length(txn.chain_id.value_or(0));
        h.payload_length += length(txn.nonce);
        h.payload_length += length(txn.max_priority_fee_per_gas);
        h.payload_length += length(txn.max_fee_per_gas);
        h.payload_length += length(txn.gas_limit);
        h.payload_length += to_length(txn.to);
        h.payload_length += length(txn.value);
        h.payload_length += length(ByteView{txn.data});
        h.payload_length += 1;  // empty access list
        h.payload_length += length(txn.odd_y_parity);
        h.payload_length += length(txn.r);
        h.payload_length += length(txn.s);
        return h;
    }

    size_t length(const Transaction& txn) {
        if (txn.type == TransactionType::kLegacy) {
            return length_with_header(legacy_header(txn).payload_length);
        }
        return 1 + length_with_header(dynamic_fee_header(txn).payload_length);
    }

    void encode(Bytes& to, const Transaction& txn) {
        if (txn.type == TransactionType::kLegacy) {
            encode_header(to, legacy_header(txn));
            encode(to, txn.nonce);
            encode(to, txn.max_fee_per_gas);
            encode(to, txn.gas_limit);
            encode_to(to, txn.to);
            encode(to, txn.value);
            encode(to, ByteView{txn.data});
            encode(to, legacy_v(txn));
            encode(to, txn.r);
            encode(to, txn.s);
            return;
        }

        to.push_back(static_cast<uint8_t>(txn.type));
        encode_header(to, dynamic_fee_header(txn));
        encode(to, txn.chain_id.value_or(0));
        encode(to, txn.nonce);
        encode(to, txn.max_priority_fee_per_gas);
        encode(to, txn.max_fee_per_gas);
        encode(to, txn.gas_limit);
        encode_to(to, txn.to);
        encode(to, txn.value);
        encode(to, ByteView{txn.data});
        to.push_back(kEmptyListCode);
        encode(to, txn.odd_y_parity);
        encode(to, txn.r);
        encode(to, txn.s);
    }

    static DecodingResult decode_to(ByteView& from, std::optional<evmc::address>& to) noexcept {
        if (from.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        if (from[0] == kEmptyStringCode) {
            to = std::nullopt;
            from.remove_prefix(1);
            return {};
        }
        to = evmc::address{};
        return decode(from, to->bytes, Leftover::kAllow);
    }

    static DecodingResult decode_legacy(ByteView& from, Transaction& to) noexcept {
        to.type = TransactionType::kLegacy;

        if (DecodingResult res{decode(from, to.nonce, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.max_fee_per_gas, Leftover::kAllow)}; !res) {
            return res;
        }
        to.max_priority_fee_per_gas = to.max_fee_per_gas;
        if (DecodingResult res{decode(from, to.gas_limit, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_to(from, to.to)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.value, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.data, Leftover::kAllow)}; !res) {
            return res;
        }

        intx::uint256 v;
        if (DecodingResult res{decode(from, v, Leftover::kAllow)}; !res) {
            return res;
        }
        if (v == 27 || v == 28) {
            to.chain_id = std::nullopt;
            to.odd_y_parity = v == 28;
        } else if (v >= 35) {
            to.odd_y_parity = (v - 35) % 2 != 0;
            to.chain_id = (v - 35) / 2;
        } else {
            return tl::unexpected{DecodingError::kInvalidVInSignature};
        }

        if (DecodingResult res{decode(from, to.r, Leftover::kAllow)}; !res) {
            return res;
        }
        return decode(from, to.s, Leftover::kAllow);
    }

    static DecodingResult decode_dynamic_fee(ByteView& from, Transaction& to) noexcept {
        to.type = TransactionType::kDynamicFee;

        intx::uint256 chain_id;
        if (DecodingResult res{decode(from, chain_id, Leftover::kAllow)}; !res) {
            return res;
        }
        to.chain_id = chain_id;
        if (DecodingResult res{decode(from, to.nonce, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.max_priority_fee_per_gas, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.max_fee_per_gas, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.gas_limit, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_to(from, to.to)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.value, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.data, Leftover::kAllow)}; !res) {
            return res;
        }

        const auto access_list{decode_header(from)};
        if (!access_list) {
            return tl::unexpected{access_list.error()};
        }
        if (!access_list->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        if (access_list->payload_length != 0) {
            return tl::unexpected{DecodingError::kInvalidFieldset};
        }

        if (DecodingResult res{decode(from, to.odd_y_parity, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.r, Leftover::kAllow)}; !res) {
            return res;
        }
        return decode(from, to.s, Leftover::kAllow);
    }

    DecodingResult decode(ByteView& from, Transaction& to, Leftover mode) noexcept {
        if (from.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }

        const bool typed{from[0] < kEmptyListCode};
        if (typed) {
            if (from[0] != static_cast<uint8_t>(TransactionType::kDynamicFee)) {
                return tl::unexpected{DecodingError::kUnsupportedTransactionType};
            }
            from.remove_prefix(1);
        }

        const auto h{decode_list_header(from, mode)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        const uint64_t leftover{from.size() - h->payload_length};

        DecodingResult res{typed ? decode_dynamic_fee(from, to) : decode_legacy(from, to)};
        if (!res) {
            return res;
        }
        if (from.size() != leftover) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        return {};
    }

}  // namespace rlp

}  // namespace strata
