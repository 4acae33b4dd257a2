// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <strata/core/rlp/encode.hpp>

namespace strata {

Hash BlockHeader::hash() const {
    Bytes rlp;
    rlp::encode(rlp, *this);
    return Hash::keccak(rlp);
}

namespace rlp {

    static Header rlp_header(const BlockHeader& header) {
        Header rlp_head{.list = true};
        rlp_head.payload_length += kHashLength + 1;     // parent_hash
        rlp_head.payload_length += kAddressLength + 1;  // beneficiary
        rlp_head.payload_length += (kHashLength + 1) * 3;  // state_root, transactions_root, receipts_root
        rlp_head.payload_length += length(header.difficulty);
        rlp_head.payload_length += length(header.number);
        rlp_head.payload_length += length(header.gas_limit);
        rlp_head.payload_length += length(header.gas_used);
        rlp_head.payload_length += length(header.timestamp);
        rlp_head.payload_length += length(ByteView{header.extra_data});
        if (header.base_fee_per_gas) {
            rlp_head.payload_length += length(*header.base_fee_per_gas);
        }
        return rlp_head;
    }

    size_t length(const BlockHeader& header) {
        return length_with_header(rlp_header(header).payload_length);
    }

    void encode(Bytes& to, const BlockHeader& header) {
        encode_header(to, rlp_header(header));
        encode(to, ByteView{header.parent_hash.bytes});
        encode(to, ByteView{header.beneficiary.bytes});
        encode(to, ByteView{header.state_root.bytes});
        encode(to, ByteView{header.transactions_root.bytes});
        encode(to, ByteView{header.receipts_root.bytes});
        encode(to, header.difficulty);
        encode(to, header.number);
        encode(to, header.gas_limit);
        encode(to, header.gas_used);
        encode(to, header.timestamp);
        encode(to, ByteView{header.extra_data});
        if (header.base_fee_per_gas) {
            encode(to, *header.base_fee_per_gas);
        }
    }

    DecodingResult decode(ByteView& from, BlockHeader& to, Leftover mode) noexcept {
        const auto rlp_head{decode_list_header(from, mode)};
        if (!rlp_head) {
            return tl::unexpected{rlp_head.error()};
        }
        const uint64_t leftover{from.size() - rlp_head->payload_length};

        if (DecodingResult res{decode(from, to.parent_hash.bytes, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.beneficiary.bytes, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.state_root.bytes, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.transactions_root.bytes, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.receipts_root.bytes, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.difficulty, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.number, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.gas_limit, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.gas_used, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.timestamp, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.extra_data, Leftover::kAllow)}; !res) {
            return res;
        }

        to.base_fee_per_gas = std::nullopt;
        if (from.size() > leftover) {
            intx::uint256 base_fee;
            if (DecodingResult res{decode(from, base_fee, Leftover::kAllow)}; !res) {
                return res;
            }
            to.base_fee_per_gas = base_fee;
        }

        if (from.size() != leftover) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        return {};
    }

}  // namespace rlp

}  // namespace strata
