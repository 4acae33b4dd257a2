// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/decoding_result.hpp>
#include <strata/core/rlp/decode.hpp>
#include <strata/core/types/hash.hpp>

namespace strata {

struct BlockHeader {
    Hash parent_hash;
    evmc::address beneficiary;
    Hash state_root;
    Hash transactions_root;
    Hash receipts_root;
    intx::uint256 difficulty{0};
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};
    Bytes extra_data;

    std::optional<intx::uint256> base_fee_per_gas{std::nullopt};  // EIP-1559

    //! \brief Keccak-256 of the RLP encoding
    Hash hash() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

//! \brief A header paired with its hash as stored side by side in the headers segment
struct SealedHeader {
    BlockHeader header;
    Hash hash;

    friend bool operator==(const SealedHeader&, const SealedHeader&) = default;
};

namespace rlp {
    size_t length(const BlockHeader&);
    void encode(Bytes& to, const BlockHeader&);
    DecodingResult decode(ByteView& from, BlockHeader& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace strata
