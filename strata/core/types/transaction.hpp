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

// EIP-2718 transaction type
// https://github.com/ethereum/eth1.0-specs/tree/master/lists/signature-types
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kDynamicFee = 2,
};

//! \brief A signed transaction as stored in the transactions segment
//! \remarks Only the legacy and the EIP-1559 envelopes are supported; access lists are always empty
struct Transaction {
    TransactionType type{TransactionType::kLegacy};

    std::optional<intx::uint256> chain_id{std::nullopt};  // nullopt for legacy pre-EIP-155 transactions
    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};  // equals max_fee_per_gas (gas price) for legacy transactions
    intx::uint256 max_fee_per_gas{0};
    uint64_t gas_limit{0};
    std::optional<evmc::address> to{std::nullopt};
    intx::uint256 value{0};
    Bytes data;

    bool odd_y_parity{false};
    intx::uint256 r{0};
    intx::uint256 s{0};

    //! \brief Keccak-256 of the canonical (network) encoding
    Hash hash() const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

namespace rlp {
    size_t length(const Transaction&);

    //! \brief Canonical encoding: legacy as an RLP list, typed as type byte || RLP list
    void encode(Bytes& to, const Transaction&);

    DecodingResult decode(ByteView& from, Transaction& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace strata
