// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/decoding_result.hpp>
#include <strata/core/rlp/decode.hpp>
#include <strata/core/types/hash.hpp>
#include <strata/core/types/transaction.hpp>

namespace strata {

struct Log {
    evmc::address address;
    std::vector<Hash> topics;
    Bytes data;

    friend bool operator==(const Log&, const Log&) = default;
};

struct Receipt {
    TransactionType type{TransactionType::kLegacy};
    bool success{false};
    uint64_t cumulative_gas_used{0};
    std::vector<Log> logs;

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

namespace rlp {
    size_t length(const Log&);
    void encode(Bytes& to, const Log&);
    DecodingResult decode(ByteView& from, Log& to, Leftover mode = Leftover::kProhibit) noexcept;

    //! \brief Storage encoding of a receipt: [type, success, cumulative_gas_used, [logs...]]
    size_t length(const Receipt&);
    void encode(Bytes& to, const Receipt&);
    DecodingResult decode(ByteView& from, Receipt& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace strata
