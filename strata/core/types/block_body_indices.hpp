// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/decoding_result.hpp>

namespace strata {

//! \brief Location of the transactions of one block in the global transaction numbering
struct StoredBlockBodyIndices {
    static constexpr size_t kEncodedSize{2 * sizeof(uint64_t)};

    TxNum first_tx_num{0};
    uint64_t tx_count{0};

    //! \brief Number of the last transaction, equal to first_tx_num for blocks with no transactions
    [[nodiscard]] TxNum last_tx_num() const { return tx_count == 0 ? first_tx_num : first_tx_num + tx_count - 1; }

    //! \brief Number of the first transaction of the next block
    [[nodiscard]] TxNum next_tx_num() const { return first_tx_num + tx_count; }

    [[nodiscard]] bool contains_tx(TxNum tx_num) const {
        return tx_num >= first_tx_num && tx_num < next_tx_num();
    }

    [[nodiscard]] bool has_transactions() const { return tx_count > 0; }

    //! \brief Fixed size encoding: first_tx_num (8 bytes BE) || tx_count (8 bytes BE)
    Bytes encode() const;
    static DecodingResult decode(ByteView& from, StoredBlockBodyIndices& to) noexcept;

    friend bool operator==(const StoredBlockBodyIndices&, const StoredBlockBodyIndices&) = default;
};

}  // namespace strata
