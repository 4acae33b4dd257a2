// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <strata/core/common/base.hpp>
#include <strata/core/types/block.hpp>
#include <strata/core/types/block_body_indices.hpp>
#include <strata/core/types/receipt.hpp>
#include <strata/core/types/transaction.hpp>
#include <strata/db/static_files/provider.hpp>

namespace strata::db::static_files::test_util {

//! Deterministic header for the given block number
BlockHeader sample_header(BlockNum block_num);

//! Deterministic signed transaction for the given transaction number
Transaction sample_transaction(TxNum tx_num);

//! Deterministic receipt for the given transaction number
Receipt sample_receipt(TxNum tx_num);

//! Appends the headers of blocks [from, to] through the provider writer and commits
void write_headers(StaticFileProvider& provider, BlockNum from, BlockNum to);

//! Layout of a sample chain where each block holds the same number of transactions
struct SampleChain {
    uint64_t txs_per_block{2};

    [[nodiscard]] StoredBlockBodyIndices body_indices(BlockNum block_num) const {
        return {.first_tx_num = block_num * txs_per_block, .tx_count = txs_per_block};
    }
};

//! Appends blocks [from, to] of the sample chain to the transactions, receipts and block meta segments and commits
void write_blocks(StaticFileProvider& provider, BlockNum from, BlockNum to, const SampleChain& chain = {});

}  // namespace strata::db::static_files::test_util
