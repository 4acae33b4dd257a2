// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Database Access Layer
// See Erigon core/rawdb/accessors_chain.go

#include <optional>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/types/block.hpp>
#include <strata/core/types/block_body_indices.hpp>
#include <strata/core/types/receipt.hpp>
#include <strata/core/types/transaction.hpp>
#include <strata/db/kv/mdbx.hpp>

namespace strata::db {

//! \brief Big-endian 8-byte key used by all the number-keyed tables
Bytes number_key(uint64_t number);

//! \brief Returns the number stored in the first key of the given table, nullopt if the table is missing or empty
std::optional<uint64_t> read_first_key(ROTxn& txn, const MapConfig& table);

//! \brief Returns the number stored in the last key of the given table, nullopt if the table is missing or empty
std::optional<uint64_t> read_last_key(ROTxn& txn, const MapConfig& table);

std::optional<StoredBlockBodyIndices> read_block_body_indices(ROTxn& txn, BlockNum block_num);
void write_block_body_indices(RWTxn& txn, BlockNum block_num, const StoredBlockBodyIndices& indices);

std::optional<BlockHeader> read_header(ROTxn& txn, BlockNum block_num);
void write_header(RWTxn& txn, const BlockHeader& header);

void write_transaction(RWTxn& txn, TxNum tx_num, const Transaction& transaction);
void write_receipt(RWTxn& txn, TxNum tx_num, const Receipt& receipt);

}  // namespace strata::db
