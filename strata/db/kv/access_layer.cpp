// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "access_layer.hpp"

#include <stdexcept>
#include <string>

#include <strata/core/common/endian.hpp>
#include <strata/core/rlp/encode.hpp>
#include <strata/db/kv/tables.hpp>
#include <strata/infra/common/decoding_exception.hpp>

namespace strata::db {

Bytes number_key(uint64_t number) {
    Bytes key(sizeof(uint64_t), '\0');
    endian::store_big_u64(key.data(), number);
    return key;
}

static uint64_t key_to_number(const mdbx::slice& key) {
    if (key.size() != sizeof(uint64_t)) {
        throw std::length_error("Expected 8 bytes key got " + std::to_string(key.size()));
    }
    return endian::load_big_u64(static_cast<const uint8_t*>(key.data()));
}

std::optional<uint64_t> read_first_key(ROTxn& txn, const MapConfig& table) {
    if (!has_map(*txn, table.name)) {
        return std::nullopt;
    }
    auto cursor{open_cursor(*txn, table)};
    const auto data{cursor.to_first(/*throw_notfound=*/false)};
    if (!data) {
        return std::nullopt;
    }
    return key_to_number(data.key);
}

std::optional<uint64_t> read_last_key(ROTxn& txn, const MapConfig& table) {
    if (!has_map(*txn, table.name)) {
        return std::nullopt;
    }
    auto cursor{open_cursor(*txn, table)};
    const auto data{cursor.to_last(/*throw_notfound=*/false)};
    if (!data) {
        return std::nullopt;
    }
    return key_to_number(data.key);
}

std::optional<StoredBlockBodyIndices> read_block_body_indices(ROTxn& txn, BlockNum block_num) {
    if (!has_map(*txn, table::kBlockBodyIndices.name)) {
        return std::nullopt;
    }
    auto cursor{open_cursor(*txn, table::kBlockBodyIndices)};
    const Bytes key{number_key(block_num)};
    const auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
    if (!data) {
        return std::nullopt;
    }
    ByteView value{from_slice(data.value)};
    StoredBlockBodyIndices indices;
    success_or_throw(StoredBlockBodyIndices::decode(value, indices));
    return indices;
}

void write_block_body_indices(RWTxn& txn, BlockNum block_num, const StoredBlockBodyIndices& indices) {
    auto cursor{open_cursor(*txn, table::kBlockBodyIndices)};
    const Bytes key{number_key(block_num)};
    const Bytes value{indices.encode()};
    cursor.upsert(to_slice(key), to_slice(value));
}

std::optional<BlockHeader> read_header(ROTxn& txn, BlockNum block_num) {
    if (!has_map(*txn, table::kHeaders.name)) {
        return std::nullopt;
    }
    auto cursor{open_cursor(*txn, table::kHeaders)};
    const Bytes key{number_key(block_num)};
    const auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
    if (!data) {
        return std::nullopt;
    }
    ByteView value{from_slice(data.value)};
    BlockHeader header;
    success_or_throw(rlp::decode(value, header));
    return header;
}

void write_header(RWTxn& txn, const BlockHeader& header) {
    Bytes value;
    rlp::encode(value, header);
    auto cursor{open_cursor(*txn, table::kHeaders)};
    const Bytes key{number_key(header.number)};
    cursor.upsert(to_slice(key), to_slice(value));
}

void write_transaction(RWTxn& txn, TxNum tx_num, const Transaction& transaction) {
    Bytes value;
    rlp::encode(value, transaction);
    auto cursor{open_cursor(*txn, table::kTransactions)};
    const Bytes key{number_key(tx_num)};
    cursor.upsert(to_slice(key), to_slice(value));
}

void write_receipt(RWTxn& txn, TxNum tx_num, const Receipt& receipt) {
    Bytes value;
    rlp::encode(value, receipt);
    auto cursor{open_cursor(*txn, table::kReceipts)};
    const Bytes key{number_key(tx_num)};
    cursor.upsert(to_slice(key), to_slice(value));
}

}  // namespace strata::db
