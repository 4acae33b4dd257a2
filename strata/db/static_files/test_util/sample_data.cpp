// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sample_data.hpp"

#include <strata/core/common/endian.hpp>

namespace strata::db::static_files::test_util {

static Hash hash_of_number(uint8_t tag, uint64_t number) {
    Hash hash;
    hash.bytes[0] = tag;
    endian::store_big_u64(hash.bytes + kHashLength - sizeof(uint64_t), number);
    return hash;
}

BlockHeader sample_header(BlockNum block_num) {
    BlockHeader header;
    header.parent_hash = hash_of_number(0x01, block_num);
    header.beneficiary.bytes[19] = static_cast<uint8_t>(block_num % 251);
    header.state_root = hash_of_number(0x02, block_num);
    header.number = block_num;
    header.gas_limit = 30'000'000;
    header.gas_used = 21'000 * (block_num % 10);
    header.timestamp = 1'438'269'973 + block_num * 12;
    header.difficulty = block_num == 0 ? 0x400000000 : 131'072;
    return header;
}

Transaction sample_transaction(TxNum tx_num) {
    Transaction transaction;
    transaction.chain_id = 1;
    transaction.nonce = tx_num;
    transaction.max_priority_fee_per_gas = 1'000'000'000;
    transaction.max_fee_per_gas = 1'000'000'000;
    transaction.gas_limit = 21'000;
    transaction.to = evmc::address{};
    transaction.to->bytes[19] = static_cast<uint8_t>(tx_num % 253);
    transaction.value = tx_num * 1'000;
    transaction.odd_y_parity = tx_num % 2 == 1;
    transaction.r = 1 + tx_num;
    transaction.s = 2 + tx_num;
    return transaction;
}

Receipt sample_receipt(TxNum tx_num) {
    Receipt receipt;
    receipt.success = tx_num % 7 != 0;
    receipt.cumulative_gas_used = 21'000 * (tx_num + 1);
    if (tx_num % 3 == 0) {
        receipt.logs.push_back(Log{
            .address = evmc::address{},
            .topics = {hash_of_number(0x03, tx_num)},
            .data = Bytes(4, static_cast<uint8_t>(tx_num)),
        });
    }
    return receipt;
}

void write_headers(StaticFileProvider& provider, BlockNum from, BlockNum to) {
    const auto writer{provider.get_writer(from, StaticFileSegment::headers)};
    for (BlockNum block_num{from}; block_num <= to; ++block_num) {
        const BlockHeader header{sample_header(block_num)};
        writer->append_header(header, header.hash());
    }
    writer->commit();
}

void write_blocks(StaticFileProvider& provider, BlockNum from, BlockNum to, const SampleChain& chain) {
    const auto tx_writer{provider.get_writer(from, StaticFileSegment::transactions)};
    const auto receipt_writer{provider.get_writer(from, StaticFileSegment::receipts)};
    const auto meta_writer{provider.get_writer(from, StaticFileSegment::block_meta)};
    for (BlockNum block_num{from}; block_num <= to; ++block_num) {
        tx_writer->increment_block(block_num);
        receipt_writer->increment_block(block_num);
        const StoredBlockBodyIndices indices{chain.body_indices(block_num)};
        for (TxNum tx_num{indices.first_tx_num}; tx_num < indices.next_tx_num(); ++tx_num) {
            tx_writer->append_transaction(tx_num, sample_transaction(tx_num));
            receipt_writer->append_receipt(tx_num, sample_receipt(tx_num));
        }
        meta_writer->append_block_body_indices(block_num, indices);
    }
    tx_writer->commit();
    receipt_writer->commit();
    meta_writer->commit();
}

}  // namespace strata::db::static_files::test_util
