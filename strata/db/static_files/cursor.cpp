// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "cursor.hpp"

#include <strata/infra/common/decoding_exception.hpp>
#include <strata/infra/common/ensure.hpp>

namespace strata::db::static_files {

template <class T>
static T decode_row(ByteView data, const char* what, uint64_t number) {
    T value;
    success_or_throw(rlp::decode(data, value), std::string{"cannot decode "} + what + " " + std::to_string(number));
    return value;
}

StaticFileCursor::StaticFileCursor(std::shared_ptr<const LoadedJar> jar) : jar_{std::move(jar)} {
    ensure(jar_ != nullptr, "StaticFileCursor: null jar");
    position_ = first_number().value_or(0);
}

std::optional<uint64_t> StaticFileCursor::first_number() const {
    const SegmentHeader& header{jar_->user_header()};
    return is_block_based(header.segment()) ? header.block_start() : header.tx_start();
}

std::optional<uint64_t> StaticFileCursor::row_of(uint64_t number) const {
    const auto start{first_number()};
    if (!start || number < *start) {
        return std::nullopt;
    }
    const uint64_t row{number - *start};
    if (row >= jar_->rows()) {
        return std::nullopt;
    }
    return row;
}

std::optional<ByteView> StaticFileCursor::select(uint64_t row, ColumnMask mask, size_t skip) const {
    for (size_t column{0}; column < jar_->jar().columns(); ++column) {
        if ((mask & (1u << column)) == 0) continue;
        if (skip > 0) {
            --skip;
            continue;
        }
        return jar_->column(row, column);
    }
    return std::nullopt;
}

std::optional<ByteView> StaticFileCursor::get_one(uint64_t number, ColumnMask mask) const {
    const auto row{row_of(number)};
    if (!row) return std::nullopt;
    return select(*row, mask, 0);
}

std::optional<ByteView> StaticFileCursor::get_one(const Hash& key, ColumnMask mask) const {
    const auto row{jar_->find_row(key)};
    if (!row) return std::nullopt;
    return select(*row, mask, 0);
}

std::optional<std::pair<ByteView, ByteView>> StaticFileCursor::get_two(uint64_t number, ColumnMask mask) const {
    const auto row{row_of(number)};
    if (!row) return std::nullopt;
    const auto first{select(*row, mask, 0)};
    const auto second{select(*row, mask, 1)};
    if (!first || !second) return std::nullopt;
    return std::make_pair(*first, *second);
}

std::optional<std::pair<ByteView, ByteView>> StaticFileCursor::get_two(const Hash& key, ColumnMask mask) const {
    const auto number{number_by_hash(key)};
    if (!number) return std::nullopt;
    return get_two(*number, mask);
}

void StaticFileCursor::seek(uint64_t number) {
    position_ = number;
}

std::optional<ByteView> StaticFileCursor::next(ColumnMask mask) {
    auto value{get_one(position_, mask)};
    if (value) {
        ++position_;
    }
    return value;
}

std::optional<uint64_t> StaticFileCursor::number_by_hash(const Hash& key) const {
    const auto row{jar_->find_row(key)};
    const auto start{first_number()};
    if (!row || !start) return std::nullopt;
    return *start + *row;
}

std::optional<BlockHeader> StaticFileCursor::header(BlockNum block_num) const {
    const auto data{get_one(block_num, kHeaderMask)};
    if (!data) return std::nullopt;
    return decode_row<BlockHeader>(*data, "header", block_num);
}

std::optional<SealedHeader> StaticFileCursor::sealed_header(BlockNum block_num) const {
    const auto columns{get_two(block_num, kHeaderWithHashMask)};
    if (!columns) return std::nullopt;
    if (columns->second.size() != kHashLength) {
        throw DecodingException{DecodingError::kUnexpectedLength, "bad hash length for block " + std::to_string(block_num)};
    }
    return SealedHeader{decode_row<BlockHeader>(columns->first, "header", block_num), Hash{columns->second}};
}

std::optional<SealedHeader> StaticFileCursor::sealed_header(const Hash& block_hash) const {
    const auto number{number_by_hash(block_hash)};
    if (!number) return std::nullopt;
    return sealed_header(*number);
}

std::optional<Hash> StaticFileCursor::block_hash(BlockNum block_num) const {
    const auto data{get_one(block_num, kBlockHashMask)};
    if (!data) return std::nullopt;
    if (data->size() != kHashLength) {
        throw DecodingException{DecodingError::kUnexpectedLength, "bad hash length for block " + std::to_string(block_num)};
    }
    return Hash{*data};
}

std::optional<Transaction> StaticFileCursor::transaction(TxNum tx_num) const {
    const auto data{get_one(tx_num, kTransactionMask)};
    if (!data) return std::nullopt;
    return decode_row<Transaction>(*data, "transaction", tx_num);
}

std::optional<Receipt> StaticFileCursor::receipt(TxNum tx_num) const {
    const auto data{get_one(tx_num, kReceiptMask)};
    if (!data) return std::nullopt;
    return decode_row<Receipt>(*data, "receipt", tx_num);
}

std::optional<StoredBlockBodyIndices> StaticFileCursor::block_body_indices(BlockNum block_num) const {
    auto data{get_one(block_num, kBlockBodyIndicesMask)};
    if (!data) return std::nullopt;
    StoredBlockBodyIndices indices;
    success_or_throw(StoredBlockBodyIndices::decode(*data, indices), "cannot decode body indices " + std::to_string(block_num));
    return indices;
}

}  // namespace strata::db::static_files
