// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/types/block.hpp>
#include <strata/core/types/block_body_indices.hpp>
#include <strata/core/types/hash.hpp>
#include <strata/core/types/receipt.hpp>
#include <strata/core/types/transaction.hpp>
#include <strata/db/static_files/jar.hpp>
#include <strata/db/static_files/segment.hpp>

namespace strata::db::static_files {

//! \brief Read cursor over one loaded jar resolving block or transaction numbers to column values
//! \details Lookups outside the jar range yield std::nullopt, callers move to the neighbouring jar
class StaticFileCursor {
  public:
    explicit StaticFileCursor(std::shared_ptr<const LoadedJar> jar);

    [[nodiscard]] const SegmentHeader& user_header() const { return jar_->user_header(); }
    [[nodiscard]] StaticFileSegment segment() const { return jar_->user_header().segment(); }

    //! \brief First column selected by mask for the given block or transaction number
    std::optional<ByteView> get_one(uint64_t number, ColumnMask mask) const;
    //! \brief First column selected by mask for the row keyed by hash
    std::optional<ByteView> get_one(const Hash& key, ColumnMask mask) const;

    //! \brief First two columns selected by mask for the given block or transaction number
    std::optional<std::pair<ByteView, ByteView>> get_two(uint64_t number, ColumnMask mask) const;
    //! \brief First two columns selected by mask for the row keyed by hash
    std::optional<std::pair<ByteView, ByteView>> get_two(const Hash& key, ColumnMask mask) const;

    //! \brief Moves the sequential scan position to the given block or transaction number
    void seek(uint64_t number);
    //! \brief Value at the scan position, then advances, std::nullopt past the last row
    std::optional<ByteView> next(ColumnMask mask);
    //! \brief Block or transaction number of the scan position
    [[nodiscard]] uint64_t position() const { return position_; }

    //! \brief Block or transaction number of the row keyed by hash
    std::optional<uint64_t> number_by_hash(const Hash& key) const;

    // Typed accessors, throwing DecodingException on malformed rows
    std::optional<BlockHeader> header(BlockNum block_num) const;
    std::optional<SealedHeader> sealed_header(BlockNum block_num) const;
    std::optional<SealedHeader> sealed_header(const Hash& block_hash) const;
    std::optional<Hash> block_hash(BlockNum block_num) const;
    std::optional<Transaction> transaction(TxNum tx_num) const;
    std::optional<Receipt> receipt(TxNum tx_num) const;
    std::optional<StoredBlockBodyIndices> block_body_indices(BlockNum block_num) const;

  private:
    //! Number of the first row, block start or transaction start depending on segment
    [[nodiscard]] std::optional<uint64_t> first_number() const;
    [[nodiscard]] std::optional<uint64_t> row_of(uint64_t number) const;
    [[nodiscard]] std::optional<ByteView> select(uint64_t row, ColumnMask mask, size_t skip) const;

    std::shared_ptr<const LoadedJar> jar_;
    uint64_t position_{0};
};

}  // namespace strata::db::static_files
