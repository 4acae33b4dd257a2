// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/types/block.hpp>
#include <strata/core/types/block_body_indices.hpp>
#include <strata/core/types/hash.hpp>
#include <strata/core/types/receipt.hpp>
#include <strata/core/types/transaction.hpp>
#include <strata/db/static_files/jar_writer.hpp>
#include <strata/db/static_files/segment.hpp>

namespace strata::db::static_files {

class StaticFileProvider;

/**
 * StaticFileWriter is the single appender of one segment.
 * It writes to the highest jar of the segment, rotates to a new jar when the fixed block range is full
 * and prunes back across jar boundaries. Each commit updates the provider index.
 * All public operations are serialized by an internal mutex.
 */
class StaticFileWriter {
  public:
    //! \brief Opens the jar containing the given block, healing it, or creates it when missing
    StaticFileWriter(std::weak_ptr<StaticFileProvider> provider, StaticFileSegment segment, BlockNum block_num);

    // Not copyable nor movable
    StaticFileWriter(const StaticFileWriter&) = delete;
    StaticFileWriter& operator=(const StaticFileWriter&) = delete;

    [[nodiscard]] StaticFileSegment segment() const { return segment_; }

    //! \brief Copy of the user header of the active jar
    SegmentHeader user_header() const;

    //! \brief Path of the data file of the active jar
    std::filesystem::path data_path() const;

    //! \brief Appends the header and its hash, the header number must follow the last one
    void append_header(const BlockHeader& header, const Hash& hash);

    //! \brief Appends the body indices of the given block, which must follow the last one
    void append_block_body_indices(BlockNum block_num, const StoredBlockBodyIndices& indices);

    //! \brief Appends a transaction, the number must follow the last appended transaction
    void append_transaction(TxNum tx_num, const Transaction& transaction);

    //! \brief Appends a receipt, the number must follow the last appended receipt
    void append_receipt(TxNum tx_num, const Receipt& receipt);

    //! \brief Moves a tx-based segment to the next block, rotating the jar when its range is full
    //! \throws UnexpectedStaticFileBlockNumber if the block does not follow the last one
    void increment_block(BlockNum expected_block_num);

    //! \brief Adds empty blocks up to the given one, which is a no-op when already there
    void ensure_at_block(BlockNum advance_to);

    //! \brief Removes the last n headers
    void prune_headers(uint64_t to_delete);

    //! \brief Removes the last n body indices
    void prune_block_meta(uint64_t to_delete);

    //! \brief Removes the last n transactions, the segment then ends at last_block
    void prune_transactions(uint64_t to_delete, BlockNum last_block);

    //! \brief Removes the last n receipts, the segment then ends at last_block
    void prune_receipts(uint64_t to_delete, BlockNum last_block);

    //! \brief Durably persists the active jar and refreshes the provider index
    void commit();

    //! \brief Drops the active jar without committing, any later operation throws StaticFileError
    void close();

  private:
    [[nodiscard]] std::shared_ptr<StaticFileProvider> provider() const;
    [[nodiscard]] JarWriter open_jar(BlockNum block_num) const;

    void ensure_open() const;
    void ensure_segment(StaticFileSegment expected) const;
    void ensure_end_range_consistency();
    void check_next_block_number(BlockNum expected_block_num) const;
    void do_increment_block(BlockNum expected_block_num);
    void append_with_tx_number(TxNum tx_num, std::span<const ByteView> columns, const std::optional<Hash>& key);
    void truncate(uint64_t num_rows, std::optional<BlockNum> last_block);
    void delete_current_and_open_previous();
    void do_commit();
    void update_index() const;

    std::weak_ptr<StaticFileProvider> provider_;
    StaticFileSegment segment_;
    std::optional<JarWriter> writer_;
    mutable std::mutex mutex_;
};

}  // namespace strata::db::static_files
