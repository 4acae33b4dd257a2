// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <evmc/evmc.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/types/block.hpp>
#include <strata/core/types/block_body_indices.hpp>
#include <strata/core/types/hash.hpp>
#include <strata/core/types/receipt.hpp>
#include <strata/core/types/transaction.hpp>
#include <strata/db/kv/mdbx.hpp>
#include <strata/db/static_files/cursor.hpp>
#include <strata/db/static_files/errors.hpp>
#include <strata/db/static_files/jar.hpp>
#include <strata/db/static_files/jar_cache.hpp>
#include <strata/db/static_files/segment.hpp>
#include <strata/db/static_files/settings.hpp>
#include <strata/db/static_files/writers.hpp>
#include <strata/infra/concurrency/thread_pool.hpp>

namespace strata::db::static_files {

class StaticFileWatcher;
class StorageLock;

//! Highest block held by each segment
struct HighestStaticFiles {
    std::optional<BlockNum> headers;
    std::optional<BlockNum> transactions;
    std::optional<BlockNum> receipts;
    std::optional<BlockNum> block_meta;

    [[nodiscard]] std::optional<BlockNum> get(StaticFileSegment segment) const;
    void set(StaticFileSegment segment, std::optional<BlockNum> block_num);

    //! \brief Lowest of the highest blocks across segments holding data
    [[nodiscard]] std::optional<BlockNum> min_block_num() const;
    //! \brief Highest block across all segments
    [[nodiscard]] std::optional<BlockNum> max_block_num() const;
};

//! On-disk footprint of one segment
struct SegmentStats {
    StaticFileSegment segment{StaticFileSegment::headers};
    size_t jars{0};
    uint64_t rows{0};
    uint64_t data_size{0};
    uint64_t offsets_size{0};
    uint64_t index_size{0};
    uint64_t config_size{0};

    [[nodiscard]] uint64_t total_size() const { return data_size + offsets_size + index_size + config_size; }
};

//! A jar found on disk together with its user header
struct JarFileInfo {
    std::filesystem::path data_path;
    SegmentRangeInclusive fixed_range;
    SegmentHeader header;
    uint64_t rows{0};
};

//! \brief Lists the jars of the directory by segment, sorted by fixed range
//! \throws StaticFileError if a jar configuration cannot be read
std::map<StaticFileSegment, std::vector<JarFileInfo>> iter_static_files(const std::filesystem::path& directory);

/**
 * StaticFileProvider is the shared entry point to the static files of one directory.
 * It keeps an in-memory index of the jars on disk (lowest and highest block per segment,
 * transaction number to block range per tx-based segment), a cache of loaded jars and the
 * per-segment writers. The index is rebuilt from jar headers at startup and refreshed by each
 * writer commit. Providers are shared through std::shared_ptr and must be created by the factories.
 */
class StaticFileProvider : public std::enable_shared_from_this<StaticFileProvider> {
  public:
    //! \brief Opens a read-only provider, optionally following changes made by another process
    static std::shared_ptr<StaticFileProvider> read_only(const std::filesystem::path& directory, bool watch_directory);

    //! \brief Opens a read-write provider, locking the directory
    //! \throws StorageLockError if another read-write provider owns the directory
    static std::shared_ptr<StaticFileProvider> read_write(const std::filesystem::path& directory);

    static std::shared_ptr<StaticFileProvider> open(StaticFileSettings settings);

    ~StaticFileProvider();

    StaticFileProvider(const StaticFileProvider&) = delete;
    StaticFileProvider& operator=(const StaticFileProvider&) = delete;

    [[nodiscard]] const StaticFileSettings& settings() const { return settings_; }
    [[nodiscard]] const std::filesystem::path& directory() const { return settings_.directory; }
    [[nodiscard]] uint64_t blocks_per_file() const { return settings_.blocks_per_file; }
    [[nodiscard]] bool is_read_only() const { return settings_.access == StaticFileAccess::kReadOnly; }

    [[nodiscard]] SegmentRangeInclusive find_fixed_range(BlockNum block_num) const {
        return static_files::find_fixed_range(block_num, settings_.blocks_per_file);
    }

    /* Index */

    //! \brief Rebuilds the index from the jars on disk and clears the jar cache
    void initialize_index();

    //! \brief Refreshes the index after a commit that left the segment at segment_max_block (none if empty)
    void update_index(StaticFileSegment segment, std::optional<BlockNum> segment_max_block);

    //! \brief Whether the index has a jar of the segment holding the given block
    [[nodiscard]] bool covers_block(StaticFileSegment segment, BlockNum block_num) const;

    [[nodiscard]] BlockNum earliest_history_height() const { return earliest_history_height_.load(); }

    //! \brief End of the lowest block range on disk
    [[nodiscard]] std::optional<BlockNum> get_lowest_static_file_block(StaticFileSegment segment) const;
    [[nodiscard]] std::optional<BlockNum> get_lowest_transaction_static_file_block() const {
        return get_lowest_static_file_block(StaticFileSegment::transactions);
    }
    [[nodiscard]] std::optional<SegmentRangeInclusive> get_lowest_range(StaticFileSegment segment) const;
    [[nodiscard]] std::optional<BlockNum> get_highest_static_file_block(StaticFileSegment segment) const;
    [[nodiscard]] std::optional<TxNum> get_highest_static_file_tx(StaticFileSegment segment) const;
    [[nodiscard]] HighestStaticFiles get_highest_static_files() const;

    //! \brief Fixed range owning the transaction, std::nullopt if beyond the highest indexed one
    [[nodiscard]] std::optional<SegmentRangeInclusive> get_segment_ranges_from_transaction(StaticFileSegment segment, TxNum tx_num) const;

    /* Jar acquisition */

    //! \throws MissingStaticFileBlock if no jar of the segment holds the block
    std::shared_ptr<const LoadedJar> get_segment_provider_from_block(StaticFileSegment segment, BlockNum block_num) const;

    //! \throws MissingStaticFileTx if no jar of the segment holds the transaction
    std::shared_ptr<const LoadedJar> get_segment_provider_from_transaction(StaticFileSegment segment, TxNum tx_num) const;

    //! \brief Cached jar of the fixed range, loaded from disk on first access
    std::shared_ptr<const LoadedJar> get_or_create_jar_provider(StaticFileSegment segment, const SegmentRangeInclusive& fixed_range) const;

    [[nodiscard]] size_t cached_jars() const { return jar_cache_.size(); }

    /* Headers */

    std::optional<BlockHeader> header(const Hash& block_hash) const;
    std::optional<BlockHeader> header_by_number(BlockNum block_num) const;
    std::optional<SealedHeader> header_with_hash(BlockNum block_num) const;
    std::optional<Hash> block_hash(BlockNum block_num) const;
    std::vector<BlockHeader> headers_range(BlockNumRange range) const;
    std::vector<SealedHeader> sealed_headers_while(BlockNumRange range, const std::function<bool(const SealedHeader&)>& predicate) const;
    std::vector<Hash> canonical_hashes_range(BlockNumRange range) const;

    /* Transactions */

    std::optional<TxNum> transaction_id(const Hash& tx_hash) const;
    std::optional<Transaction> transaction_by_id(TxNum tx_num) const;
    std::optional<Transaction> transaction_by_hash(const Hash& tx_hash) const;
    std::vector<Transaction> transactions_by_tx_range(TxNumRange range) const;

    //! \brief Hashes of the transactions in range computed by a worker pool, in transaction order
    std::vector<std::pair<Hash, TxNum>> transaction_hashes_by_range(TxNumRange range) const;

    /* Receipts */

    std::optional<Receipt> receipt(TxNum tx_num) const;
    std::optional<Receipt> receipt_by_hash(const Hash& tx_hash) const;
    std::vector<Receipt> receipts_by_tx_range(TxNumRange range) const;

    /* Block meta */

    std::optional<StoredBlockBodyIndices> block_body_indices(BlockNum block_num) const;
    std::vector<StoredBlockBodyIndices> block_body_indices_range(BlockNumRange range) const;

    /* Queries needing data held only by the database, always throwing UnsupportedProvider */

    std::optional<BlockNum> transaction_block(TxNum tx_num) const;
    std::optional<BlockNum> block_number(const Hash& block_hash) const;
    std::vector<Transaction> transactions_by_block(BlockNum block_num) const;
    std::vector<evmc::address> senders_by_tx_range(TxNumRange range) const;
    std::vector<Receipt> receipts_by_block(BlockNum block_num) const;

    /* Generic access */

    //! \brief Walks jars from the highest range down to the lowest one until fn yields a value
    template <class T>
    std::optional<T> find_static_file(StaticFileSegment segment, const std::function<std::optional<T>(const StaticFileCursor&)>& fn) const;

    //! \brief Values for numbers in [start, end) read across jars, stopping at the first one failing the predicate
    //! \details The range is clamped to the highest entry on disk. A number missing twice in a row,
    //! the second time after reloading its jar, raises MissingStaticFileBlock or MissingStaticFileTx
    template <class T>
    std::vector<T> fetch_range_with_predicate(StaticFileSegment segment,
                                              uint64_t start,
                                              uint64_t end,
                                              const std::function<std::optional<T>(const StaticFileCursor&, uint64_t)>& get_fn,
                                              const std::function<bool(const T&)>& predicate) const;

    //! \brief Serves the number from static files when the segment holds it, from the database otherwise
    template <class T>
    std::optional<T> get_with_static_file_or_database(StaticFileSegment segment,
                                                      uint64_t number,
                                                      const std::function<std::optional<T>(const StaticFileProvider&)>& fetch_from_static_file,
                                                      const std::function<std::optional<T>()>& fetch_from_database) const;

    //! \brief Splits [start, end) at the highest static entry, serving the lower part from static files
    template <class T>
    std::vector<T> get_range_with_static_file_or_database(
        StaticFileSegment segment,
        uint64_t start,
        uint64_t end,
        const std::function<std::vector<T>(const StaticFileProvider&, uint64_t, uint64_t, const std::function<bool(const T&)>&)>& fetch_from_static_file,
        const std::function<std::vector<T>(uint64_t, uint64_t, const std::function<bool(const T&)>&)>& fetch_from_database,
        const std::function<bool(const T&)>& predicate) const;

    /* Maintenance */

    //! \brief Deletes the transaction jars whose block range ends below the given block
    //! \return the headers of the deleted jars
    std::vector<SegmentHeader> delete_transactions_below(BlockNum block_num);

    //! \brief Deletes the jar of the segment holding the given block and rebuilds the index
    SegmentHeader delete_jar(StaticFileSegment segment, BlockNum block_num);

    //! \brief Number of jars, rows and bytes per segment
    std::vector<SegmentStats> stats() const;

    //! \brief Number of entries of headers, transactions or receipts
    uint64_t count_entries(StaticFileSegment segment) const;

    //! \brief Checks the highest jar of the segment without repairing it
    //! \throws InconsistentJar if the jar files disagree with its configuration
    void check_segment_consistency(StaticFileSegment segment) const;

    //! \brief Reconciles all segments with the database tables and stage checkpoints
    //! \details Read-write providers heal interrupted writes and prune data ahead of the checkpoints.
    //! \return the block to unwind the pipeline to, std::nullopt if static files and database agree
    std::optional<BlockNum> check_consistency(ROTxn& txn, bool has_receipt_pruning);

    /* Writers */

    //! \brief The writer of the segment, opened at the jar holding block_num if not open yet
    //! \throws ReadOnlyStaticFileAccess on a read-only provider
    std::shared_ptr<StaticFileWriter> get_writer(BlockNum block_num, StaticFileSegment segment);

    //! \brief The writer of the segment opened at its highest block
    std::shared_ptr<StaticFileWriter> latest_writer(StaticFileSegment segment);

    //! \brief Commits all open writers
    void commit();

  private:
    explicit StaticFileProvider(StaticFileSettings settings);

    void start_watcher();

    [[nodiscard]] std::shared_ptr<const LoadedJar> find_jar_by_block(StaticFileSegment segment, BlockNum block_num) const;
    [[nodiscard]] std::shared_ptr<const LoadedJar> find_jar_by_transaction(StaticFileSegment segment, TxNum tx_num) const;
    [[nodiscard]] std::shared_ptr<const LoadedJar> jar_for(StaticFileSegment segment, uint64_t number) const;
    [[noreturn]] static void throw_missing(StaticFileSegment segment, uint64_t number);

    //! Body indices from static files when the block meta segment holds the block, from the database otherwise
    std::optional<StoredBlockBodyIndices> block_body_indices_with_database(ROTxn& txn, BlockNum block_num) const;

    std::optional<BlockNum> ensure_invariants(ROTxn& txn,
                                              StaticFileSegment segment,
                                              const MapConfig& table,
                                              std::optional<uint64_t> highest_static_file_entry,
                                              std::optional<BlockNum> highest_static_file_block);

    ThreadPool& hash_pool() const;

    StaticFileSettings settings_;
    std::unique_ptr<StorageLock> storage_lock_;

    //! Guards the index maps
    mutable std::shared_mutex index_mutex_;
    //! Block range of the lowest jar holding data, per segment
    absl::flat_hash_map<StaticFileSegment, SegmentRangeInclusive> min_block_;
    //! Highest block on disk, per segment
    absl::flat_hash_map<StaticFileSegment, BlockNum> max_block_;
    //! Last transaction number of each jar mapped to its block range, per tx-based segment
    absl::flat_hash_map<StaticFileSegment, absl::btree_map<TxNum, SegmentRangeInclusive>> tx_index_;
    //! Start of the lowest transaction block range, kept in sync with min_block_
    std::atomic<BlockNum> earliest_history_height_{0};

    mutable JarCache jar_cache_;
    StaticFileWriters writers_;

    mutable std::mutex hash_pool_mutex_;
    mutable std::unique_ptr<ThreadPool> hash_pool_;

    std::unique_ptr<StaticFileWatcher> watcher_;
};

template <class T>
std::optional<T> StaticFileProvider::find_static_file(StaticFileSegment segment, const std::function<std::optional<T>(const StaticFileCursor&)>& fn) const {
    const auto highest_block{get_highest_static_file_block(segment)};
    const auto lowest_range{get_lowest_range(segment)};
    if (!highest_block || !lowest_range) {
        return std::nullopt;
    }
    SegmentRangeInclusive range{find_fixed_range(*highest_block)};
    while (true) {
        const StaticFileCursor cursor{get_or_create_jar_provider(segment, range)};
        if (auto result = fn(cursor)) {
            return result;
        }
        if (range.start == 0 || range.start <= lowest_range->start) {
            break;
        }
        range = find_fixed_range(range.start - 1);
    }
    return std::nullopt;
}

template <class T>
std::vector<T> StaticFileProvider::fetch_range_with_predicate(StaticFileSegment segment,
                                                              uint64_t start,
                                                              uint64_t end,
                                                              const std::function<std::optional<T>(const StaticFileCursor&, uint64_t)>& get_fn,
                                                              const std::function<bool(const T&)>& predicate) const {
    const auto highest{is_block_based(segment) ? get_highest_static_file_block(segment) : get_highest_static_file_tx(segment)};
    if (!highest) {
        return {};
    }
    end = std::min(end, *highest + 1);
    if (start >= end) {
        return {};
    }

    std::vector<T> result;
    result.reserve(end - start);
    std::optional<StaticFileCursor> cursor;
    for (uint64_t number{start}; number < end; ++number) {
        if (!cursor) {
            cursor.emplace(jar_for(segment, number));
        }
        bool retried{false};
        while (true) {
            auto value{get_fn(*cursor, number)};
            if (value) {
                if (!predicate(*value)) {
                    return result;
                }
                result.push_back(std::move(*value));
                break;
            }
            // Not in this jar: move to the jar owning the number, a second miss is fatal
            if (retried) {
                throw_missing(segment, number);
            }
            retried = true;
            cursor.emplace(jar_for(segment, number));
        }
    }
    return result;
}

template <class T>
std::optional<T> StaticFileProvider::get_with_static_file_or_database(StaticFileSegment segment,
                                                                      uint64_t number,
                                                                      const std::function<std::optional<T>(const StaticFileProvider&)>& fetch_from_static_file,
                                                                      const std::function<std::optional<T>()>& fetch_from_database) const {
    const auto highest{is_block_based(segment) ? get_highest_static_file_block(segment) : get_highest_static_file_tx(segment)};
    if (highest && number <= *highest) {
        return fetch_from_static_file(*this);
    }
    return fetch_from_database();
}

template <class T>
std::vector<T> StaticFileProvider::get_range_with_static_file_or_database(
    StaticFileSegment segment,
    uint64_t start,
    uint64_t end,
    const std::function<std::vector<T>(const StaticFileProvider&, uint64_t, uint64_t, const std::function<bool(const T&)>&)>& fetch_from_static_file,
    const std::function<std::vector<T>(uint64_t, uint64_t, const std::function<bool(const T&)>&)>& fetch_from_database,
    const std::function<bool(const T&)>& predicate) const {
    const auto highest{is_block_based(segment) ? get_highest_static_file_block(segment) : get_highest_static_file_tx(segment)};
    const uint64_t static_file_upper_bound{highest ? *highest + 1 : 0};

    std::vector<T> data;
    if (start < static_file_upper_bound) {
        const uint64_t static_end{std::min(end, static_file_upper_bound)};
        data = fetch_from_static_file(*this, start, static_end, predicate);
        if (data.size() < static_end - start) {
            // The predicate stopped the walk
            return data;
        }
    }
    if (end > static_file_upper_bound) {
        auto from_database{fetch_from_database(std::max(start, static_file_upper_bound), end, predicate)};
        data.insert(data.end(), std::make_move_iterator(from_database.begin()), std::make_move_iterator(from_database.end()));
    }
    return data;
}

}  // namespace strata::db::static_files
