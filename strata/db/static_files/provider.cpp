// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider.hpp"

#include <algorithm>
#include <exception>
#include <future>

#include <absl/strings/str_format.h>

#include <strata/db/kv/access_layer.hpp>
#include <strata/db/kv/stages.hpp>
#include <strata/db/kv/tables.hpp>
#include <strata/db/static_files/jar_checker.hpp>
#include <strata/db/static_files/storage_lock.hpp>
#include <strata/db/static_files/watcher.hpp>
#include <strata/infra/common/directories.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>

namespace strata::db::static_files {

namespace fs = std::filesystem;

std::optional<BlockNum> HighestStaticFiles::get(StaticFileSegment segment) const {
    switch (segment) {
        case StaticFileSegment::headers:
            return headers;
        case StaticFileSegment::transactions:
            return transactions;
        case StaticFileSegment::receipts:
            return receipts;
        case StaticFileSegment::block_meta:
            return block_meta;
    }
    return std::nullopt;
}

void HighestStaticFiles::set(StaticFileSegment segment, std::optional<BlockNum> block_num) {
    switch (segment) {
        case StaticFileSegment::headers:
            headers = block_num;
            break;
        case StaticFileSegment::transactions:
            transactions = block_num;
            break;
        case StaticFileSegment::receipts:
            receipts = block_num;
            break;
        case StaticFileSegment::block_meta:
            block_meta = block_num;
            break;
    }
}

std::optional<BlockNum> HighestStaticFiles::min_block_num() const {
    std::optional<BlockNum> min;
    for (const auto segment : kAllSegments) {
        const auto block_num{get(segment)};
        if (block_num && (!min || *block_num < *min)) min = block_num;
    }
    return min;
}

std::optional<BlockNum> HighestStaticFiles::max_block_num() const {
    std::optional<BlockNum> max;
    for (const auto segment : kAllSegments) {
        const auto block_num{get(segment)};
        if (block_num && (!max || *block_num > *max)) max = block_num;
    }
    return max;
}

std::map<StaticFileSegment, std::vector<JarFileInfo>> iter_static_files(const fs::path& directory) {
    std::map<StaticFileSegment, std::vector<JarFileInfo>> static_files;
    if (!fs::exists(directory)) {
        return static_files;
    }
    for (const auto& entry : fs::directory_iterator{directory}) {
        if (!entry.is_regular_file() || entry.path().extension() != ".conf") continue;
        const auto parsed{parse_filename(entry.path().stem().string())};
        if (!parsed) continue;

        const fs::path data_path{entry.path().parent_path() / entry.path().stem()};
        const Jar jar{Jar::load(data_path)};
        static_files[parsed->first].push_back(JarFileInfo{data_path, parsed->second, jar.user_header(), jar.rows()});
    }
    for (auto& [_, jars] : static_files) {
        std::sort(jars.begin(), jars.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.fixed_range.start < rhs.fixed_range.start;
        });
    }
    return static_files;
}

static const char* stage_of(StaticFileSegment segment) {
    switch (segment) {
        case StaticFileSegment::headers:
            return stages::kHeadersKey;
        case StaticFileSegment::transactions:
        case StaticFileSegment::block_meta:
            return stages::kBlockBodiesKey;
        case StaticFileSegment::receipts:
            return stages::kExecutionKey;
    }
    return stages::kHeadersKey;
}

static const MapConfig& table_of(StaticFileSegment segment) {
    switch (segment) {
        case StaticFileSegment::headers:
            return table::kHeaders;
        case StaticFileSegment::transactions:
            return table::kTransactions;
        case StaticFileSegment::receipts:
            return table::kReceipts;
        case StaticFileSegment::block_meta:
            return table::kBlockBodyIndices;
    }
    return table::kHeaders;
}

std::shared_ptr<StaticFileProvider> StaticFileProvider::read_only(const fs::path& directory, bool watch_directory) {
    return open(StaticFileSettings{
        .directory = directory,
        .access = StaticFileAccess::kReadOnly,
        .watch_directory = watch_directory,
    });
}

std::shared_ptr<StaticFileProvider> StaticFileProvider::read_write(const fs::path& directory) {
    return open(StaticFileSettings{
        .directory = directory,
        .access = StaticFileAccess::kReadWrite,
    });
}

std::shared_ptr<StaticFileProvider> StaticFileProvider::open(StaticFileSettings settings) {
    // Constructor is private to force shared ownership
    std::shared_ptr<StaticFileProvider> provider{new StaticFileProvider{std::move(settings)}};
    provider->initialize_index();
    if (provider->is_read_only() && provider->settings_.watch_directory) {
        provider->start_watcher();
    }
    return provider;
}

StaticFileProvider::StaticFileProvider(StaticFileSettings settings) : settings_{std::move(settings)} {
    ensure(settings_.blocks_per_file > 0, "StaticFileProvider: blocks_per_file must be positive");
    if (!is_read_only()) {
        Directory{settings_.directory, /*must_create=*/true};
        storage_lock_ = std::make_unique<StorageLock>(settings_.directory);
    }
    STRATA_INFO_M("Static file provider opened",
                  {"path", settings_.directory.string(),
                   "mode", is_read_only() ? "read-only" : "read-write",
                   "blocks_per_file", std::to_string(settings_.blocks_per_file)});
}

StaticFileProvider::~StaticFileProvider() {
    watcher_.reset();
    writers_.clear();
}

void StaticFileProvider::start_watcher() {
    watcher_ = std::make_unique<StaticFileWatcher>(weak_from_this(), settings_.directory, settings_.watch_poll_interval);
}

void StaticFileProvider::initialize_index() {
    const auto static_files{iter_static_files(settings_.directory)};

    std::unique_lock lock{index_mutex_};
    min_block_.clear();
    max_block_.clear();
    tx_index_.clear();

    for (const auto& [segment, jars] : static_files) {
        for (const auto& jar : jars) {
            const auto& block_range{jar.header.block_range()};
            if (!block_range) continue;

            if (!min_block_.contains(segment)) {
                min_block_[segment] = *block_range;
            }
            max_block_[segment] = block_range->end;
            if (const auto tx_end{jar.header.tx_end()}) {
                tx_index_[segment][*tx_end] = *block_range;
            }
        }
    }

    // Loaded jars may refer to files changed by another process
    jar_cache_.clear();

    const auto tx_it{min_block_.find(StaticFileSegment::transactions)};
    earliest_history_height_.store(tx_it != min_block_.end() ? tx_it->second.start : 0);

    STRATA_DEBUG_M("Static file index initialized",
                   {"path", settings_.directory.string(),
                    "segments", std::to_string(max_block_.size())});
}

void StaticFileProvider::update_index(StaticFileSegment segment, std::optional<BlockNum> segment_max_block) {
    if (!segment_max_block) {
        std::unique_lock lock{index_mutex_};
        min_block_.erase(segment);
        max_block_.erase(segment);
        tx_index_.erase(segment);
        jar_cache_.retain([&](const JarCacheKey& key) { return key.second != segment; });
        if (segment == StaticFileSegment::transactions) {
            earliest_history_height_.store(0);
        }
        return;
    }

    const SegmentRangeInclusive fixed_range{find_fixed_range(*segment_max_block)};
    auto jar{std::make_shared<const LoadedJar>(Jar::load(settings_.directory / filename(segment, fixed_range)))};
    const SegmentHeader& header{jar->user_header()};

    std::unique_lock lock{index_mutex_};
    const auto drop_from_fixed_range = [&](const auto& entry) { return entry.second.start >= fixed_range.start; };
    if (header.tx_range() && header.block_range()) {
        auto& index{tx_index_[segment]};
        absl::erase_if(index, drop_from_fixed_range);
        index[*header.tx_end()] = *header.block_range();
    } else if (is_tx_based(segment)) {
        if (const auto it{tx_index_.find(segment)}; it != tx_index_.end()) {
            absl::erase_if(it->second, drop_from_fixed_range);
            if (it->second.empty()) {
                tx_index_.erase(it);
            }
        }
    }

    // The fresh jar replaces the cached one, jars above it were removed by a prune
    jar_cache_.insert_or_assign({fixed_range.end, segment}, jar);
    jar_cache_.retain([&](const JarCacheKey& key) { return key.second != segment || key.first <= fixed_range.end; });

    max_block_[segment] = *segment_max_block;

    const SegmentRangeInclusive jar_range{header.block_range().value_or(fixed_range)};
    const auto min_it{min_block_.find(segment)};
    if (min_it == min_block_.end() || jar_range.start <= min_it->second.start) {
        min_block_[segment] = jar_range;
        if (segment == StaticFileSegment::transactions) {
            earliest_history_height_.store(jar_range.start);
        }
    }
}

bool StaticFileProvider::covers_block(StaticFileSegment segment, BlockNum block_num) const {
    std::shared_lock lock{index_mutex_};
    const auto max_it{max_block_.find(segment)};
    const auto min_it{min_block_.find(segment)};
    if (max_it == max_block_.end() || min_it == min_block_.end()) {
        return false;
    }
    return min_it->second.start <= block_num && block_num <= max_it->second;
}

std::optional<BlockNum> StaticFileProvider::get_lowest_static_file_block(StaticFileSegment segment) const {
    const auto range{get_lowest_range(segment)};
    if (!range) return std::nullopt;
    return range->end;
}

std::optional<SegmentRangeInclusive> StaticFileProvider::get_lowest_range(StaticFileSegment segment) const {
    std::shared_lock lock{index_mutex_};
    const auto it{min_block_.find(segment)};
    if (it == min_block_.end()) return std::nullopt;
    return it->second;
}

std::optional<BlockNum> StaticFileProvider::get_highest_static_file_block(StaticFileSegment segment) const {
    std::shared_lock lock{index_mutex_};
    const auto it{max_block_.find(segment)};
    if (it == max_block_.end()) return std::nullopt;
    return it->second;
}

std::optional<TxNum> StaticFileProvider::get_highest_static_file_tx(StaticFileSegment segment) const {
    std::shared_lock lock{index_mutex_};
    const auto it{tx_index_.find(segment)};
    if (it == tx_index_.end() || it->second.empty()) return std::nullopt;
    return it->second.rbegin()->first;
}

HighestStaticFiles StaticFileProvider::get_highest_static_files() const {
    HighestStaticFiles highest;
    for (const auto segment : kAllSegments) {
        highest.set(segment, get_highest_static_file_block(segment));
    }
    return highest;
}

std::optional<SegmentRangeInclusive> StaticFileProvider::get_segment_ranges_from_transaction(StaticFileSegment segment, TxNum tx_num) const {
    std::shared_lock lock{index_mutex_};
    const auto it{tx_index_.find(segment)};
    if (it == tx_index_.end() || it->second.empty()) {
        return std::nullopt;
    }
    const auto& index{it->second};
    if (tx_num > index.rbegin()->first) {
        return std::nullopt;
    }
    // Transactions are mostly requested close to the tip
    for (auto entry{index.rbegin()}; entry != index.rend(); ++entry) {
        const auto previous{std::next(entry)};
        const TxNum tx_start{previous != index.rend() ? previous->first + 1 : 0};
        if (tx_start <= tx_num) {
            return find_fixed_range(entry->second.end);
        }
    }
    return std::nullopt;
}

std::shared_ptr<const LoadedJar> StaticFileProvider::get_or_create_jar_provider(StaticFileSegment segment, const SegmentRangeInclusive& fixed_range) const {
    const JarCacheKey key{fixed_range.end, segment};
    if (auto jar = jar_cache_.get(key)) {
        return jar;
    }
    auto jar{std::make_shared<const LoadedJar>(Jar::load(settings_.directory / filename(segment, fixed_range)))};
    STRATA_TRACE_M("Static file loaded", {"segment", std::string{to_string(segment)}, "range", fixed_range.to_string()});
    return jar_cache_.get_or_insert(key, std::move(jar));
}

std::shared_ptr<const LoadedJar> StaticFileProvider::find_jar_by_block(StaticFileSegment segment, BlockNum block_num) const {
    if (!covers_block(segment, block_num)) {
        return nullptr;
    }
    return get_or_create_jar_provider(segment, find_fixed_range(block_num));
}

std::shared_ptr<const LoadedJar> StaticFileProvider::find_jar_by_transaction(StaticFileSegment segment, TxNum tx_num) const {
    const auto range{get_segment_ranges_from_transaction(segment, tx_num)};
    if (!range) {
        return nullptr;
    }
    return get_or_create_jar_provider(segment, *range);
}

std::shared_ptr<const LoadedJar> StaticFileProvider::jar_for(StaticFileSegment segment, uint64_t number) const {
    auto jar{is_block_based(segment) ? find_jar_by_block(segment, number) : find_jar_by_transaction(segment, number)};
    if (!jar) {
        throw_missing(segment, number);
    }
    return jar;
}

void StaticFileProvider::throw_missing(StaticFileSegment segment, uint64_t number) {
    if (is_block_based(segment)) {
        throw MissingStaticFileBlock{segment, number};
    }
    throw MissingStaticFileTx{segment, number};
}

std::shared_ptr<const LoadedJar> StaticFileProvider::get_segment_provider_from_block(StaticFileSegment segment, BlockNum block_num) const {
    auto jar{find_jar_by_block(segment, block_num)};
    if (!jar) {
        throw MissingStaticFileBlock{segment, block_num};
    }
    return jar;
}

std::shared_ptr<const LoadedJar> StaticFileProvider::get_segment_provider_from_transaction(StaticFileSegment segment, TxNum tx_num) const {
    auto jar{find_jar_by_transaction(segment, tx_num)};
    if (!jar) {
        throw MissingStaticFileTx{segment, tx_num};
    }
    return jar;
}

std::optional<BlockHeader> StaticFileProvider::header(const Hash& block_hash) const {
    return find_static_file<BlockHeader>(StaticFileSegment::headers, [&](const StaticFileCursor& cursor) -> std::optional<BlockHeader> {
        auto sealed{cursor.sealed_header(block_hash)};
        if (!sealed) return std::nullopt;
        return std::move(sealed->header);
    });
}

std::optional<BlockHeader> StaticFileProvider::header_by_number(BlockNum block_num) const {
    const auto jar{find_jar_by_block(StaticFileSegment::headers, block_num)};
    if (!jar) return std::nullopt;
    return StaticFileCursor{jar}.header(block_num);
}

std::optional<SealedHeader> StaticFileProvider::header_with_hash(BlockNum block_num) const {
    const auto jar{find_jar_by_block(StaticFileSegment::headers, block_num)};
    if (!jar) return std::nullopt;
    return StaticFileCursor{jar}.sealed_header(block_num);
}

std::optional<Hash> StaticFileProvider::block_hash(BlockNum block_num) const {
    const auto jar{find_jar_by_block(StaticFileSegment::headers, block_num)};
    if (!jar) return std::nullopt;
    return StaticFileCursor{jar}.block_hash(block_num);
}

std::vector<BlockHeader> StaticFileProvider::headers_range(BlockNumRange range) const {
    return fetch_range_with_predicate<BlockHeader>(
        StaticFileSegment::headers, range.start, range.end,
        [](const StaticFileCursor& cursor, uint64_t block_num) { return cursor.header(block_num); },
        [](const BlockHeader&) { return true; });
}

std::vector<SealedHeader> StaticFileProvider::sealed_headers_while(BlockNumRange range, const std::function<bool(const SealedHeader&)>& predicate) const {
    return fetch_range_with_predicate<SealedHeader>(
        StaticFileSegment::headers, range.start, range.end,
        [](const StaticFileCursor& cursor, uint64_t block_num) { return cursor.sealed_header(block_num); },
        predicate);
}

std::vector<Hash> StaticFileProvider::canonical_hashes_range(BlockNumRange range) const {
    return fetch_range_with_predicate<Hash>(
        StaticFileSegment::headers, range.start, range.end,
        [](const StaticFileCursor& cursor, uint64_t block_num) { return cursor.block_hash(block_num); },
        [](const Hash&) { return true; });
}

std::optional<TxNum> StaticFileProvider::transaction_id(const Hash& tx_hash) const {
    return find_static_file<TxNum>(StaticFileSegment::transactions, [&](const StaticFileCursor& cursor) {
        return cursor.number_by_hash(tx_hash);
    });
}

std::optional<Transaction> StaticFileProvider::transaction_by_id(TxNum tx_num) const {
    const auto jar{find_jar_by_transaction(StaticFileSegment::transactions, tx_num)};
    if (!jar) return std::nullopt;
    return StaticFileCursor{jar}.transaction(tx_num);
}

std::optional<Transaction> StaticFileProvider::transaction_by_hash(const Hash& tx_hash) const {
    return find_static_file<Transaction>(StaticFileSegment::transactions, [&](const StaticFileCursor& cursor) -> std::optional<Transaction> {
        const auto tx_num{cursor.number_by_hash(tx_hash)};
        if (!tx_num) return std::nullopt;
        return cursor.transaction(*tx_num);
    });
}

std::vector<Transaction> StaticFileProvider::transactions_by_tx_range(TxNumRange range) const {
    return fetch_range_with_predicate<Transaction>(
        StaticFileSegment::transactions, range.start, range.end,
        [](const StaticFileCursor& cursor, uint64_t tx_num) { return cursor.transaction(tx_num); },
        [](const Transaction&) { return true; });
}

ThreadPool& StaticFileProvider::hash_pool() const {
    std::scoped_lock lock{hash_pool_mutex_};
    if (!hash_pool_) {
        hash_pool_ = std::make_unique<ThreadPool>(std::max(settings_.hash_workers, 1u));
    }
    return *hash_pool_;
}

std::vector<std::pair<Hash, TxNum>> StaticFileProvider::transaction_hashes_by_range(TxNumRange range) const {
    using TxHashAndNum = std::pair<Hash, TxNum>;

    const auto highest_tx{get_highest_static_file_tx(StaticFileSegment::transactions)};
    if (!highest_tx) {
        return {};
    }
    const TxNum end{std::min(range.end, *highest_tx + 1)};
    if (range.start >= end) {
        return {};
    }

    const uint64_t chunk_size{std::max<uint64_t>(settings_.hash_chunk_size, 1)};
    ThreadPool& pool{hash_pool()};
    std::vector<std::future<std::vector<TxHashAndNum>>> chunks;
    chunks.reserve((end - range.start + chunk_size - 1) / chunk_size);
    for (TxNum chunk_start{range.start}; chunk_start < end; chunk_start += chunk_size) {
        const TxNum chunk_end{std::min(chunk_start + chunk_size, end)};
        chunks.push_back(pool.submit([this, chunk_start, chunk_end]() {
            return fetch_range_with_predicate<TxHashAndNum>(
                StaticFileSegment::transactions, chunk_start, chunk_end,
                [](const StaticFileCursor& cursor, uint64_t tx_num) -> std::optional<TxHashAndNum> {
                    const auto transaction{cursor.transaction(tx_num)};
                    if (!transaction) return std::nullopt;
                    return TxHashAndNum{transaction->hash(), tx_num};
                },
                [](const TxHashAndNum&) { return true; });
        }));
    }

    // Chunks are collected in submission order, all of them are awaited before the first error is raised
    std::vector<TxHashAndNum> hashes;
    hashes.reserve(end - range.start);
    std::exception_ptr first_error;
    for (auto& chunk : chunks) {
        try {
            auto chunk_hashes{chunk.get()};
            hashes.insert(hashes.end(), chunk_hashes.begin(), chunk_hashes.end());
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return hashes;
}

std::optional<Receipt> StaticFileProvider::receipt(TxNum tx_num) const {
    const auto jar{find_jar_by_transaction(StaticFileSegment::receipts, tx_num)};
    if (!jar) return std::nullopt;
    return StaticFileCursor{jar}.receipt(tx_num);
}

std::optional<Receipt> StaticFileProvider::receipt_by_hash(const Hash& tx_hash) const {
    const auto tx_num{transaction_id(tx_hash)};
    if (!tx_num) return std::nullopt;
    return receipt(*tx_num);
}

std::vector<Receipt> StaticFileProvider::receipts_by_tx_range(TxNumRange range) const {
    return fetch_range_with_predicate<Receipt>(
        StaticFileSegment::receipts, range.start, range.end,
        [](const StaticFileCursor& cursor, uint64_t tx_num) { return cursor.receipt(tx_num); },
        [](const Receipt&) { return true; });
}

std::optional<StoredBlockBodyIndices> StaticFileProvider::block_body_indices(BlockNum block_num) const {
    const auto jar{find_jar_by_block(StaticFileSegment::block_meta, block_num)};
    if (!jar) return std::nullopt;
    return StaticFileCursor{jar}.block_body_indices(block_num);
}

std::vector<StoredBlockBodyIndices> StaticFileProvider::block_body_indices_range(BlockNumRange range) const {
    return fetch_range_with_predicate<StoredBlockBodyIndices>(
        StaticFileSegment::block_meta, range.start, range.end,
        [](const StaticFileCursor& cursor, uint64_t block_num) { return cursor.block_body_indices(block_num); },
        [](const StoredBlockBodyIndices&) { return true; });
}

std::optional<BlockNum> StaticFileProvider::transaction_block(TxNum /*tx_num*/) const {
    throw UnsupportedProvider{"transaction_block"};
}

std::optional<BlockNum> StaticFileProvider::block_number(const Hash& /*block_hash*/) const {
    throw UnsupportedProvider{"block_number"};
}

std::vector<Transaction> StaticFileProvider::transactions_by_block(BlockNum /*block_num*/) const {
    throw UnsupportedProvider{"transactions_by_block"};
}

std::vector<evmc::address> StaticFileProvider::senders_by_tx_range(TxNumRange /*range*/) const {
    throw UnsupportedProvider{"senders_by_tx_range"};
}

std::vector<Receipt> StaticFileProvider::receipts_by_block(BlockNum /*block_num*/) const {
    throw UnsupportedProvider{"receipts_by_block"};
}

std::vector<SegmentHeader> StaticFileProvider::delete_transactions_below(BlockNum block_num) {
    std::vector<SegmentHeader> deleted_headers;
    if (block_num == 0) {
        return deleted_headers;
    }
    while (true) {
        const auto lowest_block{get_lowest_static_file_block(StaticFileSegment::transactions)};
        if (!lowest_block || *lowest_block >= block_num) {
            break;
        }
        STRATA_INFO_M("Expiring transaction static file",
                      {"lowest_block", std::to_string(*lowest_block),
                       "below", std::to_string(block_num)});
        deleted_headers.push_back(delete_jar(StaticFileSegment::transactions, *lowest_block));
    }
    return deleted_headers;
}

SegmentHeader StaticFileProvider::delete_jar(StaticFileSegment segment, BlockNum block_num) {
    if (is_read_only()) {
        throw ReadOnlyStaticFileAccess{};
    }
    const SegmentRangeInclusive fixed_range{find_fixed_range(block_num)};

    // A writer left on the deleted jar would recreate its files at stale offsets
    if (const auto writer{writers_.get(segment)}; writer && writer->user_header().expected_block_range() == fixed_range) {
        writers_.remove(segment);
        writer->close();
        STRATA_DEBUG_M("Static file writer closed", {"segment", std::string{to_string(segment)}, "range", fixed_range.to_string()});
    }

    const auto cached_jar{jar_cache_.remove({fixed_range.end, segment})};
    const Jar jar{cached_jar ? cached_jar->jar() : Jar::load(settings_.directory / filename(segment, fixed_range))};

    jar.delete_files();
    initialize_index();

    STRATA_INFO_M("Static file deleted",
                  {"segment", std::string{to_string(segment)},
                   "range", fixed_range.to_string()});
    return jar.user_header();
}

static uint64_t file_size_or_zero(const fs::path& path) {
    std::error_code ec;
    const auto size{fs::file_size(path, ec)};
    return ec ? 0 : size;
}

std::vector<SegmentStats> StaticFileProvider::stats() const {
    const auto static_files{iter_static_files(settings_.directory)};

    std::vector<SegmentStats> all_stats;
    for (const auto segment : kAllSegments) {
        SegmentStats segment_stats{.segment = segment};
        if (const auto it{static_files.find(segment)}; it != static_files.end()) {
            for (const auto& jar_info : it->second) {
                const Jar jar{jar_info.data_path, jar_info.header};
                ++segment_stats.jars;
                segment_stats.rows += jar_info.rows;
                segment_stats.data_size += file_size_or_zero(jar.data_path());
                segment_stats.offsets_size += file_size_or_zero(jar.offsets_path());
                segment_stats.index_size += file_size_or_zero(jar.index_path());
                segment_stats.config_size += file_size_or_zero(jar.config_path());
            }
        }
        all_stats.push_back(segment_stats);
    }
    return all_stats;
}

uint64_t StaticFileProvider::count_entries(StaticFileSegment segment) const {
    switch (segment) {
        case StaticFileSegment::headers: {
            const auto highest_block{get_highest_static_file_block(segment)};
            return highest_block ? *highest_block + 1 : 0;
        }
        case StaticFileSegment::transactions:
        case StaticFileSegment::receipts: {
            const auto highest_tx{get_highest_static_file_tx(segment)};
            return highest_tx ? *highest_tx + 1 : 0;
        }
        case StaticFileSegment::block_meta:
            break;
    }
    throw UnsupportedProvider{"count_entries for " + std::string{to_string(segment)}};
}

void StaticFileProvider::check_segment_consistency(StaticFileSegment segment) const {
    const auto highest_block{get_highest_static_file_block(segment)};
    if (!highest_block) {
        return;
    }
    Jar jar{Jar::load(settings_.directory / filename(segment, find_fixed_range(*highest_block)))};
    JarChecker{jar}.check(ConsistencyStrategy::kThrow);
}

std::optional<BlockNum> StaticFileProvider::check_consistency(ROTxn& txn, bool has_receipt_pruning) {
    STRATA_INFO_M("Verifying static file consistency", {"path", settings_.directory.string()});

    std::optional<BlockNum> unwind_target;
    const auto update_unwind_target = [&](BlockNum new_target) {
        if (!unwind_target || new_target < *unwind_target) {
            STRATA_INFO_M("Setting unwind target", {"block", std::to_string(new_target)});
            unwind_target = new_target;
        }
    };

    for (const auto segment : kAllSegments) {
        if (has_receipt_pruning && segment == StaticFileSegment::receipts) {
            // Receipts may be pruned in the database, they cannot be compared
            continue;
        }

        const auto initial_highest_block{get_highest_static_file_block(segment)};

        // Read-only instances fail on interrupted writes, read-write ones heal them
        if (is_read_only()) {
            check_segment_consistency(segment);
        } else {
            latest_writer(segment);
        }

        const auto highest_block{get_highest_static_file_block(segment)};
        if (initial_highest_block != highest_block) {
            STRATA_WARN_M("Static file segment healed",
                          {"segment", std::string{to_string(segment)},
                           "initial_highest_block", initial_highest_block ? std::to_string(*initial_highest_block) : "none",
                           "highest_block", highest_block ? std::to_string(*highest_block) : "none"});
            update_unwind_target(highest_block.value_or(0));
        }

        // Blocks whose transactions were lost by healing must be unwound too
        const auto highest_tx{is_tx_based(segment) ? get_highest_static_file_tx(segment) : std::nullopt};
        if (highest_tx) {
            BlockNum last_block{highest_block.value_or(0)};
            while (true) {
                const auto indices{block_body_indices_with_database(txn, last_block)};
                if (!indices || indices->last_tx_num() <= *highest_tx) {
                    break;
                }
                if (last_block == 0) {
                    break;
                }
                --last_block;
                update_unwind_target(last_block);
            }
        }

        const auto highest_entry{is_tx_based(segment) ? highest_tx : highest_block};
        if (const auto target{ensure_invariants(txn, segment, table_of(segment), highest_entry, highest_block)}) {
            update_unwind_target(*target);
        }
    }
    return unwind_target;
}

std::optional<StoredBlockBodyIndices> StaticFileProvider::block_body_indices_with_database(ROTxn& txn, BlockNum block_num) const {
    return get_with_static_file_or_database<StoredBlockBodyIndices>(
        StaticFileSegment::block_meta, block_num,
        [&](const StaticFileProvider& provider) { return provider.block_body_indices(block_num); },
        [&]() { return read_block_body_indices(txn, block_num); });
}

std::optional<BlockNum> StaticFileProvider::ensure_invariants(ROTxn& txn,
                                                              StaticFileSegment segment,
                                                              const MapConfig& table,
                                                              std::optional<uint64_t> highest_static_file_entry,
                                                              std::optional<BlockNum> highest_static_file_block) {
    const auto db_first_entry{read_first_key(txn, table)};
    if (db_first_entry && highest_static_file_entry && highest_static_file_block) {
        // Static files and database must overlap or be contiguous
        if (!(*db_first_entry <= *highest_static_file_entry || *highest_static_file_entry + 1 == *db_first_entry)) {
            STRATA_WARN_M("Gap between static files and database",
                          {"segment", std::string{to_string(segment)},
                           "db_first_entry", std::to_string(*db_first_entry),
                           "highest_static_file_entry", std::to_string(*highest_static_file_entry)});
            return highest_static_file_block;
        }
    }

    const auto db_last_entry{read_last_key(txn, table)};
    if (db_last_entry && (!highest_static_file_entry || *db_last_entry > *highest_static_file_entry)) {
        // Database ahead of static files, the next appends catch up
        return std::nullopt;
    }

    const BlockNum highest_block{highest_static_file_block.value_or(0)};
    const BlockNum checkpoint_block_num{stages::read_stage_progress(txn, stage_of(segment))};

    if (checkpoint_block_num > highest_block) {
        STRATA_WARN_M("Stage checkpoint ahead of static files",
                      {"segment", std::string{to_string(segment)},
                       "checkpoint", std::to_string(checkpoint_block_num),
                       "highest_block", std::to_string(highest_block)});
        return highest_block;
    }

    if (checkpoint_block_num < highest_block) {
        STRATA_WARN_M("Stage checkpoint behind static files, pruning",
                      {"segment", std::string{to_string(segment)},
                       "checkpoint", std::to_string(checkpoint_block_num),
                       "highest_block", std::to_string(highest_block)});
        const auto writer{latest_writer(segment)};
        if (segment == StaticFileSegment::headers) {
            writer->prune_headers(highest_block - checkpoint_block_num);
        } else if (segment == StaticFileSegment::block_meta) {
            writer->prune_block_meta(highest_block - checkpoint_block_num);
        } else if (const auto indices{block_body_indices_with_database(txn, checkpoint_block_num)}) {
            const TxNum last_tx_num{indices->last_tx_num()};
            const uint64_t highest_tx{highest_static_file_entry.value_or(0)};
            const uint64_t to_delete{highest_tx > last_tx_num ? highest_tx - last_tx_num : 0};
            if (segment == StaticFileSegment::receipts) {
                writer->prune_receipts(to_delete, checkpoint_block_num);
            } else {
                writer->prune_transactions(to_delete, checkpoint_block_num);
            }
        }
        writer->commit();
    }
    return std::nullopt;
}

std::shared_ptr<StaticFileWriter> StaticFileProvider::get_writer(BlockNum block_num, StaticFileSegment segment) {
    if (is_read_only()) {
        throw ReadOnlyStaticFileAccess{};
    }
    return writers_.get_or_create(segment, [&]() {
        STRATA_DEBUG_M("Opening static file writer",
                       {"segment", std::string{to_string(segment)}, "block", std::to_string(block_num)});
        return std::make_shared<StaticFileWriter>(weak_from_this(), segment, block_num);
    });
}

std::shared_ptr<StaticFileWriter> StaticFileProvider::latest_writer(StaticFileSegment segment) {
    return get_writer(get_highest_static_file_block(segment).value_or(0), segment);
}

void StaticFileProvider::commit() {
    writers_.commit();
}

}  // namespace strata::db::static_files
