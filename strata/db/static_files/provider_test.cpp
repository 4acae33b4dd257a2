// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider.hpp"

#include <filesystem>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <strata/db/kv/access_layer.hpp>
#include <strata/db/kv/stages.hpp>
#include <strata/db/static_files/file_util.hpp>
#include <strata/db/static_files/test_util/sample_data.hpp>
#include <strata/db/test_util/temp_chain_data.hpp>
#include <strata/infra/common/directories.hpp>
#include <strata/infra/test_util/log.hpp>

namespace strata::db::static_files {

namespace test = test_util;
using db::test_util::TempChainData;
using strata::test_util::SetLogVerbosityGuard;

static std::shared_ptr<StaticFileProvider> open_read_write(const std::filesystem::path& directory, uint64_t blocks_per_file) {
    return StaticFileProvider::open({
        .directory = directory,
        .access = StaticFileAccess::kReadWrite,
        .blocks_per_file = blocks_per_file,
    });
}

static std::shared_ptr<StaticFileProvider> open_read_only(const std::filesystem::path& directory, uint64_t blocks_per_file) {
    return StaticFileProvider::open({
        .directory = directory,
        .access = StaticFileAccess::kReadOnly,
        .blocks_per_file = blocks_per_file,
    });
}

TEST_CASE("StaticFileProvider empty directory", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{StaticFileProvider::read_write(tmp_dir.path() / "static_files")};
    CHECK(std::filesystem::exists(tmp_dir.path() / "static_files" / "lock"));
    CHECK(provider->blocks_per_file() == kDefaultBlocksPerFile);
    CHECK_FALSE(provider->is_read_only());

    for (const auto segment : kAllSegments) {
        CHECK_FALSE(provider->get_highest_static_file_block(segment));
        CHECK_FALSE(provider->get_lowest_static_file_block(segment));
        CHECK_FALSE(provider->covers_block(segment, 0));
    }
    CHECK_FALSE(provider->get_highest_static_files().max_block_num());
    CHECK(provider->earliest_history_height() == 0);
    CHECK(provider->count_entries(StaticFileSegment::headers) == 0);
    CHECK_FALSE(provider->header_by_number(0));
    CHECK_FALSE(provider->header(Hash{}));
    CHECK_FALSE(provider->transaction_by_id(0));
    CHECK_FALSE(provider->transaction_by_hash(Hash{}));
    CHECK(provider->headers_range({0, 10}).empty());
    CHECK(provider->transaction_hashes_by_range({0, 10}).empty());
    CHECK_THROWS_AS(provider->get_segment_provider_from_block(StaticFileSegment::headers, 0), MissingStaticFileBlock);
    CHECK_THROWS_AS(provider->get_segment_provider_from_transaction(StaticFileSegment::receipts, 0), MissingStaticFileTx);
}

TEST_CASE("StaticFileProvider storage lock", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    {
        const auto provider{StaticFileProvider::read_write(tmp_dir.path())};
        CHECK_THROWS_AS(StaticFileProvider::read_write(tmp_dir.path()), StorageLockError);
        // Read-only instances do not take the lock
        CHECK_NOTHROW(StaticFileProvider::read_only(tmp_dir.path(), /*watch_directory=*/false));
    }
    CHECK_NOTHROW(StaticFileProvider::read_write(tmp_dir.path()));
}

TEST_CASE("StaticFileProvider index", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{open_read_write(tmp_dir.path(), 10)};
    test::write_headers(*provider, 0, 24);
    test::write_blocks(*provider, 0, 14);

    CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 24);
    CHECK(provider->get_lowest_static_file_block(StaticFileSegment::headers) == 9);
    CHECK(provider->get_lowest_range(StaticFileSegment::headers) == SegmentRangeInclusive{0, 9});
    CHECK(provider->get_lowest_transaction_static_file_block() == 9);
    CHECK(provider->covers_block(StaticFileSegment::headers, 24));
    CHECK_FALSE(provider->covers_block(StaticFileSegment::headers, 25));
    CHECK(provider->covers_block(StaticFileSegment::block_meta, 14));
    CHECK_FALSE(provider->covers_block(StaticFileSegment::block_meta, 15));

    const HighestStaticFiles highest{provider->get_highest_static_files()};
    CHECK(highest.headers == 24);
    CHECK(highest.transactions == 14);
    CHECK(highest.receipts == 14);
    CHECK(highest.block_meta == 14);
    CHECK(highest.min_block_num() == 14);
    CHECK(highest.max_block_num() == 24);

    CHECK(provider->count_entries(StaticFileSegment::headers) == 25);
    CHECK(provider->count_entries(StaticFileSegment::transactions) == 30);
    CHECK(provider->count_entries(StaticFileSegment::receipts) == 30);
    CHECK_THROWS_AS(provider->count_entries(StaticFileSegment::block_meta), UnsupportedProvider);

    SECTION("rebuilt from disk") {
        provider->initialize_index();
        CHECK(provider->cached_jars() == 0);
        CHECK(provider->get_highest_static_files().headers == 24);
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::transactions) == 29);
        CHECK(provider->get_segment_ranges_from_transaction(StaticFileSegment::receipts, 25) == SegmentRangeInclusive{10, 19});

        // Idempotent
        provider->initialize_index();
        CHECK(provider->get_highest_static_files().headers == 24);
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::receipts) == 29);
        CHECK(provider->get_lowest_range(StaticFileSegment::transactions) == SegmentRangeInclusive{0, 9});
    }

    SECTION("jar cache") {
        provider->initialize_index();
        CHECK(provider->header_by_number(3));
        CHECK(provider->header_by_number(4));
        CHECK(provider->cached_jars() == 1);
        CHECK(provider->header_by_number(13));
        CHECK(provider->cached_jars() == 2);
        const auto jar{provider->get_segment_provider_from_block(StaticFileSegment::headers, 5)};
        CHECK(jar == provider->get_or_create_jar_provider(StaticFileSegment::headers, {0, 9}));
    }

    SECTION("stats") {
        const auto stats{provider->stats()};
        REQUIRE(stats.size() == kAllSegments.size());
        CHECK(stats[0].segment == StaticFileSegment::headers);
        CHECK(stats[0].jars == 3);
        CHECK(stats[0].rows == 25);
        CHECK(stats[0].offsets_size == 3 * 1 + (25 * 2 + 3) * 8);
        CHECK(stats[0].index_size == 25 * Jar::kIndexEntrySize);
        CHECK(stats[0].total_size() > stats[0].data_size);
        CHECK(stats[1].segment == StaticFileSegment::transactions);
        CHECK(stats[1].jars == 2);
        CHECK(stats[1].rows == 30);
        CHECK(stats[3].rows == 15);
    }

    SECTION("iter_static_files") {
        const auto static_files{iter_static_files(tmp_dir.path())};
        REQUIRE(static_files.contains(StaticFileSegment::headers));
        const auto& headers{static_files.at(StaticFileSegment::headers)};
        REQUIRE(headers.size() == 3);
        CHECK(headers[0].fixed_range == SegmentRangeInclusive{0, 9});
        CHECK(headers[1].fixed_range == SegmentRangeInclusive{10, 19});
        CHECK(headers[2].fixed_range == SegmentRangeInclusive{20, 29});
        CHECK(headers[2].rows == 5);
        CHECK(headers[2].header.block_range() == SegmentRangeInclusive{20, 24});
    }
}

TEST_CASE("StaticFileProvider queries", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    {
        const auto writer_provider{open_read_write(tmp_dir.path(), 10)};
        test::write_headers(*writer_provider, 0, 24);
        test::write_blocks(*writer_provider, 0, 24, test::SampleChain{.txs_per_block = 3});
    }
    // Everything written before the restart is visible to a read-only instance
    const auto provider{open_read_only(tmp_dir.path(), 10)};
    REQUIRE(provider->is_read_only());

    SECTION("headers") {
        const BlockHeader expected{test::sample_header(17)};
        CHECK(provider->header_by_number(17) == expected);
        CHECK(provider->header(expected.hash()) == expected);
        CHECK(provider->block_hash(17) == expected.hash());
        const auto sealed{provider->header_with_hash(17)};
        REQUIRE(sealed);
        CHECK(sealed->hash == expected.hash());
        CHECK_FALSE(provider->header_by_number(25));

        const auto headers{provider->headers_range({5, 30})};
        REQUIRE(headers.size() == 20);
        for (size_t i{0}; i < headers.size(); ++i) {
            CHECK(headers[i].number == 5 + i);
        }
        const auto hashes{provider->canonical_hashes_range({8, 12})};
        REQUIRE(hashes.size() == 4);
        CHECK(hashes[0] == test::sample_header(8).hash());
        CHECK(hashes[3] == test::sample_header(11).hash());
        CHECK(provider->headers_range({30, 40}).empty());
        CHECK(provider->headers_range({10, 10}).empty());
    }

    SECTION("sealed headers while predicate holds") {
        const auto sealed_headers{provider->sealed_headers_while({3, 25}, [](const SealedHeader& sealed) {
            return sealed.header.number < 12;
        })};
        REQUIRE(sealed_headers.size() == 9);
        CHECK(sealed_headers.front().header.number == 3);
        CHECK(sealed_headers.back().header.number == 11);
    }

    SECTION("transactions") {
        const Transaction expected{test::sample_transaction(40)};
        CHECK(provider->transaction_by_id(40) == expected);
        CHECK(provider->transaction_id(expected.hash()) == 40);
        CHECK(provider->transaction_by_hash(expected.hash()) == expected);
        CHECK_FALSE(provider->transaction_by_id(75));
        CHECK_FALSE(provider->transaction_id(test::sample_transaction(75).hash()));

        const auto transactions{provider->transactions_by_tx_range({25, 35})};
        REQUIRE(transactions.size() == 10);
        CHECK(transactions.front() == test::sample_transaction(25));
        CHECK(transactions.back() == test::sample_transaction(34));
    }

    SECTION("receipts") {
        CHECK(provider->receipt(62) == test::sample_receipt(62));
        CHECK(provider->receipt_by_hash(test::sample_transaction(62).hash()) == test::sample_receipt(62));
        CHECK_FALSE(provider->receipt_by_hash(Hash{}));
        const auto receipts{provider->receipts_by_tx_range({0, 100})};
        REQUIRE(receipts.size() == 75);
        CHECK(receipts[74] == test::sample_receipt(74));
    }

    SECTION("block meta") {
        CHECK(provider->block_body_indices(20) == StoredBlockBodyIndices{.first_tx_num = 60, .tx_count = 3});
        const auto indices{provider->block_body_indices_range({8, 12})};
        REQUIRE(indices.size() == 4);
        CHECK(indices[0].first_tx_num == 24);
        CHECK(indices[3].first_tx_num == 33);
    }

    SECTION("transaction hashes computed in parallel") {
        const auto hashes{provider->transaction_hashes_by_range({7, 70})};
        REQUIRE(hashes.size() == 63);
        for (size_t i{0}; i < hashes.size(); ++i) {
            CHECK(hashes[i].second == 7 + i);
            CHECK(hashes[i].first == test::sample_transaction(7 + i).hash());
        }
        // Clamped to the highest transaction
        CHECK(provider->transaction_hashes_by_range({70, 1000}).size() == 5);
        CHECK(provider->transaction_hashes_by_range({75, 1000}).empty());
    }

    SECTION("data held by the database only") {
        CHECK_THROWS_AS(provider->transaction_block(3), UnsupportedProvider);
        CHECK_THROWS_AS(provider->block_number(Hash{}), UnsupportedProvider);
        CHECK_THROWS_AS(provider->transactions_by_block(3), UnsupportedProvider);
        CHECK_THROWS_AS(provider->senders_by_tx_range({0, 3}), UnsupportedProvider);
        CHECK_THROWS_AS(provider->receipts_by_block(3), UnsupportedProvider);
    }

    SECTION("writes refused") {
        CHECK_THROWS_AS(provider->get_writer(25, StaticFileSegment::headers), ReadOnlyStaticFileAccess);
        CHECK_THROWS_AS(provider->latest_writer(StaticFileSegment::receipts), ReadOnlyStaticFileAccess);
        CHECK_THROWS_AS(provider->delete_jar(StaticFileSegment::headers, 24), ReadOnlyStaticFileAccess);
        CHECK_THROWS_AS(provider->delete_transactions_below(20), ReadOnlyStaticFileAccess);
    }
}

TEST_CASE("StaticFileProvider hashing with many small chunks", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{StaticFileProvider::open({
        .directory = tmp_dir.path(),
        .access = StaticFileAccess::kReadWrite,
        .blocks_per_file = 4,
        .hash_workers = 3,
        .hash_chunk_size = 7,
    })};
    test::write_blocks(*provider, 0, 30, test::SampleChain{.txs_per_block = 5});

    const auto hashes{provider->transaction_hashes_by_range({3, 150})};
    REQUIRE(hashes.size() == 147);
    bool all_match{true};
    for (size_t i{0}; i < hashes.size(); ++i) {
        all_match = all_match && hashes[i].second == 3 + i && hashes[i].first == test::sample_transaction(3 + i).hash();
    }
    CHECK(all_match);
}

TEST_CASE("StaticFileProvider static file or database", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{open_read_write(tmp_dir.path(), 10)};
    test::write_headers(*provider, 0, 14);

    const auto from_static_file = [](const StaticFileProvider& p, uint64_t start, uint64_t end, const std::function<bool(const BlockNum&)>& predicate) {
        return p.fetch_range_with_predicate<BlockNum>(
            StaticFileSegment::headers, start, end,
            [](const StaticFileCursor& cursor, uint64_t block_num) -> std::optional<BlockNum> {
                const auto header{cursor.header(block_num)};
                if (!header) return std::nullopt;
                return header->number;
            },
            predicate);
    };
    std::vector<std::pair<uint64_t, uint64_t>> database_calls;
    const auto from_database = [&](uint64_t start, uint64_t end, const std::function<bool(const BlockNum&)>& predicate) {
        database_calls.emplace_back(start, end);
        std::vector<BlockNum> numbers;
        for (BlockNum block_num{start}; block_num < end && predicate(block_num); ++block_num) {
            numbers.push_back(block_num + 1000);
        }
        return numbers;
    };

    SECTION("range split at the highest static block") {
        const auto numbers{provider->get_range_with_static_file_or_database<BlockNum>(
            StaticFileSegment::headers, 10, 20, from_static_file, from_database, [](const BlockNum&) { return true; })};
        REQUIRE(numbers.size() == 10);
        CHECK(numbers[4] == 14);
        CHECK(numbers[5] == 1015);
        REQUIRE(database_calls.size() == 1);
        CHECK(database_calls[0] == std::pair<uint64_t, uint64_t>{15, 20});
    }

    SECTION("database skipped once the predicate stops") {
        const auto numbers{provider->get_range_with_static_file_or_database<BlockNum>(
            StaticFileSegment::headers, 10, 20, from_static_file, from_database, [](const BlockNum& n) { return n < 13; })};
        CHECK(numbers.size() == 3);
        CHECK(database_calls.empty());
    }

    SECTION("single value") {
        const auto from_static = [](const StaticFileProvider& p) -> std::optional<BlockNum> { return p.header_by_number(14)->number; };
        const auto from_db = []() -> std::optional<BlockNum> { return 42; };
        CHECK(provider->get_with_static_file_or_database<BlockNum>(StaticFileSegment::headers, 14, from_static, from_db) == 14);
        CHECK(provider->get_with_static_file_or_database<BlockNum>(StaticFileSegment::headers, 15, from_static, from_db) == 42);
    }
}

TEST_CASE("StaticFileProvider delete_jar", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{open_read_write(tmp_dir.path(), 10)};
    test::write_headers(*provider, 0, 24);
    CHECK(provider->header_by_number(22));
    const auto writer{provider->latest_writer(StaticFileSegment::headers)};
    REQUIRE(writer->data_path() == tmp_dir.path() / "static_file_headers_20_29");

    const SegmentHeader deleted{provider->delete_jar(StaticFileSegment::headers, 22)};
    CHECK(deleted.block_range() == SegmentRangeInclusive{20, 24});
    CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 19);
    CHECK_FALSE(provider->header_by_number(22));
    CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_headers_20_29"));
    CHECK_THROWS_AS(provider->delete_jar(StaticFileSegment::headers, 22), StaticFileError);

    // The writer positioned on the deleted jar is closed and no longer recreates its files
    const BlockHeader next{test::sample_header(25)};
    CHECK_THROWS_AS(writer->append_header(next, next.hash()), StaticFileError);
    CHECK_THROWS_AS(writer->commit(), StaticFileError);
    CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_headers_20_29"));
    CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_headers_20_29.conf"));

    const auto reopened{provider->latest_writer(StaticFileSegment::headers)};
    CHECK(reopened != writer);
    test::write_headers(*provider, 20, 22);
    CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 22);
    CHECK(provider->header_by_number(21) == test::sample_header(21));

    // Deleting a jar below the active one keeps the writer open
    provider->delete_jar(StaticFileSegment::headers, 5);
    CHECK(provider->get_lowest_range(StaticFileSegment::headers) == SegmentRangeInclusive{10, 19});
    CHECK(provider->latest_writer(StaticFileSegment::headers) == reopened);
    CHECK_NOTHROW(reopened->commit());
}

TEST_CASE("StaticFileProvider history expiry", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{StaticFileProvider::read_write(tmp_dir.path())};
    REQUIRE(provider->blocks_per_file() == 500'000);

    // One transaction in the first block of each jar, empty blocks elsewhere
    const auto writer{provider->get_writer(0, StaticFileSegment::transactions)};
    TxNum tx_num{0};
    for (const BlockNum jar_start : {0, 500'000, 1'000'000}) {
        if (jar_start > 0) {
            writer->ensure_at_block(jar_start - 1);
        }
        writer->increment_block(jar_start);
        writer->append_transaction(tx_num, test::sample_transaction(tx_num));
        ++tx_num;
    }
    writer->ensure_at_block(1'000'010);
    writer->commit();
    const auto receipts_writer{provider->get_writer(0, StaticFileSegment::receipts)};
    receipts_writer->ensure_at_block(1'000'010);
    receipts_writer->commit();

    REQUIRE(provider->earliest_history_height() == 0);
    REQUIRE(provider->get_lowest_transaction_static_file_block() == 499'999);

    CHECK(provider->delete_transactions_below(0).empty());
    CHECK(provider->delete_transactions_below(499'999).empty());

    const auto deleted{provider->delete_transactions_below(1'000'000)};
    REQUIRE(deleted.size() == 2);
    CHECK(deleted[0].expected_block_range() == SegmentRangeInclusive{0, 499'999});
    CHECK(deleted[1].expected_block_range() == SegmentRangeInclusive{500'000, 999'999});
    CHECK(provider->earliest_history_height() == 1'000'000);
    CHECK(provider->get_lowest_range(StaticFileSegment::transactions) == SegmentRangeInclusive{1'000'000, 1'000'010});
    CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_transactions_0_499999.conf"));
    CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_transactions_500000_999999.conf"));

    // Data at or above the expiry height is untouched
    CHECK(provider->transaction_by_id(2) == test::sample_transaction(2));
    CHECK(provider->transaction_id(test::sample_transaction(2).hash()) == 2);
    CHECK_FALSE(provider->transaction_by_id(0));
    CHECK(provider->get_highest_static_file_block(StaticFileSegment::transactions) == 1'000'010);
    // Other segments are not expired
    CHECK(provider->get_lowest_range(StaticFileSegment::receipts) == SegmentRangeInclusive{0, 499'999});

    // Nothing left below the new height
    CHECK(provider->delete_transactions_below(1'000'000).empty());

    // An expired transaction resolves to the lowest jar, which does not hold it either
    CHECK_THROWS_AS(provider->transactions_by_tx_range({0, 3}), MissingStaticFileTx);
    CHECK(provider->transactions_by_tx_range({2, 3}) == std::vector<Transaction>{test::sample_transaction(2)});

    // Expiring past the tip removes the jar the writer is on
    const auto tip_deleted{provider->delete_transactions_below(2'000'000)};
    REQUIRE(tip_deleted.size() == 1);
    CHECK(tip_deleted[0].expected_block_range() == SegmentRangeInclusive{1'000'000, 1'499'999});
    CHECK_FALSE(provider->get_lowest_range(StaticFileSegment::transactions));
    CHECK_FALSE(provider->get_highest_static_file_tx(StaticFileSegment::transactions));
    CHECK(provider->earliest_history_height() == 0);
    CHECK(StaticFileProvider::read_only(tmp_dir.path(), /*watch_directory=*/false)->earliest_history_height() == 0);

    CHECK_THROWS_AS(writer->increment_block(1'000'011), StaticFileError);
    CHECK_THROWS_AS(writer->append_transaction(3, test::sample_transaction(3)), StaticFileError);
    CHECK_THROWS_AS(writer->commit(), StaticFileError);
    CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_transactions_1000000_1499999"));
    CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_transactions_1000000_1499999.conf"));
}

TEST_CASE("StaticFileProvider headers across two sessions", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    {
        const auto provider{StaticFileProvider::read_write(tmp_dir.path())};
        test::write_headers(*provider, 0, 599'999);
    }
    {
        const auto provider{StaticFileProvider::read_write(tmp_dir.path())};
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 599'999);
        const auto writer{provider->latest_writer(StaticFileSegment::headers)};
        for (BlockNum block_num{600'000}; block_num <= 999'999; ++block_num) {
            const BlockHeader header{test::sample_header(block_num)};
            writer->append_header(header, header.hash());
        }
        writer->commit();
    }

    const auto provider{StaticFileProvider::read_only(tmp_dir.path(), /*watch_directory=*/false)};
    CHECK(provider->header_by_number(500'000) == test::sample_header(500'000));
    CHECK(provider->header_by_number(999'999) == test::sample_header(999'999));
    CHECK(provider->get_segment_provider_from_block(StaticFileSegment::headers, 499'999) !=
          provider->get_segment_provider_from_block(StaticFileSegment::headers, 500'000));
    CHECK_FALSE(provider->header_by_number(1'000'000));

    const auto headers{provider->headers_range({0, 1'000'000})};
    REQUIRE(headers.size() == 1'000'000);
    bool in_order{true};
    for (size_t i{0}; i < headers.size() && in_order; ++i) {
        in_order = headers[i].number == i;
    }
    CHECK(in_order);
}

TEST_CASE("StaticFileProvider check_consistency", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TempChainData context;
    TemporaryDirectory tmp_dir;
    const auto static_files_dir{tmp_dir.path() / "static_files"};

    SECTION("consistent stores") {
        const auto provider{open_read_write(static_files_dir, 100)};
        test::write_headers(*provider, 0, 120);
        {
            RWTxn txn{context.env()};
            stages::write_stage_progress(txn, stages::kHeadersKey, 120);
            txn.commit(/*renew=*/false);
        }
        ROTxn txn{context.env()};
        CHECK_FALSE(provider->check_consistency(txn, /*has_receipt_pruning=*/false));
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 120);
    }

    SECTION("database ahead of static files") {
        const auto provider{open_read_write(static_files_dir, 100)};
        test::write_headers(*provider, 0, 50);
        {
            RWTxn txn{context.env()};
            for (BlockNum block_num{51}; block_num <= 60; ++block_num) {
                write_header(txn, test::sample_header(block_num));
            }
            stages::write_stage_progress(txn, stages::kHeadersKey, 60);
            txn.commit(/*renew=*/false);
        }
        ROTxn txn{context.env()};
        CHECK_FALSE(provider->check_consistency(txn, false));
    }

    SECTION("gap between static files and database") {
        const auto provider{open_read_write(static_files_dir, 100)};
        test::write_headers(*provider, 0, 100);
        {
            RWTxn txn{context.env()};
            write_header(txn, test::sample_header(150));
            stages::write_stage_progress(txn, stages::kHeadersKey, 150);
            txn.commit(/*renew=*/false);
        }
        ROTxn txn{context.env()};
        CHECK(provider->check_consistency(txn, false) == 100);
    }

    SECTION("checkpoint behind static files") {
        const auto provider{open_read_write(static_files_dir, 100)};
        test::write_headers(*provider, 0, 200);
        {
            RWTxn txn{context.env()};
            stages::write_stage_progress(txn, stages::kHeadersKey, 150);
            txn.commit(/*renew=*/false);
        }
        ROTxn txn{context.env()};
        CHECK_FALSE(provider->check_consistency(txn, false));
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 150);
        CHECK_FALSE(provider->header_by_number(151));
        CHECK(provider->header_by_number(150) == test::sample_header(150));
    }

    SECTION("checkpoint behind static files for transactions") {
        const auto provider{open_read_write(static_files_dir, 10)};
        test::write_blocks(*provider, 0, 19, test::SampleChain{.txs_per_block = 2});
        {
            RWTxn txn{context.env()};
            stages::write_stage_progress(txn, stages::kBlockBodiesKey, 15);
            stages::write_stage_progress(txn, stages::kExecutionKey, 15);
            txn.commit(/*renew=*/false);
        }
        ROTxn txn{context.env()};
        CHECK_FALSE(provider->check_consistency(txn, false));
        const HighestStaticFiles highest{provider->get_highest_static_files()};
        CHECK(highest.transactions == 15);
        CHECK(highest.receipts == 15);
        CHECK(highest.block_meta == 15);
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::transactions) == 31);
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::receipts) == 31);
    }

    SECTION("receipts skipped with receipt pruning") {
        const auto provider{open_read_write(static_files_dir, 10)};
        test::write_blocks(*provider, 0, 19, test::SampleChain{.txs_per_block = 2});
        {
            RWTxn txn{context.env()};
            stages::write_stage_progress(txn, stages::kBlockBodiesKey, 19);
            stages::write_stage_progress(txn, stages::kExecutionKey, 5);
            txn.commit(/*renew=*/false);
        }
        ROTxn txn{context.env()};
        CHECK_FALSE(provider->check_consistency(txn, /*has_receipt_pruning=*/true));
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::receipts) == 19);
    }

    SECTION("checkpoint ahead of static files") {
        const auto provider{open_read_write(static_files_dir, 100)};
        test::write_headers(*provider, 0, 80);
        {
            RWTxn txn{context.env()};
            stages::write_stage_progress(txn, stages::kHeadersKey, 90);
            txn.commit(/*renew=*/false);
        }
        ROTxn txn{context.env()};
        CHECK(provider->check_consistency(txn, false) == 80);
    }

    SECTION("interrupted write") {
        {
            const auto provider{open_read_write(static_files_dir, 100)};
            test::write_headers(*provider, 0, 9);
        }
        // Crash while the data of the last row was being written
        const auto data_path{static_files_dir / filename(StaticFileSegment::headers, {0, 99})};
        truncate_file(data_path, std::filesystem::file_size(data_path) - 3);
        {
            RWTxn txn{context.env()};
            stages::write_stage_progress(txn, stages::kHeadersKey, 9);
            txn.commit(/*renew=*/false);
        }

        SECTION("read-only instance fails") {
            const auto provider{open_read_only(static_files_dir, 100)};
            ROTxn txn{context.env()};
            CHECK_THROWS_AS(provider->check_consistency(txn, false), InconsistentJar);
            CHECK_THROWS_AS(provider->check_segment_consistency(StaticFileSegment::headers), InconsistentJar);
        }

        SECTION("read-write instance heals") {
            const auto provider{open_read_write(static_files_dir, 100)};
            ROTxn txn{context.env()};
            CHECK(provider->check_consistency(txn, false) == 8);
            CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 8);
            CHECK(provider->header_by_number(8) == test::sample_header(8));
            CHECK_FALSE(provider->header_by_number(9));
            CHECK_NOTHROW(provider->check_segment_consistency(StaticFileSegment::headers));

            // The healed writer appends from the last intact row
            test::write_headers(*provider, 9, 12);
            CHECK(provider->header_by_number(12) == test::sample_header(12));
        }
    }
}

}  // namespace strata::db::static_files
