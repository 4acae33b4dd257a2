// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "writer.hpp"

#include <filesystem>

#include <catch2/catch_test_macros.hpp>

#include <strata/db/static_files/errors.hpp>
#include <strata/db/static_files/provider.hpp>
#include <strata/db/static_files/test_util/sample_data.hpp>
#include <strata/infra/common/directories.hpp>
#include <strata/infra/test_util/log.hpp>

namespace strata::db::static_files {

namespace test = test_util;
using strata::test_util::SetLogVerbosityGuard;

static std::shared_ptr<StaticFileProvider> open_provider(const std::filesystem::path& directory, uint64_t blocks_per_file) {
    return StaticFileProvider::open({
        .directory = directory,
        .access = StaticFileAccess::kReadWrite,
        .blocks_per_file = blocks_per_file,
    });
}

TEST_CASE("StaticFileWriter one writer per segment", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{open_provider(tmp_dir.path(), 10)};

    const auto headers_writer{provider->get_writer(0, StaticFileSegment::headers)};
    CHECK(provider->get_writer(7, StaticFileSegment::headers) == headers_writer);
    CHECK(provider->latest_writer(StaticFileSegment::headers) == headers_writer);

    const auto transactions_writer{provider->get_writer(0, StaticFileSegment::transactions)};
    const auto receipts_writer{provider->latest_writer(StaticFileSegment::receipts)};
    CHECK(transactions_writer != headers_writer);
    CHECK(receipts_writer != transactions_writer);
    CHECK(receipts_writer != headers_writer);
    CHECK(provider->get_writer(3, StaticFileSegment::transactions) == transactions_writer);
    CHECK(transactions_writer->segment() == StaticFileSegment::transactions);
    CHECK(receipts_writer->segment() == StaticFileSegment::receipts);
}

TEST_CASE("StaticFileWriter headers", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{open_provider(tmp_dir.path(), 10)};
    const auto writer{provider->get_writer(0, StaticFileSegment::headers)};
    CHECK(writer->segment() == StaticFileSegment::headers);
    CHECK(writer->data_path() == tmp_dir.path() / "static_file_headers_0_9");

    SECTION("appends are visible after commit") {
        for (BlockNum block_num{0}; block_num < 5; ++block_num) {
            const BlockHeader header{test::sample_header(block_num)};
            writer->append_header(header, header.hash());
        }
        CHECK_FALSE(provider->get_highest_static_file_block(StaticFileSegment::headers));
        writer->commit();
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 4);
        CHECK(provider->header_by_number(4) == test::sample_header(4));
        CHECK(writer->user_header().block_range() == SegmentRangeInclusive{0, 4});
    }

    SECTION("rotation to the next jar") {
        test::write_headers(*provider, 0, 24);
        CHECK(writer->data_path() == tmp_dir.path() / "static_file_headers_20_29");
        CHECK(writer->user_header().block_range() == SegmentRangeInclusive{20, 24});
        CHECK(std::filesystem::exists(tmp_dir.path() / "static_file_headers_0_9.conf"));
        CHECK(std::filesystem::exists(tmp_dir.path() / "static_file_headers_10_19.conf"));
        CHECK(Jar::load(tmp_dir.path() / "static_file_headers_10_19").user_header().block_range() == SegmentRangeInclusive{10, 19});
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 24);
        for (BlockNum block_num : {0, 9, 10, 19, 20, 24}) {
            CHECK(provider->header_by_number(block_num) == test::sample_header(block_num));
        }
    }

    SECTION("block numbers must be contiguous") {
        const BlockHeader first{test::sample_header(0)};
        writer->append_header(first, first.hash());
        const BlockHeader gap{test::sample_header(2)};
        CHECK_THROWS_AS(writer->append_header(gap, gap.hash()), UnexpectedStaticFileBlockNumber);
        CHECK_THROWS_AS(writer->append_header(first, first.hash()), UnexpectedStaticFileBlockNumber);
    }

    SECTION("wrong segment operations") {
        CHECK_THROWS_AS(writer->append_transaction(0, test::sample_transaction(0)), std::logic_error);
        CHECK_THROWS_AS(writer->increment_block(0), std::logic_error);
        CHECK_THROWS_AS(writer->prune_receipts(1, 0), std::logic_error);
    }

    SECTION("prune within the jar") {
        test::write_headers(*provider, 0, 7);
        writer->prune_headers(3);
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 4);
        CHECK_FALSE(provider->header_by_number(5));
        CHECK_FALSE(provider->header(test::sample_header(6).hash()));

        // Pruned numbers can be written again
        test::write_headers(*provider, 5, 6);
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 6);
        CHECK(provider->header(test::sample_header(6).hash()) == test::sample_header(6));
    }

    SECTION("prune across jars") {
        test::write_headers(*provider, 0, 24);
        writer->prune_headers(12);
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::headers) == 12);
        CHECK(writer->data_path() == tmp_dir.path() / "static_file_headers_10_19");
        CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_headers_20_29.conf"));
        CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_headers_20_29"));
        CHECK_FALSE(provider->header_by_number(13));
        CHECK(provider->header_by_number(12) == test::sample_header(12));

        SECTION("everything") {
            writer->prune_headers(13);
            CHECK_FALSE(provider->get_highest_static_file_block(StaticFileSegment::headers));
            CHECK(writer->data_path() == tmp_dir.path() / "static_file_headers_0_9");
            CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_headers_10_19.conf"));
            CHECK_FALSE(writer->user_header().block_range());
        }
    }
}

TEST_CASE("StaticFileWriter transactions", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{open_provider(tmp_dir.path(), 10)};
    const test::SampleChain chain{.txs_per_block = 2};

    SECTION("transaction numbers must be contiguous") {
        const auto writer{provider->get_writer(0, StaticFileSegment::transactions)};
        writer->increment_block(0);
        writer->append_transaction(0, test::sample_transaction(0));
        CHECK_THROWS_AS(writer->append_transaction(2, test::sample_transaction(2)), UnexpectedStaticFileTxNumber);
        CHECK_THROWS_AS(writer->increment_block(2), UnexpectedStaticFileBlockNumber);
    }

    SECTION("index of transaction ranges") {
        test::write_blocks(*provider, 0, 24, chain);
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::transactions) == 24);
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::transactions) == 49);
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::receipts) == 49);
        CHECK(provider->get_segment_ranges_from_transaction(StaticFileSegment::transactions, 0) == SegmentRangeInclusive{0, 9});
        CHECK(provider->get_segment_ranges_from_transaction(StaticFileSegment::transactions, 19) == SegmentRangeInclusive{0, 9});
        CHECK(provider->get_segment_ranges_from_transaction(StaticFileSegment::transactions, 20) == SegmentRangeInclusive{10, 19});
        CHECK(provider->get_segment_ranges_from_transaction(StaticFileSegment::transactions, 49) == SegmentRangeInclusive{20, 29});
        CHECK_FALSE(provider->get_segment_ranges_from_transaction(StaticFileSegment::transactions, 50));
    }

    SECTION("empty blocks") {
        const auto writer{provider->get_writer(0, StaticFileSegment::transactions)};
        writer->ensure_at_block(12);
        writer->commit();
        CHECK(writer->user_header().block_range() == SegmentRangeInclusive{10, 12});
        CHECK_FALSE(writer->user_header().tx_range());
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::transactions) == 12);
        CHECK_FALSE(provider->get_highest_static_file_tx(StaticFileSegment::transactions));

        // Already there
        writer->ensure_at_block(12);
        CHECK(writer->user_header().block_range() == SegmentRangeInclusive{10, 12});

        writer->increment_block(13);
        writer->append_transaction(0, test::sample_transaction(0));
        writer->commit();
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::transactions) == 0);
        CHECK(provider->transaction_by_id(0) == test::sample_transaction(0));
    }

    SECTION("prune transactions within the jar") {
        test::write_blocks(*provider, 0, 24, chain);
        const auto writer{provider->get_writer(24, StaticFileSegment::transactions)};
        // Unwind to block 22: transactions 46..49 go away
        writer->prune_transactions(4, 22);
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::transactions) == 22);
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::transactions) == 45);
        CHECK_FALSE(provider->transaction_by_id(46));
        CHECK_FALSE(provider->transaction_id(test::sample_transaction(47).hash()));
        CHECK(writer->user_header().tx_range() == SegmentRangeInclusive{40, 45});
    }

    SECTION("prune transactions across jars") {
        test::write_blocks(*provider, 0, 24, chain);
        const auto writer{provider->get_writer(24, StaticFileSegment::receipts)};
        // Unwind to block 8: receipts 18..49 go away with the jar of blocks 20..29
        writer->prune_receipts(32, 8);
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::receipts) == 8);
        CHECK(provider->get_highest_static_file_tx(StaticFileSegment::receipts) == 17);
        CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_receipts_20_29.conf"));
        CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_receipts_10_19.conf"));
        CHECK(provider->receipt(17) == test::sample_receipt(17));
        CHECK_FALSE(provider->receipt(18));
        CHECK(writer->user_header().block_range() == SegmentRangeInclusive{0, 8});
    }

    SECTION("unwind of empty blocks across jars") {
        const auto writer{provider->get_writer(0, StaticFileSegment::transactions)};
        writer->ensure_at_block(25);
        writer->commit();
        writer->prune_transactions(0, 5);
        CHECK(provider->get_highest_static_file_block(StaticFileSegment::transactions) == 5);
        CHECK(writer->data_path() == tmp_dir.path() / "static_file_transactions_0_9");
        CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "static_file_transactions_20_29.conf"));
    }
}

TEST_CASE("StaticFileWriter block meta", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto provider{open_provider(tmp_dir.path(), 10)};
    const auto writer{provider->get_writer(0, StaticFileSegment::block_meta)};

    const StoredBlockBodyIndices indices{.first_tx_num = 0, .tx_count = 3};
    writer->append_block_body_indices(0, indices);
    CHECK_THROWS_AS(writer->append_block_body_indices(2, indices), UnexpectedStaticFileBlockNumber);
    CHECK_THROWS_AS(writer->ensure_at_block(5), std::logic_error);
    writer->commit();
    CHECK(provider->block_body_indices(0) == indices);

    writer->prune_block_meta(1);
    CHECK_FALSE(provider->block_body_indices(0));
    CHECK_FALSE(provider->get_highest_static_file_block(StaticFileSegment::block_meta));
}

TEST_CASE("StaticFileWriter restart", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    {
        const auto provider{open_provider(tmp_dir.path(), 10)};
        test::write_headers(*provider, 0, 14);
    }
    const auto provider{open_provider(tmp_dir.path(), 10)};
    const auto writer{provider->latest_writer(StaticFileSegment::headers)};
    CHECK(writer->data_path() == tmp_dir.path() / "static_file_headers_10_19");
    CHECK(writer->user_header().block_range() == SegmentRangeInclusive{10, 14});

    const BlockHeader header{test::sample_header(15)};
    writer->append_header(header, header.hash());
    writer->commit();
    CHECK(provider->header(header.hash()) == header);
    CHECK(provider->header_by_number(14) == test::sample_header(14));
}

}  // namespace strata::db::static_files
