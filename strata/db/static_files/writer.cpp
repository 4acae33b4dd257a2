// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "writer.hpp"

#include <array>

#include <strata/core/rlp/encode.hpp>
#include <strata/db/static_files/errors.hpp>
#include <strata/db/static_files/provider.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>

namespace strata::db::static_files {

StaticFileWriter::StaticFileWriter(std::weak_ptr<StaticFileProvider> provider, StaticFileSegment segment, BlockNum block_num)
    : provider_{std::move(provider)}, segment_{segment} {
    writer_.emplace(open_jar(block_num));
    ensure_end_range_consistency();
}

std::shared_ptr<StaticFileProvider> StaticFileWriter::provider() const {
    auto provider{provider_.lock()};
    if (!provider) {
        throw StaticFileError{"static file provider released while " + std::string{to_string(segment_)} + " writer alive"};
    }
    return provider;
}

JarWriter StaticFileWriter::open_jar(BlockNum block_num) const {
    const auto provider{this->provider()};
    const SegmentRangeInclusive range{provider->find_fixed_range(block_num)};
    const auto data_path{provider->directory() / filename(segment_, range)};
    if (provider->covers_block(segment_, range.start)) {
        return JarWriter::open(data_path);
    }
    return JarWriter::create(data_path, SegmentHeader{range, std::nullopt, std::nullopt, segment_});
}

SegmentHeader StaticFileWriter::user_header() const {
    std::scoped_lock lock{mutex_};
    ensure_open();
    return writer_->user_header();
}

std::filesystem::path StaticFileWriter::data_path() const {
    std::scoped_lock lock{mutex_};
    ensure_open();
    return writer_->jar().data_path();
}

void StaticFileWriter::ensure_open() const {
    if (!writer_) {
        throw StaticFileError{"static file writer of " + std::string{to_string(segment_)} + " is closed"};
    }
}

void StaticFileWriter::ensure_segment(StaticFileSegment expected) const {
    ensure(segment_ == expected, [&]() {
        return "StaticFileWriter: " + std::string{to_string(expected)} + " operation on " + std::string{to_string(segment_)} + " writer";
    });
}

void StaticFileWriter::ensure_end_range_consistency() {
    // Rows lost by healing must not be referenced by the header ranges
    const uint64_t expected_rows{writer_->user_header().expected_rows()};
    const uint64_t actual_rows{writer_->rows()};
    if (expected_rows > actual_rows) {
        const uint64_t pruned_rows{expected_rows - actual_rows};
        STRATA_WARN_M("Static file header ahead of rows",
                      {"segment", std::string{to_string(segment_)},
                       "expected_rows", std::to_string(expected_rows),
                       "rows", std::to_string(actual_rows)});
        writer_->user_header().prune(pruned_rows);
        do_commit();
    }
}

void StaticFileWriter::check_next_block_number(BlockNum expected_block_num) const {
    const SegmentHeader& header{writer_->user_header()};
    const BlockNum next_block_num{header.block_end() ? *header.block_end() + 1 : header.expected_block_start()};
    if (expected_block_num != next_block_num) {
        throw UnexpectedStaticFileBlockNumber{segment_, expected_block_num, next_block_num};
    }
}

void StaticFileWriter::do_increment_block(BlockNum expected_block_num) {
    check_next_block_number(expected_block_num);

    const SegmentHeader& header{writer_->user_header()};
    if (header.block_end() && *header.block_end() == header.expected_block_end()) {
        const BlockNum next_block_num{*header.block_end() + 1};
        do_commit();

        writer_.emplace(open_jar(next_block_num));
        writer_->user_header() = SegmentHeader{provider()->find_fixed_range(next_block_num), std::nullopt, std::nullopt, segment_};
        STRATA_DEBUG_M("Static file rotated",
                       {"segment", std::string{to_string(segment_)},
                        "file", writer_->jar().data_path().filename().string()});
    }
    writer_->user_header().increment_block();
}

void StaticFileWriter::increment_block(BlockNum expected_block_num) {
    ensure(is_tx_based(segment_), "StaticFileWriter: increment_block is for tx-based segments");
    std::scoped_lock lock{mutex_};
    ensure_open();
    do_increment_block(expected_block_num);
}

void StaticFileWriter::ensure_at_block(BlockNum advance_to) {
    ensure(is_tx_based(segment_), "StaticFileWriter: ensure_at_block is for tx-based segments");
    std::scoped_lock lock{mutex_};
    ensure_open();
    const auto block_end{writer_->user_header().block_end()};
    BlockNum current_block_num{0};
    if (block_end) {
        current_block_num = *block_end;
    } else {
        current_block_num = writer_->user_header().expected_block_start();
        do_increment_block(current_block_num);
    }
    for (BlockNum block_num{current_block_num + 1}; block_num <= advance_to; ++block_num) {
        do_increment_block(block_num);
    }
}

void StaticFileWriter::append_header(const BlockHeader& header, const Hash& hash) {
    ensure_segment(StaticFileSegment::headers);
    std::scoped_lock lock{mutex_};
    ensure_open();
    do_increment_block(header.number);

    Bytes encoded;
    rlp::encode(encoded, header);
    const std::array<ByteView, 2> columns{encoded, hash};
    writer_->append_row(columns, hash);
}

void StaticFileWriter::append_block_body_indices(BlockNum block_num, const StoredBlockBodyIndices& indices) {
    ensure_segment(StaticFileSegment::block_meta);
    std::scoped_lock lock{mutex_};
    ensure_open();
    do_increment_block(block_num);

    const Bytes encoded{indices.encode()};
    const std::array<ByteView, 1> columns{encoded};
    writer_->append_row(columns);
}

void StaticFileWriter::append_transaction(TxNum tx_num, const Transaction& transaction) {
    ensure_segment(StaticFileSegment::transactions);
    std::scoped_lock lock{mutex_};
    ensure_open();

    Bytes encoded;
    rlp::encode(encoded, transaction);
    const std::array<ByteView, 1> columns{encoded};
    append_with_tx_number(tx_num, columns, transaction.hash());
}

void StaticFileWriter::append_receipt(TxNum tx_num, const Receipt& receipt) {
    ensure_segment(StaticFileSegment::receipts);
    std::scoped_lock lock{mutex_};
    ensure_open();

    Bytes encoded;
    rlp::encode(encoded, receipt);
    const std::array<ByteView, 1> columns{encoded};
    append_with_tx_number(tx_num, columns, std::nullopt);
}

void StaticFileWriter::append_with_tx_number(TxNum tx_num, std::span<const ByteView> columns, const std::optional<Hash>& key) {
    SegmentHeader& header{writer_->user_header()};
    if (header.tx_range()) {
        const TxNum next_tx_num{*header.tx_end() + 1};
        if (tx_num != next_tx_num) {
            throw UnexpectedStaticFileTxNumber{segment_, tx_num, next_tx_num};
        }
        header.increment_tx();
    } else {
        header.set_tx_range(tx_num, tx_num);
    }
    writer_->append_row(columns, key);
}

void StaticFileWriter::prune_headers(uint64_t to_delete) {
    ensure_segment(StaticFileSegment::headers);
    std::scoped_lock lock{mutex_};
    ensure_open();
    truncate(to_delete, std::nullopt);
}

void StaticFileWriter::prune_block_meta(uint64_t to_delete) {
    ensure_segment(StaticFileSegment::block_meta);
    std::scoped_lock lock{mutex_};
    ensure_open();
    truncate(to_delete, std::nullopt);
}

void StaticFileWriter::prune_transactions(uint64_t to_delete, BlockNum last_block) {
    ensure_segment(StaticFileSegment::transactions);
    std::scoped_lock lock{mutex_};
    ensure_open();
    truncate(to_delete, last_block);
}

void StaticFileWriter::prune_receipts(uint64_t to_delete, BlockNum last_block) {
    ensure_segment(StaticFileSegment::receipts);
    std::scoped_lock lock{mutex_};
    ensure_open();
    truncate(to_delete, last_block);
}

void StaticFileWriter::truncate(uint64_t num_rows, std::optional<BlockNum> last_block) {
    STRATA_INFO_M("Pruning static file",
                  {"segment", std::string{to_string(segment_)},
                   "rows", std::to_string(num_rows),
                   "last_block", last_block ? std::to_string(*last_block) : "none"});

    uint64_t remaining_rows{num_rows};
    while (remaining_rows > 0) {
        SegmentHeader& header{writer_->user_header()};
        const uint64_t len{header.expected_rows()};
        if (remaining_rows >= len) {
            // A whole trailing jar goes away unless it is the first one or, for tx-based segments,
            // it still holds blocks up to last_block with no transactions
            const BlockNum block_start{header.expected_block_start()};
            if (block_start != 0 && (is_block_based(segment_) || (last_block && *last_block < block_start))) {
                delete_current_and_open_previous();
            } else {
                header.prune(len);
                writer_->prune_rows(len);
                break;
            }
            remaining_rows -= len;
        } else {
            header.prune(remaining_rows);
            writer_->prune_rows(remaining_rows);
            remaining_rows = 0;
        }
    }

    if (last_block) {
        BlockNum expected_block_start{writer_->user_header().expected_block_start()};
        if (num_rows == 0) {
            // Unwinding a chain of empty blocks across jars, last_block is the only reference
            while (*last_block < expected_block_start) {
                delete_current_and_open_previous();
                expected_block_start = writer_->user_header().expected_block_start();
            }
        }
        writer_->user_header().set_block_range(expected_block_start, *last_block);
    }

    do_commit();
}

void StaticFileWriter::delete_current_and_open_previous() {
    const Jar current{writer_->jar()};
    const BlockNum expected_block_start{current.user_header().expected_block_start()};
    ensure_invariant(expected_block_start > 0, [&]() {
        return "cannot open static file before " + current.data_path().filename().string();
    });

    writer_.emplace(open_jar(expected_block_start - 1));
    current.delete_files();
    STRATA_INFO_M("Static file deleted while pruning",
                  {"segment", std::string{to_string(segment_)},
                   "file", current.data_path().filename().string()});
}

void StaticFileWriter::commit() {
    std::scoped_lock lock{mutex_};
    ensure_open();
    do_commit();
}

void StaticFileWriter::close() {
    std::scoped_lock lock{mutex_};
    writer_.reset();
}

void StaticFileWriter::do_commit() {
    writer_->commit();
    update_index();
}

void StaticFileWriter::update_index() const {
    const SegmentHeader& header{writer_->user_header()};
    std::optional<BlockNum> segment_max_block;
    if (header.block_end()) {
        segment_max_block = header.block_end();
    } else if (header.expected_block_start() > 0) {
        segment_max_block = header.expected_block_start() - 1;
    }
    provider()->update_index(segment_, segment_max_block);
}

}  // namespace strata::db::static_files
