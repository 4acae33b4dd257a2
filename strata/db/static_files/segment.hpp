// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>

namespace strata::db::static_files {

//! Kinds of chain history data stored in static files
enum class StaticFileSegment : uint8_t {
    headers,
    transactions,
    receipts,
    block_meta,
};

inline constexpr std::array<StaticFileSegment, 4> kAllSegments{
    StaticFileSegment::headers,
    StaticFileSegment::transactions,
    StaticFileSegment::receipts,
    StaticFileSegment::block_meta,
};

std::string_view to_string(StaticFileSegment segment);
std::optional<StaticFileSegment> segment_from_string(std::string_view name);

//! \brief Whether rows of the segment are numbered by block (headers, block_meta)
constexpr bool is_block_based(StaticFileSegment segment) {
    return segment == StaticFileSegment::headers || segment == StaticFileSegment::block_meta;
}

//! \brief Whether rows of the segment are numbered by transaction (transactions, receipts)
constexpr bool is_tx_based(StaticFileSegment segment) {
    return !is_block_based(segment);
}

//! \brief Number of columns of each row in the segment
constexpr size_t columns_of(StaticFileSegment segment) {
    return segment == StaticFileSegment::headers ? 2 : 1;
}

//! Column selection masks, one bit per column
using ColumnMask = uint8_t;

inline constexpr ColumnMask kHeaderMask{0b01};
inline constexpr ColumnMask kBlockHashMask{0b10};
inline constexpr ColumnMask kHeaderWithHashMask{0b11};
inline constexpr ColumnMask kTransactionMask{0b01};
inline constexpr ColumnMask kReceiptMask{0b01};
inline constexpr ColumnMask kBlockBodyIndicesMask{0b01};

inline constexpr uint64_t kDefaultBlocksPerFile{500'000};

//! \brief Closed interval [start, end] of block or transaction numbers
struct SegmentRangeInclusive {
    uint64_t start{0};
    uint64_t end{0};

    [[nodiscard]] uint64_t size() const { return end - start + 1; }
    [[nodiscard]] bool contains(uint64_t number) const { return start <= number && number <= end; }

    std::string to_string() const;

    friend bool operator==(const SegmentRangeInclusive&, const SegmentRangeInclusive&) = default;
};

//! \brief The blocks_per_file aligned range containing the given block
SegmentRangeInclusive find_fixed_range(BlockNum block, uint64_t blocks_per_file);

//! \brief Segment metadata stored in the configuration of each jar
class SegmentHeader {
  public:
    static constexpr size_t kEncodedSize{1 + 2 * 8 + 1 + 4 * 8};

    SegmentHeader(SegmentRangeInclusive expected_block_range,
                  std::optional<SegmentRangeInclusive> block_range,
                  std::optional<SegmentRangeInclusive> tx_range,
                  StaticFileSegment segment)
        : expected_block_range_{expected_block_range},
          block_range_{block_range},
          tx_range_{tx_range},
          segment_{segment} {}

    [[nodiscard]] StaticFileSegment segment() const { return segment_; }
    [[nodiscard]] const SegmentRangeInclusive& expected_block_range() const { return expected_block_range_; }
    [[nodiscard]] const std::optional<SegmentRangeInclusive>& block_range() const { return block_range_; }
    [[nodiscard]] const std::optional<SegmentRangeInclusive>& tx_range() const { return tx_range_; }

    [[nodiscard]] BlockNum expected_block_start() const { return expected_block_range_.start; }
    [[nodiscard]] BlockNum expected_block_end() const { return expected_block_range_.end; }

    [[nodiscard]] std::optional<BlockNum> block_start() const;
    [[nodiscard]] std::optional<BlockNum> block_end() const;
    [[nodiscard]] std::optional<TxNum> tx_start() const;
    [[nodiscard]] std::optional<TxNum> tx_end() const;

    //! \brief Number of blocks held, nullopt when none
    [[nodiscard]] std::optional<uint64_t> block_len() const;
    //! \brief Number of transactions held, nullopt when none
    [[nodiscard]] std::optional<uint64_t> tx_len() const;

    //! \brief Number of rows the jar is expected to hold given the ranges
    [[nodiscard]] uint64_t expected_rows() const;

    //! \brief Extends the block range by one block, starting it at the expected start if empty
    void increment_block();

    //! \brief Extends the transaction range by one, tx-based segments only
    void increment_tx();

    //! \brief Removes the last n entries (blocks for block-based segments, txs otherwise)
    void prune(uint64_t n);

    void set_block_range(BlockNum start, BlockNum end);
    void set_tx_range(TxNum start, TxNum end);

    Bytes encode() const;

    //! \brief Decodes an encoded header, throwing DecodingException on malformed input
    static SegmentHeader decode(ByteView data);

    friend bool operator==(const SegmentHeader&, const SegmentHeader&) = default;

  private:
    SegmentRangeInclusive expected_block_range_;
    std::optional<SegmentRangeInclusive> block_range_;
    std::optional<SegmentRangeInclusive> tx_range_;
    StaticFileSegment segment_;
};

inline constexpr std::string_view kFileNamePrefix{"static_file_"};

//! \brief Name of the data file for the segment range, e.g. static_file_headers_0_499999
std::string filename(StaticFileSegment segment, const SegmentRangeInclusive& range);

//! \brief Parses a data file name (without extension) into segment and range, nullopt for foreign names
std::optional<std::pair<StaticFileSegment, SegmentRangeInclusive>> parse_filename(std::string_view name);

}  // namespace strata::db::static_files
