// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment.hpp"

#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <magic_enum.hpp>

#include <strata/core/common/endian.hpp>
#include <strata/infra/common/decoding_exception.hpp>
#include <strata/infra/common/ensure.hpp>

namespace strata::db::static_files {

std::string_view to_string(StaticFileSegment segment) {
    return magic_enum::enum_name(segment);
}

std::optional<StaticFileSegment> segment_from_string(std::string_view name) {
    const auto segment{magic_enum::enum_cast<StaticFileSegment>(name)};
    if (!segment) {
        return std::nullopt;
    }
    return *segment;
}

std::string SegmentRangeInclusive::to_string() const {
    return absl::StrFormat("[%d, %d]", start, end);
}

SegmentRangeInclusive find_fixed_range(BlockNum block, uint64_t blocks_per_file) {
    ensure(blocks_per_file > 0, "find_fixed_range: blocks_per_file must be positive");
    const BlockNum start{block - block % blocks_per_file};
    return {start, start + blocks_per_file - 1};
}

std::optional<BlockNum> SegmentHeader::block_start() const {
    return block_range_ ? std::make_optional(block_range_->start) : std::nullopt;
}

std::optional<BlockNum> SegmentHeader::block_end() const {
    return block_range_ ? std::make_optional(block_range_->end) : std::nullopt;
}

std::optional<TxNum> SegmentHeader::tx_start() const {
    return tx_range_ ? std::make_optional(tx_range_->start) : std::nullopt;
}

std::optional<TxNum> SegmentHeader::tx_end() const {
    return tx_range_ ? std::make_optional(tx_range_->end) : std::nullopt;
}

std::optional<uint64_t> SegmentHeader::block_len() const {
    return block_range_ ? std::make_optional(block_range_->size()) : std::nullopt;
}

std::optional<uint64_t> SegmentHeader::tx_len() const {
    return tx_range_ ? std::make_optional(tx_range_->size()) : std::nullopt;
}

uint64_t SegmentHeader::expected_rows() const {
    return (is_block_based(segment_) ? block_len() : tx_len()).value_or(0);
}

void SegmentHeader::increment_block() {
    if (block_range_) {
        ++block_range_->end;
    } else {
        block_range_ = SegmentRangeInclusive{expected_block_range_.start, expected_block_range_.start};
    }
}

void SegmentHeader::increment_tx() {
    if (!is_tx_based(segment_)) return;
    if (tx_range_) {
        ++tx_range_->end;
    } else {
        tx_range_ = SegmentRangeInclusive{0, 0};
    }
}

void SegmentHeader::prune(uint64_t n) {
    auto& range{is_block_based(segment_) ? block_range_ : tx_range_};
    if (!range) return;
    if (n > range->end - range->start) {
        range.reset();
    } else {
        range->end -= n;
    }
}

void SegmentHeader::set_block_range(BlockNum start, BlockNum end) {
    block_range_ = SegmentRangeInclusive{start, end};
}

void SegmentHeader::set_tx_range(TxNum start, TxNum end) {
    tx_range_ = SegmentRangeInclusive{start, end};
}

static constexpr uint8_t kHasBlockRange{0b01};
static constexpr uint8_t kHasTxRange{0b10};

Bytes SegmentHeader::encode() const {
    Bytes out(kEncodedSize, '\0');
    uint8_t* p{out.data()};
    *p++ = static_cast<uint8_t>(segment_);
    endian::store_big_u64(p, expected_block_range_.start);
    endian::store_big_u64(p + 8, expected_block_range_.end);
    p += 16;
    *p++ = static_cast<uint8_t>((block_range_ ? kHasBlockRange : 0) | (tx_range_ ? kHasTxRange : 0));
    const SegmentRangeInclusive block_range{block_range_.value_or(SegmentRangeInclusive{})};
    const SegmentRangeInclusive tx_range{tx_range_.value_or(SegmentRangeInclusive{})};
    endian::store_big_u64(p, block_range.start);
    endian::store_big_u64(p + 8, block_range.end);
    endian::store_big_u64(p + 16, tx_range.start);
    endian::store_big_u64(p + 24, tx_range.end);
    return out;
}

SegmentHeader SegmentHeader::decode(ByteView data) {
    if (data.size() < kEncodedSize) {
        throw DecodingException{DecodingError::kInputTooShort, "SegmentHeader: too short"};
    }
    if (data.size() > kEncodedSize) {
        throw DecodingException{DecodingError::kInputTooLong, "SegmentHeader: too long"};
    }
    const uint8_t* p{data.data()};
    const auto segment{magic_enum::enum_cast<StaticFileSegment>(*p++)};
    if (!segment) {
        throw DecodingException{DecodingError::kUnexpectedLength, "SegmentHeader: unknown segment"};
    }
    const SegmentRangeInclusive expected{endian::load_big_u64(p), endian::load_big_u64(p + 8)};
    p += 16;
    const uint8_t flags{*p++};
    if ((flags & ~(kHasBlockRange | kHasTxRange)) != 0) {
        throw DecodingException{DecodingError::kInvalidFieldset, "SegmentHeader: unknown flags"};
    }
    std::optional<SegmentRangeInclusive> block_range;
    if (flags & kHasBlockRange) {
        block_range = SegmentRangeInclusive{endian::load_big_u64(p), endian::load_big_u64(p + 8)};
    }
    std::optional<SegmentRangeInclusive> tx_range;
    if (flags & kHasTxRange) {
        tx_range = SegmentRangeInclusive{endian::load_big_u64(p + 16), endian::load_big_u64(p + 24)};
    }
    return SegmentHeader{expected, block_range, tx_range, *segment};
}

std::string filename(StaticFileSegment segment, const SegmentRangeInclusive& range) {
    return absl::StrFormat("%s%s_%d_%d", kFileNamePrefix, to_string(segment), range.start, range.end);
}

std::optional<std::pair<StaticFileSegment, SegmentRangeInclusive>> parse_filename(std::string_view name) {
    if (!name.starts_with(kFileNamePrefix)) {
        return std::nullopt;
    }
    name.remove_prefix(kFileNamePrefix.size());

    std::vector<std::string_view> tokens = absl::StrSplit(name, '_');
    if (tokens.size() < 3) {
        return std::nullopt;
    }
    uint64_t start{0}, end{0};
    if (!absl::SimpleAtoi(tokens[tokens.size() - 2], &start) || !absl::SimpleAtoi(tokens.back(), &end)) {
        return std::nullopt;
    }
    if (start > end) {
        return std::nullopt;
    }
    tokens.resize(tokens.size() - 2);
    const auto segment{segment_from_string(absl::StrJoin(tokens, "_"))};
    if (!segment) {
        return std::nullopt;
    }
    return std::make_pair(*segment, SegmentRangeInclusive{start, end});
}

}  // namespace strata::db::static_files
