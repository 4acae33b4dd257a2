// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic concepts, types, and constants.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include <intx/intx.hpp>

#include <strata/core/common/assert.hpp>

namespace strata {

using namespace std::string_view_literals;

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256>;

using BlockNum = uint64_t;
inline constexpr BlockNum kMaxBlockNum = std::numeric_limits<BlockNum>::max();

//! Sequential number of a transaction across the whole chain
using TxNum = uint64_t;
inline constexpr TxNum kMaxTxNum = std::numeric_limits<TxNum>::max();

struct BlockNumRange {
    BlockNum start;
    BlockNum end;
    BlockNumRange(BlockNum start1, BlockNum end1) : start(start1), end(end1) {}
    friend bool operator==(const BlockNumRange&, const BlockNumRange&) = default;
    bool contains(BlockNum block_num) const { return (start <= block_num) && (block_num < end); }
    BlockNum size() const { return end > start ? end - start : 0; }
    std::string to_string() const { return std::string("[") + std::to_string(start) + ", " + std::to_string(end) + ")"; }
};

struct TxNumRange {
    TxNum start;
    TxNum end;
    TxNumRange(TxNum start1, TxNum end1) : start(start1), end(end1) {}
    friend bool operator==(const TxNumRange&, const TxNumRange&) = default;
    bool contains(TxNum num) const { return (start <= num) && (num < end); }
    TxNum size() const { return end > start ? end - start : 0; }
    std::string to_string() const { return std::string("[") + std::to_string(start) + ", " + std::to_string(end) + ")"; }
};

inline constexpr size_t kAddressLength{20};
inline constexpr size_t kHashLength{32};

// https://en.wikipedia.org/wiki/Binary_prefix
inline constexpr uint64_t kKibi{1024};
inline constexpr uint64_t kMebi{1024 * kKibi};
inline constexpr uint64_t kGibi{1024 * kMebi};
inline constexpr uint64_t kTebi{1024 * kGibi};

consteval uint64_t operator"" _Kibi(unsigned long long x) {
    STRATA_ASSERT(x <= std::numeric_limits<uint64_t>::max() / kKibi);
    return x * kKibi;
}

consteval uint64_t operator"" _Mebi(unsigned long long x) {
    STRATA_ASSERT(x <= std::numeric_limits<uint64_t>::max() / kMebi);
    return x * kMebi;
}

consteval uint64_t operator"" _Gibi(unsigned long long x) {
    STRATA_ASSERT(x <= std::numeric_limits<uint64_t>::max() / kGibi);
    return x * kGibi;
}

consteval uint64_t operator"" _Tebi(unsigned long long x) {
    STRATA_ASSERT(x <= std::numeric_limits<uint64_t>::max() / kTebi);
    return x * kTebi;
}

}  // namespace strata
