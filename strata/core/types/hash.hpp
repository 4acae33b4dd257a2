// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstring>
#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <strata/core/common/assert.hpp>
#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/util.hpp>

namespace strata {

class Hash : public evmc::bytes32 {
  public:
    using evmc::bytes32::bytes32;

    Hash() = default;
    explicit Hash(ByteView bv) {
        STRATA_ASSERT(bv.size() == size());
        std::memcpy(bytes, bv.data(), size());
    }

    static constexpr size_t size() { return sizeof(evmc::bytes32); }

    std::string to_hex() const { return strata::to_hex(ByteView{bytes}); }
    static std::optional<Hash> from_hex(std::string_view hex) {
        const auto bytes{strata::from_hex(hex)};
        if (!bytes || bytes->size() != size()) {
            return std::nullopt;
        }
        return Hash{ByteView{*bytes}};
    }

    //! \brief Keccak-256 digest of the given data
    static Hash keccak(ByteView data) {
        const ethash::hash256 digest{keccak256(data)};
        return Hash{ByteView{digest.bytes}};
    }

    // conversion to ByteView
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    operator ByteView() const { return ByteView{bytes}; }

    static_assert(sizeof(evmc::bytes32) == 32);
};

}  // namespace strata

namespace std {

template <>
struct hash<strata::Hash> : public std::hash<evmc::bytes32>  // to use Hash with std::unordered_set/map
{};

}  // namespace std
