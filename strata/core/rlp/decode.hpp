// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// RLP decoding functions as per
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/

#pragma once

#include <cstring>
#include <span>

#include <intx/intx.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/decoding_result.hpp>
#include <strata/core/common/endian.hpp>
#include <strata/core/rlp/encode.hpp>

namespace strata::rlp {

//! Whether bytes may follow the decoded item. When prohibited, trailing bytes yield DecodingError::kInputTooLong
enum class Leftover {
    kProhibit,
    kAllow,
};

//! \brief Consumes an RLP header. A single byte in [0x00, 0x7f] is its own payload and is not consumed
tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept;

//! \brief Consumes a list header and checks the list spans exactly the remaining input when leftover is prohibited
tl::expected<Header, DecodingError> decode_list_header(ByteView& from, Leftover mode = Leftover::kProhibit) noexcept;

//! \brief Consumes a string item and returns a view of its payload
tl::expected<ByteView, DecodingError> decode_string_payload(ByteView& from, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode = Leftover::kProhibit) noexcept;

template <UnsignedIntegral T>
DecodingResult decode(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    const auto payload{decode_string_payload(from, mode)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    return endian::from_big_compact(*payload, to);
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode = Leftover::kProhibit) noexcept;

template <size_t N>
DecodingResult decode(ByteView& from, std::span<uint8_t, N> to, Leftover mode = Leftover::kProhibit) noexcept {
    static_assert(N != std::dynamic_extent);
    const auto payload{decode_string_payload(from, mode)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (payload->size() != N) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    std::memcpy(to.data(), payload->data(), N);
    return {};
}

template <size_t N>
DecodingResult decode(ByteView& from, uint8_t (&to)[N], Leftover mode = Leftover::kProhibit) noexcept {
    return decode<N>(from, std::span<uint8_t, N>{to}, mode);
}

}  // namespace strata::rlp
