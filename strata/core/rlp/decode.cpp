// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

namespace strata::rlp {

namespace {

    //! Prefix byte ranges
    constexpr uint8_t kShortStringMax{0xB7};
    constexpr uint8_t kLongStringMax{0xBF};
    constexpr uint8_t kShortListMax{0xF7};

    //! Reads a big-endian payload length of len_of_len bytes, rejecting lengths that fit the short form
    tl::expected<size_t, DecodingError> read_long_length(ByteView& from, size_t len_of_len) noexcept {
        if (from.size() < len_of_len) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        uint64_t len{0};
        if (DecodingResult res{endian::from_big_compact(from.substr(0, len_of_len), len)}; !res) {
            return tl::unexpected{res.error()};
        }
        from.remove_prefix(len_of_len);
        if (len < 56) {
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
        return static_cast<size_t>(len);
    }

}  // namespace

tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    const uint8_t prefix{from[0]};
    if (prefix < kEmptyStringCode) {
        return Header{.list = false, .payload_length = 1};
    }
    from.remove_prefix(1);

    Header h{.list = prefix >= kEmptyListCode};
    if (prefix <= kShortStringMax) {
        h.payload_length = prefix - kEmptyStringCode;
        // a single byte below 0x80 must be encoded as itself
        if (h.payload_length == 1 && !from.empty() && from[0] < kEmptyStringCode) {
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
    } else if (prefix <= kLongStringMax) {
        const auto len{read_long_length(from, prefix - kShortStringMax)};
        if (!len) return tl::unexpected{len.error()};
        h.payload_length = *len;
    } else if (prefix <= kShortListMax) {
        h.payload_length = prefix - kEmptyListCode;
    } else {
        const auto len{read_long_length(from, prefix - kShortListMax)};
        if (!len) return tl::unexpected{len.error()};
        h.payload_length = *len;
    }

    if (from.size() < h.payload_length) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return h;
}

tl::expected<Header, DecodingError> decode_list_header(ByteView& from, Leftover mode) noexcept {
    const auto h{decode_header(from)};
    if (!h) {
        return h;
    }
    if (!h->list) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    if (mode == Leftover::kProhibit && from.size() != h->payload_length) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return h;
}

tl::expected<ByteView, DecodingError> decode_string_payload(ByteView& from, Leftover mode) noexcept {
    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    if (h->list) {
        return tl::unexpected{DecodingError::kUnexpectedList};
    }
    const ByteView payload{from.substr(0, h->payload_length)};
    from.remove_prefix(h->payload_length);
    if (mode == Leftover::kProhibit && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return payload;
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode) noexcept {
    const auto payload{decode_string_payload(from, mode)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    to = *payload;
    return {};
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode) noexcept {
    uint64_t i{0};
    if (DecodingResult res{decode(from, i, mode)}; !res) {
        return res;
    }
    if (i > 1) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    to = i == 1;
    return {};
}

}  // namespace strata::rlp
