// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

namespace strata::rlp {

namespace {
    //! Payloads shorter than this carry their length inside the prefix byte
    constexpr uint64_t kShortPayloadLimit{56};

    //! Single bytes below kEmptyStringCode are their own encoding
    bool is_self_encoded(ByteView s) noexcept { return s.size() == 1 && s[0] < kEmptyStringCode; }
}  // namespace

void encode_header(Bytes& to, Header header) {
    const uint8_t base{header.list ? kEmptyListCode : kEmptyStringCode};
    if (header.payload_length < kShortPayloadLimit) {
        to.push_back(static_cast<uint8_t>(base + header.payload_length));
        return;
    }
    // long form: prefix encodes the byte count of the big-endian length that follows
    const ByteView length_be{endian::to_big_compact(header.payload_length)};
    to.push_back(static_cast<uint8_t>(base + kShortPayloadLimit - 1 + length_be.size()));
    to.append(length_be);
}

size_t length_of_length(uint64_t payload_length) noexcept {
    return payload_length < kShortPayloadLimit ? 1 : 1 + intx::count_significant_bytes(payload_length);
}

void encode(Bytes& to, bool x) {
    to.push_back(x ? uint8_t{0x01} : kEmptyStringCode);
}

void encode(Bytes& to, ByteView s) {
    if (!is_self_encoded(s)) {
        encode_header(to, {.list = false, .payload_length = s.size()});
    }
    to.append(s);
}

size_t length(ByteView s) noexcept {
    return is_self_encoded(s) ? 1 : length_with_header(s.size());
}

}  // namespace strata::rlp
