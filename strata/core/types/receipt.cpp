// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <strata/core/rlp/encode.hpp>

namespace strata::rlp {

static Header log_header(const Log& log) {
    Header h{.list = true};
    h.payload_length += kAddressLength + 1;
    h.payload_length += length_with_header(log.topics.size() * (kHashLength + 1));
    h.payload_length += length(ByteView{log.data});
    return h;
}

size_t length(const Log& log) {
    return length_with_header(log_header(log).payload_length);
}

void encode(Bytes& to, const Log& log) {
    encode_header(to, log_header(log));
    encode(to, ByteView{log.address.bytes});
    encode_header(to, {.list = true, .payload_length = log.topics.size() * (kHashLength + 1)});
    for (const Hash& topic : log.topics) {
        encode(to, ByteView{topic.bytes});
    }
    encode(to, ByteView{log.data});
}

DecodingResult decode(ByteView& from, Log& to, Leftover mode) noexcept {
    const auto h{decode_list_header(from, mode)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    const uint64_t leftover{from.size() - h->payload_length};

    if (DecodingResult res{decode(from, to.address.bytes, Leftover::kAllow)}; !res) {
        return res;
    }

    const auto topics_head{decode_list_header(from, Leftover::kAllow)};
    if (!topics_head) {
        return tl::unexpected{topics_head.error()};
    }
    const uint64_t topics_leftover{from.size() - topics_head->payload_length};
    to.topics.clear();
    while (from.size() > topics_leftover) {
        Hash topic;
        if (DecodingResult res{decode(from, topic.bytes, Leftover::kAllow)}; !res) {
            return res;
        }
        to.topics.push_back(topic);
    }
    if (from.size() != topics_leftover) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }

    if (DecodingResult res{decode(from, to.data, Leftover::kAllow)}; !res) {
        return res;
    }
    if (from.size() != leftover) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    return {};
}

static size_t logs_payload_length(const std::vector<Log>& logs) {
    size_t len{0};
    for (const Log& log : logs) {
        len += length(log);
    }
    return len;
}

static Header receipt_header(const Receipt& receipt) {
    Header h{.list = true};
    h.payload_length += length(static_cast<uint8_t>(receipt.type));
    h.payload_length += length(receipt.success);
    h.payload_length += length(receipt.cumulative_gas_used);
    h.payload_length += length_with_header(logs_payload_length(receipt.logs));
    return h;
}

size_t length(const Receipt& receipt) {
    return length_with_header(receipt_header(receipt).payload_length);
}

void encode(Bytes& to, const Receipt& receipt) {
    encode_header(to, receipt_header(receipt));
    encode(to, static_cast<uint8_t>(receipt.type));
    encode(to, receipt.success);
    encode(to, receipt.cumulative_gas_used);
    encode_header(to, {.list = true, .payload_length = logs_payload_length(receipt.logs)});
    for (const Log& log : receipt.logs) {
        encode(to, log);
    }
}

DecodingResult decode(ByteView& from, Receipt& to, Leftover mode) noexcept {
    const auto h{decode_list_header(from, mode)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    const uint64_t leftover{from.size() - h->payload_length};

    uint8_t type{0};
    if (DecodingResult res{decode(from, type, Leftover::kAllow)}; !res) {
        return res;
    }
    if (type != static_cast<uint8_t>(TransactionType::kLegacy) &&
        type != static_cast<uint8_t>(TransactionType::kDynamicFee)) {
        return tl::unexpected{DecodingError::kUnsupportedTransactionType};
    }
    to.type = static_cast<TransactionType>(type);

    if (DecodingResult res{decode(from, to.success, Leftover::kAllow)}; !res) {
        return res;
    }
    if (DecodingResult res{decode(from, to.cumulative_gas_used, Leftover::kAllow)}; !res) {
        return res;
    }

    const auto logs_head{decode_list_header(from, Leftover::kAllow)};
    if (!logs_head) {
        return tl::unexpected{logs_head.error()};
    }
    const uint64_t logs_leftover{from.size() - logs_head->payload_length};
    to.logs.clear();
    while (from.size() > logs_leftover) {
        Log log;
        if (DecodingResult res{decode(from, log, Leftover::kAllow)}; !res) {
            return res;
        }
        to.logs.push_back(std::move(log));
    }

    if (from.size() != leftover || logs_leftover != leftover) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    return {};
}

}  // namespace strata::rlp
