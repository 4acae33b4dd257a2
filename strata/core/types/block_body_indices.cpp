// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_body_indices.hpp"

#include <strata/core/common/endian.hpp>

namespace strata {

Bytes StoredBlockBodyIndices::encode() const {
    Bytes out(kEncodedSize, '\0');
    endian::store_big_u64(out.data(), first_tx_num);
    endian::store_big_u64(out.data() + sizeof(uint64_t), tx_count);
    return out;
}

DecodingResult StoredBlockBodyIndices::decode(ByteView& from, StoredBlockBodyIndices& to) noexcept {
    if (from.size() < kEncodedSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    if (from.size() > kEncodedSize) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    to.first_tx_num = endian::load_big_u64(from.data());
    to.tx_count = endian::load_big_u64(from.data() + sizeof(uint64_t));
    from.remove_prefix(kEncodedSize);
    return {};
}

}  // namespace strata
