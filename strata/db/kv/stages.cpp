// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stages.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

#include <strata/core/common/endian.hpp>
#include <strata/db/kv/tables.hpp>

namespace strata::db::stages {

BlockNum read_stage_progress(ROTxn& txn, const char* stage_name) {
    if (!is_known_stage(stage_name)) {
        throw std::invalid_argument("Unknown stage name " + std::string(stage_name));
    }
    if (!has_map(*txn, table::kSyncStageProgress.name)) {
        return 0;
    }

    try {
        auto src{open_cursor(*txn, table::kSyncStageProgress)};
        auto data{src.find(mdbx::slice(stage_name), /*throw_notfound=*/false)};
        if (!data) {
            return 0;
        }
        if (data.value.size() != sizeof(uint64_t)) {
            throw std::length_error("Expected 8 bytes of data got " + std::to_string(data.value.size()));
        }
        return endian::load_big_u64(static_cast<const uint8_t*>(data.value.data()));
    } catch (const mdbx::exception& ex) {
        throw std::runtime_error("Error in " + std::string(__FUNCTION__) + " " + std::string(ex.what()));
    }
}

void write_stage_progress(RWTxn& txn, const char* stage_name, BlockNum block_num) {
    if (!is_known_stage(stage_name)) {
        throw std::invalid_argument("Unknown stage name " + std::string(stage_name));
    }

    try {
        Bytes stage_progress(sizeof(block_num), 0);
        endian::store_big_u64(stage_progress.data(), block_num);
        auto target{open_cursor(*txn, table::kSyncStageProgress)};
        target.upsert(mdbx::slice(stage_name), to_slice(stage_progress));
    } catch (const mdbx::exception& ex) {
        throw std::runtime_error("Error in " + std::string(__FUNCTION__) + " " + std::string(ex.what()));
    }
}

bool is_known_stage(const char* name) {
    if (name == nullptr) {
        return false;
    }
    for (const char* stage : kAllStages) {
        if (std::strcmp(stage, name) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace strata::db::stages
