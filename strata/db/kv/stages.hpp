// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <strata/core/common/base.hpp>
#include <strata/db/kv/mdbx.hpp>

/*
List of stages keys stored into SyncStage table
*/

namespace strata::db::stages {

//! \brief Headers are downloaded, their Proof-Of-Work validity and chaining is verified
inline constexpr const char* kHeadersKey{"Headers"};

//! \brief Block bodies are downloaded and partially verified
inline constexpr const char* kBlockBodiesKey{"Bodies"};

//! \brief Executing each block w/o building the trie
inline constexpr const char* kExecutionKey{"Execution"};

inline constexpr const char* kAllStages[]{
    kHeadersKey,
    kBlockBodiesKey,
    kExecutionKey,
};

//! \brief Reads from db the progress (block height) of the provided stage
//! \param [in] txn : a reference to a ro/rw db transaction
//! \param [in] stage_name : the name of the requested stage (must be known see kAllStages[])
//! \return The actual chain height (BlockNum) the stage has reached, zero if never recorded
BlockNum read_stage_progress(ROTxn& txn, const char* stage_name);

//! \brief Writes into db the progress (block height) for the provided stage
void write_stage_progress(RWTxn& txn, const char* stage_name, BlockNum block_num);

//! \brief Whether the provided stage name is known
bool is_known_stage(const char* name);

}  // namespace strata::db::stages
