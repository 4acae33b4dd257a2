// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "temp_chain_data.hpp"

#include <strata/db/kv/tables.hpp>

namespace strata::db::test_util {

TempChainData::TempChainData(bool with_create_tables)
    : chaindata_env_config_{
          .path = (tmp_dir_.path() / "chaindata").string(),
          .create = true,
          .readonly = false,
          .exclusive = true,
          .in_memory = true,
      } {
    env_ = std::make_unique<mdbx::env_managed>(open_env(chaindata_env_config_));
    if (with_create_tables) {
        RWTxn txn{*env_};
        table::check_or_create_chaindata_tables(txn);
        txn.commit(/*renew=*/false);
    }
}

TempChainData::~TempChainData() {
    env_.reset();
}

}  // namespace strata::db::test_util
