// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <strata/db/kv/mdbx.hpp>
#include <strata/infra/common/directories.hpp>

namespace strata::db::test_util {

//! \brief TempChainData is a helper resource manager for a temporary directory plus a chain database.
//! Upon construction, it creates the database and all the chain data tables.
//! \remarks TempChainData follows the RAII idiom and cleans up its temporary directory upon destruction.
class TempChainData {
  public:
    explicit TempChainData(bool with_create_tables = true);
    ~TempChainData();

    // Not copyable nor movable
    TempChainData(const TempChainData&) = delete;
    TempChainData& operator=(const TempChainData&) = delete;

    const std::filesystem::path& path() const { return tmp_dir_.path(); }

    const EnvConfig& chaindata_env_config() const { return chaindata_env_config_; }

    mdbx::env& env() const { return *env_; }

  private:
    TemporaryDirectory tmp_dir_;
    EnvConfig chaindata_env_config_;
    std::unique_ptr<mdbx::env_managed> env_;
};

}  // namespace strata::db::test_util
