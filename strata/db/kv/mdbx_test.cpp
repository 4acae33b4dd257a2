// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx.hpp"

#include <fstream>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <strata/db/kv/tables.hpp>
#include <strata/db/test_util/temp_chain_data.hpp>
#include <strata/infra/common/directories.hpp>

namespace strata::db {

TEST_CASE("open_env", "[strata][db][kv]") {
    TemporaryDirectory tmp_dir;
    const auto db_path{(tmp_dir.path() / "chaindata").string()};

    SECTION("empty path") {
        CHECK_THROWS_AS(open_env(EnvConfig{}), std::invalid_argument);
    }

    SECTION("missing data file without create") {
        CHECK_THROWS_AS(open_env(EnvConfig{.path = db_path}), std::runtime_error);
    }

    SECTION("create conflicts with readonly") {
        CHECK_THROWS_AS(open_env(EnvConfig{.path = db_path, .create = true, .readonly = true}), std::runtime_error);
    }

    SECTION("path is a regular file") {
        std::ofstream{tmp_dir.path() / "plain"}.put('x');
        const EnvConfig config{.path = (tmp_dir.path() / "plain").string(), .create = true};
        CHECK_THROWS_AS(open_env(config), std::runtime_error);
    }

    SECTION("create then reopen read-only") {
        {
            auto env{open_env(EnvConfig{.path = db_path, .create = true, .in_memory = true})};
            RWTxn txn{env};
            CHECK_FALSE(has_map(*txn, table::kHeadersName));
            (void)open_map(*txn, table::kHeaders);
            CHECK(has_map(*txn, table::kHeadersName));
            txn.commit(/*renew=*/false);
        }
        auto env{open_env(EnvConfig{.path = db_path, .readonly = true, .in_memory = true})};
        ROTxn txn{env};
        CHECK(has_map(*txn, table::kHeadersName));
        CHECK_FALSE(has_map(*txn, "Missing"));
    }
}

TEST_CASE("RWTxn commit renews", "[strata][db][kv]") {
    test_util::TempChainData context{/*with_create_tables=*/false};
    {
        RWTxn txn{context.env()};
        (void)open_map(*txn, table::kHeaders);
        txn.commit();
        CHECK_FALSE(txn->is_readonly());
        (void)open_map(*txn, table::kReceipts);
        txn.commit(/*renew=*/false);
    }
    ROTxn reader{context.env()};
    CHECK(has_map(*reader, table::kHeadersName));
    CHECK(has_map(*reader, table::kReceiptsName));
    CHECK_FALSE(has_map(*reader, table::kTransactionsName));
}

}  // namespace strata::db
