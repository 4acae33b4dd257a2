// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wimplicit-fallthrough"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wshadow"
#include <mdbx.h++>
#pragma GCC diagnostic pop

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>

namespace strata::db {

inline constexpr std::string_view kDbDataFileName{"mdbx.dat"};

//! \brief Read-only transaction, the parameter type of every operation that only reads chain data
class ROTxn {
  public:
    explicit ROTxn(mdbx::env& env) : managed_txn_{env.start_read()} {}
    virtual ~ROTxn() = default;

    ROTxn(const ROTxn&) = delete;
    ROTxn& operator=(const ROTxn&) = delete;
    ROTxn(ROTxn&& source) noexcept = default;

    mdbx::txn& operator*() { return managed_txn_; }
    mdbx::txn* operator->() { return &managed_txn_; }

  protected:
    explicit ROTxn(mdbx::txn_managed&& source) : managed_txn_{std::move(source)} {}

    mdbx::txn_managed managed_txn_;
};

//! \brief Read-write transaction
class RWTxn : public ROTxn {
  public:
    explicit RWTxn(mdbx::env& env) : ROTxn{env.start_write()} {}
    RWTxn(RWTxn&& source) noexcept = default;

    //! \brief Commits pending changes and, when renew is set, continues in a fresh write transaction
    void commit(bool renew = true) {
        mdbx::env env{managed_txn_.env()};
        managed_txn_.commit();
        if (renew) {
            managed_txn_ = env.start_write();
        }
    }
};

struct EnvConfig {
    //! Directory holding the data file
    std::string path{};
    //! Create the data file when missing, otherwise it must exist
    bool create{false};
    bool readonly{false};
    bool exclusive{false};
    //! Small geometry and no meta sync, for tests
    bool in_memory{false};
    size_t max_size{3_Tebi};
    size_t growth_size{2_Gibi};
    uint32_t max_tables{32};
    uint32_t max_readers{100};
};

//! \brief Name and collation of a key-value table
struct MapConfig {
    const char* name{nullptr};
    const ::mdbx::key_mode key_mode{::mdbx::key_mode::usual};
    const ::mdbx::value_mode value_mode{::mdbx::value_mode::single};
};

//! \brief Opens the environment in config.path
//! \throws std::invalid_argument on an empty path, std::runtime_error on a missing data file or conflicting flags
::mdbx::env_managed open_env(const EnvConfig& config);

//! \brief Opens a table, creating it first when the transaction is read-write
::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config);

::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config);

//! \brief Whether a table with the given name exists in the main database
bool has_map(::mdbx::txn& tx, const char* map_name);

inline mdbx::slice to_slice(ByteView value) { return {value.data(), value.length()}; }

inline ByteView from_slice(const mdbx::slice slice) {
    return {static_cast<const uint8_t*>(slice.data()), slice.length()};
}

}  // namespace strata::db
