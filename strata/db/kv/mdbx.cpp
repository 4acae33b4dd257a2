// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx.hpp"

#include <stdexcept>

#include <strata/core/common/util.hpp>

namespace strata::db {

namespace fs = std::filesystem;

//! Ensures the environment directory exists and returns the size of its data file, zero if absent
static size_t prepare_data_dir(const fs::path& dir) {
    if (!fs::exists(dir)) {
        fs::create_directories(dir);
    } else if (!fs::is_directory(dir)) {
        throw std::runtime_error("Path " + dir.string() + " is not a directory");
    }
    const fs::path data_file{dir / kDbDataFileName};
    return fs::exists(data_file) ? fs::file_size(data_file) : 0;
}

static MDBX_env_flags_t env_flags(const EnvConfig& config) {
    uint32_t flags{MDBX_NOTLS | MDBX_NORDAHEAD | MDBX_COALESCE | MDBX_SYNC_DURABLE};
    if (config.readonly) flags |= MDBX_RDONLY;
    if (config.in_memory) flags |= MDBX_NOMETASYNC;
    if (config.exclusive) flags |= MDBX_EXCLUSIVE;
    return static_cast<MDBX_env_flags_t>(flags);
}

::mdbx::env_managed open_env(const EnvConfig& config) {
    if (config.path.empty()) {
        throw std::invalid_argument("open_env: empty database path");
    }
    if (config.create && config.readonly) {
        throw std::runtime_error("open_env: create conflicts with readonly");
    }

    const fs::path dir{config.path};
    const size_t data_file_size{prepare_data_dir(dir)};
    if (data_file_size == 0 && !config.create) {
        throw std::runtime_error("Unable to locate " + (dir / kDbDataFileName).string() + ", which is required to exist");
    }
    // mapping a file larger than the map size would fail deep inside mdbx
    if (data_file_size > config.max_size) {
        throw std::runtime_error("Database map size is too small. Min required " + human_size(data_file_size));
    }

    ::mdbx::env_managed::create_parameters create_params{};
    create_params.geometry.make_dynamic(::mdbx::env::geometry::default_value,
                                        static_cast<intptr_t>(config.in_memory ? 128_Mebi : config.max_size));
    create_params.geometry.growth_step = static_cast<intptr_t>(config.in_memory ? 2_Mebi : config.growth_size);
    create_params.geometry.pagesize = 4_Kibi;

    const MDBX_env_flags_t flags{env_flags(config)};
    ::mdbx::env::operate_parameters operate_params{};
    operate_params.mode = operate_params.mode_from_flags(flags);
    operate_params.options = operate_params.options_from_flags(flags);
    operate_params.durability = operate_params.durability_from_flags(flags);
    operate_params.max_maps = config.max_tables;
    operate_params.max_readers = config.max_readers;

    return ::mdbx::env_managed{dir.native(), create_params, operate_params};
}

::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config) {
    return tx.is_readonly() ? tx.open_map(config.name, config.key_mode, config.value_mode)
                            : tx.create_map(config.name, config.key_mode, config.value_mode);
}

::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config) {
    return tx.open_cursor(open_map(tx, config));
}

bool has_map(::mdbx::txn& tx, const char* map_name) {
    // named tables are keys of the main database, handle 1
    auto main_cursor{tx.open_cursor(::mdbx::map_handle{1})};
    return main_cursor.seek(::mdbx::slice{map_name});
}

}  // namespace strata::db
