// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <thread>

#include <strata/db/static_files/segment.hpp>

namespace strata::db::static_files {

enum class StaticFileAccess {
    kReadOnly,
    kReadWrite,
};

struct StaticFileSettings {
    std::filesystem::path directory;
    StaticFileAccess access{StaticFileAccess::kReadOnly};
    uint64_t blocks_per_file{kDefaultBlocksPerFile};
    bool watch_directory{false};                                       // read-only instances only
    std::chrono::milliseconds watch_poll_interval{500};                // max wait between stop checks
    unsigned hash_workers{std::thread::hardware_concurrency()};        // threads computing tx hashes
    uint64_t hash_chunk_size{100};                                     // txs per hashing task
};

}  // namespace strata::db::static_files
