// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace strata::db::static_files {

//! \brief Exclusive advisory lock on <directory>/lock held by a read-write provider
//! \details The lock file records the pid of the owner, the lock is released on destruction
class StorageLock {
  public:
    static constexpr const char* kLockFileName{"lock"};

    //! \throws StorageLockError if another process or provider holds the lock
    explicit StorageLock(const std::filesystem::path& directory);
    ~StorageLock();

    StorageLock(const StorageLock&) = delete;
    StorageLock& operator=(const StorageLock&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
    int fd_{-1};
};

}  // namespace strata::db::static_files
