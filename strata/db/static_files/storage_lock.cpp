// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "storage_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include <strata/db/static_files/errors.hpp>
#include <strata/infra/common/log.hpp>
#include <strata/infra/common/safe_strerror.hpp>

namespace strata::db::static_files {

StorageLock::StorageLock(const std::filesystem::path& directory) : path_{directory / kLockFileName} {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw StorageLockError{"cannot open lock file " + path_.string() + ": " + safe_strerror(errno)};
    }
    // flock locks belong to the open file description, so a second provider in this process is refused too
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        const int error{errno};
        ::close(fd_);
        if (error == EWOULDBLOCK) {
            throw StorageLockError{"static files directory already locked by another read-write instance: " + path_.string()};
        }
        throw StorageLockError{"cannot lock " + path_.string() + ": " + safe_strerror(error)};
    }

    const std::string pid{std::to_string(::getpid())};
    if (::ftruncate(fd_, 0) != 0 || ::pwrite(fd_, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
        const int error{errno};
        ::close(fd_);
        throw StorageLockError{"cannot write owner to " + path_.string() + ": " + safe_strerror(error)};
    }
    STRATA_DEBUG_M("Storage lock acquired", {"path", path_.string(), "pid", pid});
}

StorageLock::~StorageLock() {
    if (fd_ < 0) return;
    if (::flock(fd_, LOCK_UN) != 0) {
        STRATA_ERROR_M("Cannot release storage lock", {"path", path_.string(), "error", safe_strerror(errno)});
    }
    ::close(fd_);
}

}  // namespace strata::db::static_files
