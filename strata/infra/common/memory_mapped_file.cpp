// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_mapped_file.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <sys/mman.h>

#include <gsl/util>

#include "ensure.hpp"
#include "log.hpp"
#include "safe_strerror.hpp"

namespace strata {

MemoryMappedFile::MemoryMappedFile(std::filesystem::path path)
    : path_(std::move(path)) {
    ensure(std::filesystem::exists(path_), [&]() { return "MemoryMappedFile: " + path_.string() + " does not exist"; });
    ensure(std::filesystem::is_regular_file(path_), [&]() { return "MemoryMappedFile: " + path_.string() + " is not regular file"; });

    map_existing();
}

MemoryMappedFile::~MemoryMappedFile() {
    close();
}

void MemoryMappedFile::map_existing() {
    FileDescriptor fd = ::open(path_.c_str(), O_RDONLY);
    if (fd == -1) {
        throw std::runtime_error{"open failed for: " + path_.string() + " error: " + safe_strerror(errno)};
    }
    [[maybe_unused]] auto _ = gsl::finally([fd]() { ::close(fd); });

    const auto size = std::filesystem::file_size(path_);
    if (size == 0) {
        region_ = {};
        return;
    }

    const auto address = ::mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
    if (address == MAP_FAILED) {
        throw std::runtime_error{"mmap failed for: " + path_.string() + " error: " + safe_strerror(errno)};
    }
    region_ = {static_cast<uint8_t*>(address), size};
}

void MemoryMappedFile::close() noexcept {
    if (region_.data() == nullptr) return;

    if (::munmap(region_.data(), region_.size()) == -1) {
        STRATA_ERROR_M("munmap failed", {"path", path_.string(), "error", safe_strerror(errno)});
    }
    region_ = {};
}

void MemoryMappedFile::advise_random() const {
    if (region_.empty()) return;
    // ENOSYS means the kernel ignores the hint, the mapping still works
    if (::madvise(region_.data(), region_.size(), MADV_RANDOM) == -1 && errno != ENOSYS) {
        throw std::runtime_error{"madvise failed for: " + path_.string() + " error: " + safe_strerror(errno)};
    }
}

}  // namespace strata
