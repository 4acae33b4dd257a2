// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <utility>

namespace strata {

using FileDescriptor = int;

using MemoryMappedRegion = std::span<uint8_t>;

//! \brief Read-only memory mapping of a whole file
//! \remarks An empty file is accepted and yields an empty region without any mapping
class MemoryMappedFile {
  public:
    explicit MemoryMappedFile(std::filesystem::path path);
    ~MemoryMappedFile();

    // Not copyable
    MemoryMappedFile(const MemoryMappedFile&) = delete;
    MemoryMappedFile& operator=(const MemoryMappedFile&) = delete;

    // Only movable
    MemoryMappedFile(MemoryMappedFile&& other) noexcept
        : path_{std::move(other.path_)},
          region_{std::exchange(other.region_, {})} {}

    MemoryMappedFile& operator=(MemoryMappedFile&& other) noexcept {
        if (this != &other) {
            close();
            path_ = std::move(other.path_);
            region_ = std::exchange(other.region_, {});
        }
        return *this;
    }

    const std::filesystem::path& path() const {
        return path_;
    }

    MemoryMappedRegion region() const {
        return region_;
    }

    size_t size() const {
        return region_.size();
    }

    //! \brief Hints the kernel that pages are accessed in random order, disabling read-ahead
    void advise_random() const;

  private:
    void map_existing();
    void close() noexcept;

    //! The path to the file
    std::filesystem::path path_;

    //! The area mapped in memory
    MemoryMappedRegion region_;
};

}  // namespace strata
