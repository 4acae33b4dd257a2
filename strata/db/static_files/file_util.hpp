// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>

#include <strata/core/common/bytes.hpp>

namespace strata::db::static_files {

//! \brief Reads the whole file content
Bytes read_file(const std::filesystem::path& path);

//! \brief Reads size bytes at offset, throwing if the file is shorter
Bytes read_file_at(const std::filesystem::path& path, uint64_t offset, size_t size);

//! \brief Writes data at offset (creating the file if needed), truncates the file right after it and fsyncs
void write_file_at(const std::filesystem::path& path, uint64_t offset, ByteView data);

//! \brief Replaces the file content atomically: write to a temporary sibling, fsync, rename, fsync the directory
void write_file_atomically(const std::filesystem::path& path, ByteView data);

//! \brief Shrinks the file to the given size and fsyncs it
void truncate_file(const std::filesystem::path& path, uint64_t size);

}  // namespace strata::db::static_files
