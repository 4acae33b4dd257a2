// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "file_util.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <gsl/narrow>
#include <gsl/util>

#include <strata/infra/common/directories.hpp>
#include <strata/infra/common/safe_strerror.hpp>

namespace strata::db::static_files {

[[noreturn]] static void throw_io_error(const char* operation, const std::filesystem::path& path) {
    throw std::runtime_error{std::string{operation} + " failed for: " + path.string() + " error: " + safe_strerror(errno)};
}

static int open_or_throw(const std::filesystem::path& path, int flags) {
    const int fd = ::open(path.c_str(), flags, 0644);
    if (fd == -1) {
        throw_io_error("open", path);
    }
    return fd;
}

static void fsync_or_throw(int fd, const std::filesystem::path& path) {
    if (::fsync(fd) == -1) {
        throw_io_error("fsync", path);
    }
}

static void pwrite_all(int fd, ByteView data, uint64_t offset, const std::filesystem::path& path) {
    while (!data.empty()) {
        const ssize_t written = ::pwrite(fd, data.data(), data.size(), gsl::narrow<off_t>(offset));
        if (written == -1) {
            if (errno == EINTR) continue;
            throw_io_error("pwrite", path);
        }
        data.remove_prefix(static_cast<size_t>(written));
        offset += static_cast<uint64_t>(written);
    }
}

Bytes read_file(const std::filesystem::path& path) {
    return read_file_at(path, 0, std::filesystem::file_size(path));
}

Bytes read_file_at(const std::filesystem::path& path, uint64_t offset, size_t size) {
    const int fd = open_or_throw(path, O_RDONLY);
    [[maybe_unused]] auto _ = gsl::finally([fd]() { ::close(fd); });

    Bytes data(size, '\0');
    size_t total{0};
    while (total < size) {
        const ssize_t count = ::pread(fd, data.data() + total, size - total, gsl::narrow<off_t>(offset + total));
        if (count == -1) {
            if (errno == EINTR) continue;
            throw_io_error("pread", path);
        }
        if (count == 0) {
            throw std::runtime_error{"unexpected end of file: " + path.string()};
        }
        total += static_cast<size_t>(count);
    }
    return data;
}

void write_file_at(const std::filesystem::path& path, uint64_t offset, ByteView data) {
    const int fd = open_or_throw(path, O_WRONLY | O_CREAT);
    [[maybe_unused]] auto _ = gsl::finally([fd]() { ::close(fd); });

    pwrite_all(fd, data, offset, path);
    if (::ftruncate(fd, gsl::narrow<off_t>(offset + data.size())) == -1) {
        throw_io_error("ftruncate", path);
    }
    fsync_or_throw(fd, path);
}

void write_file_atomically(const std::filesystem::path& path, ByteView data) {
    std::filesystem::path tmp_path{path};
    tmp_path += ".tmp";
    {
        const int fd = open_or_throw(tmp_path, O_WRONLY | O_CREAT | O_TRUNC);
        [[maybe_unused]] auto _ = gsl::finally([fd]() { ::close(fd); });
        pwrite_all(fd, data, 0, tmp_path);
        fsync_or_throw(fd, tmp_path);
    }
    std::filesystem::rename(tmp_path, path);
    Directory{path.parent_path()}.sync();
}

void truncate_file(const std::filesystem::path& path, uint64_t size) {
    const int fd = open_or_throw(path, O_WRONLY);
    [[maybe_unused]] auto _ = gsl::finally([fd]() { ::close(fd); });

    if (::ftruncate(fd, gsl::narrow<off_t>(size)) == -1) {
        throw_io_error("ftruncate", path);
    }
    fsync_or_throw(fd, path);
}

}  // namespace strata::db::static_files
