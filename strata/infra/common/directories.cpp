// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <gsl/util>

#include "safe_strerror.hpp"

namespace strata {

Directory::Directory(const std::filesystem::path& directory_path, bool must_create)
    : path_{directory_path.empty() ? std::filesystem::current_path() : directory_path} {
    if (must_create) {
        create();
    }
}

bool Directory::exists() const {
    std::error_code ec;
    return std::filesystem::is_directory(path_, ec);
}

bool Directory::is_empty() const {
    return exists() && std::filesystem::is_empty(path_);
}

void Directory::create() {
    if (exists()) return;
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        throw std::invalid_argument{"cannot create directory " + path_.string() + ": " + ec.message()};
    }
}

void Directory::sync() const {
    const int fd = ::open(path_.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd == -1) {
        throw std::runtime_error{"open failed for: " + path_.string() + " error: " + safe_strerror(errno)};
    }
    [[maybe_unused]] auto _ = gsl::finally([fd]() { ::close(fd); });
    if (::fsync(fd) == -1) {
        throw std::runtime_error{"fsync failed for: " + path_.string() + " error: " + safe_strerror(errno)};
    }
}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TemporaryDirectory::make_unique_path() {
    std::string name_template{(std::filesystem::temp_directory_path() / "strata-XXXXXX").string()};
    if (::mkdtemp(name_template.data()) == nullptr) {
        throw std::runtime_error{"mkdtemp failed for: " + name_template + " error: " + safe_strerror(errno)};
    }
    return name_template;
}

}  // namespace strata
