// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace strata {

//! \brief A filesystem directory addressed by path, optionally created on construction
class Directory {
  public:
    //! \param directory_path the directory location, the current working directory if empty
    //! \param must_create whether the directory and its missing parents are created
    //! \throws std::invalid_argument if creation is requested and fails
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);
    virtual ~Directory() = default;

    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    //! \brief Whether the path exists and is a directory
    [[nodiscard]] bool exists() const;

    //! \brief Whether the directory exists and holds no entries
    [[nodiscard]] bool is_empty() const;

    void create();

    //! \brief Flushes the directory entries to stable storage, needed after a rename to make it durable
    void sync() const;

  protected:
    std::filesystem::path path_;
};

//! \brief A uniquely named directory under the OS temporary path, removed with all its contents on destruction
class TemporaryDirectory final : public Directory {
  public:
    TemporaryDirectory() : Directory(make_unique_path(), false) {}
    ~TemporaryDirectory() final;

  private:
    //! Creates the directory atomically and returns its path
    static std::filesystem::path make_unique_path();
};

}  // namespace strata
