// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include <strata/core/common/bytes.hpp>
#include <strata/core/types/hash.hpp>
#include <strata/db/static_files/segment.hpp>
#include <strata/infra/common/memory_mapped_file.hpp>

namespace strata::db::static_files {

/**
 * Jar is the on-disk container of one segment range. It is made of four sibling files:
 * - data file (no extension): the column values of all rows, back to back
 * - offsets file (.off): offset width byte, then rows * columns + 1 little-endian offsets into the data file
 * - offset index file (.idx): sorted (32-byte key, 8-byte big-endian row) entries for lookups by hash
 * - configuration file (.conf): the commit marker holding row count, column layout and SegmentHeader
 * The jar content is authoritative only up to the row count of its configuration file.
 */
class Jar {
  public:
    static constexpr uint32_t kMagic{0x534A4152};  // "SJAR"
    static constexpr uint8_t kVersion{1};
    static constexpr uint8_t kOffsetWidth{sizeof(uint64_t)};
    static constexpr size_t kIndexEntrySize{kHashLength + sizeof(uint64_t)};

    Jar(std::filesystem::path data_path, SegmentHeader user_header);

    //! \brief Loads the jar configuration stored beside the given data file
    //! \throws StaticFileError if the configuration is missing or malformed
    static Jar load(const std::filesystem::path& data_path);

    [[nodiscard]] const std::filesystem::path& data_path() const { return data_path_; }
    [[nodiscard]] std::filesystem::path offsets_path() const;
    [[nodiscard]] std::filesystem::path index_path() const;
    [[nodiscard]] std::filesystem::path config_path() const;

    [[nodiscard]] size_t columns() const { return columns_; }
    [[nodiscard]] uint64_t rows() const { return rows_; }
    void set_rows(uint64_t rows) { rows_ = rows; }
    [[nodiscard]] uint64_t max_row_size() const { return max_row_size_; }
    void set_max_row_size(uint64_t size) { max_row_size_ = size; }

    [[nodiscard]] const SegmentHeader& user_header() const { return user_header_; }
    SegmentHeader& user_header() { return user_header_; }

    //! \brief Expected offsets file size for the configured rows
    [[nodiscard]] uint64_t expected_offsets_file_size() const;

    //! \brief Durably replaces the configuration file, this is the commit point of the jar
    void save_config() const;

    //! \brief Removes all files of the jar
    void delete_files() const;

  private:
    std::filesystem::path data_path_;
    size_t columns_{0};
    uint64_t rows_{0};
    uint64_t max_row_size_{0};
    SegmentHeader user_header_;
};

//! \brief Read-only view of a committed jar, memory mapping its data, offsets and index files
class LoadedJar {
  public:
    explicit LoadedJar(Jar jar);

    [[nodiscard]] const Jar& jar() const { return jar_; }
    [[nodiscard]] const SegmentHeader& user_header() const { return jar_.user_header(); }
    [[nodiscard]] uint64_t rows() const { return jar_.rows(); }

    //! \brief Value of one column of the given row, nullopt if beyond committed rows or backing files
    [[nodiscard]] std::optional<ByteView> column(uint64_t row, size_t column) const;

    //! \brief Row keyed by the given hash in the offset index, nullopt if absent
    [[nodiscard]] std::optional<uint64_t> find_row(const Hash& key) const;

  private:
    [[nodiscard]] std::optional<uint64_t> offset_at(uint64_t index) const;

    Jar jar_;
    MemoryMappedFile data_file_;
    MemoryMappedFile offsets_file_;
    std::optional<MemoryMappedFile> index_file_;
};

}  // namespace strata::db::static_files
