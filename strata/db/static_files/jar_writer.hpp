// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <strata/core/common/bytes.hpp>
#include <strata/core/types/hash.hpp>
#include <strata/db/static_files/jar.hpp>

namespace strata::db::static_files {

/**
 * JarWriter appends rows to the tail of a jar and commits them in two phases:
 * data and offsets are written and fsynced first, then the offset index is replaced and
 * finally the configuration file is atomically rewritten with the new row count.
 * A crash at any point before the configuration rename leaves the previous committed state intact.
 */
class JarWriter {
  public:
    //! \brief Creates an empty jar replacing any leftover file with the same name
    static JarWriter create(std::filesystem::path data_path, SegmentHeader header);

    //! \brief Opens an existing jar, healing any uncommitted or partially written tail
    static JarWriter open(const std::filesystem::path& data_path);

    [[nodiscard]] const Jar& jar() const { return jar_; }
    [[nodiscard]] SegmentHeader& user_header() { return jar_.user_header(); }
    [[nodiscard]] const SegmentHeader& user_header() const { return jar_.user_header(); }

    //! \brief Total rows, committed plus pending
    [[nodiscard]] uint64_t rows() const { return jar_.rows() + pending_rows_; }

    //! \brief Whether some rows or header changes are waiting for commit
    [[nodiscard]] bool is_dirty() const { return dirty_; }

    //! \brief Appends one row made of the given column values, optionally keyed by hash in the offset index
    void append_row(std::span<const ByteView> columns, const std::optional<Hash>& key = std::nullopt);

    //! \brief Removes the last n rows, dropping pending rows first and then truncating committed ones
    //! \remarks Committed rows are truncated on disk right away, the configuration is updated on commit
    void prune_rows(uint64_t n);

    //! \brief Durably persists pending rows and the configuration
    void commit();

  private:
    explicit JarWriter(Jar jar);

    void prune_committed_rows(uint64_t n);
    void rewrite_index() const;

    Jar jar_;
    uint64_t data_size_{0};  // committed data length, equal to the last committed offset
    uint64_t pending_rows_{0};
    Bytes pending_data_;
    std::vector<uint64_t> pending_offsets_;  // end offset of each pending cell
    std::vector<std::pair<Hash, uint64_t>> pending_keys_;
    bool dirty_{false};
};

}  // namespace strata::db::static_files
