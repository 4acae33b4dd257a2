// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "jar_writer.hpp"

#include <algorithm>
#include <cstring>

#include <strata/core/common/assert.hpp>
#include <strata/core/common/endian.hpp>
#include <strata/db/static_files/errors.hpp>
#include <strata/db/static_files/file_util.hpp>
#include <strata/db/static_files/jar_checker.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>

namespace strata::db::static_files {

namespace fs = std::filesystem;

JarWriter::JarWriter(Jar jar) : jar_{std::move(jar)} {
    const Bytes last_offset{read_file_at(jar_.offsets_path(), 1 + jar_.rows() * jar_.columns() * sizeof(uint64_t), sizeof(uint64_t))};
    data_size_ = endian::load_little_u64(last_offset.data());
}

JarWriter JarWriter::create(fs::path data_path, SegmentHeader header) {
    Jar jar{std::move(data_path), header};
    jar.delete_files();

    Bytes empty_offsets(1 + sizeof(uint64_t), '\0');
    empty_offsets[0] = Jar::kOffsetWidth;
    write_file_at(jar.data_path(), 0, {});
    write_file_at(jar.offsets_path(), 0, empty_offsets);
    write_file_at(jar.index_path(), 0, {});
    jar.save_config();

    STRATA_DEBUG_M("Created static file", {"path", jar.data_path().filename().string()});
    return JarWriter{std::move(jar)};
}

JarWriter JarWriter::open(const fs::path& data_path) {
    Jar jar{Jar::load(data_path)};
    JarChecker{jar}.check(ConsistencyStrategy::kHeal);
    return JarWriter{std::move(jar)};
}

void JarWriter::append_row(std::span<const ByteView> columns, const std::optional<Hash>& key) {
    ensure(columns.size() == jar_.columns(), [&]() {
        return "JarWriter: expected " + std::to_string(jar_.columns()) + " columns, got " + std::to_string(columns.size());
    });
    uint64_t row_size{0};
    for (const auto& value : columns) {
        pending_data_.append(value);
        pending_offsets_.push_back(data_size_ + pending_data_.size());
        row_size += value.size();
    }
    if (key) {
        pending_keys_.emplace_back(*key, rows());
    }
    jar_.set_max_row_size(std::max(jar_.max_row_size(), row_size));
    ++pending_rows_;
    dirty_ = true;
}

void JarWriter::prune_rows(uint64_t n) {
    const uint64_t pending_to_drop{std::min(n, pending_rows_)};
    if (pending_to_drop > 0) {
        pending_rows_ -= pending_to_drop;
        pending_offsets_.resize(pending_rows_ * jar_.columns());
        pending_data_.resize(pending_offsets_.empty() ? 0 : pending_offsets_.back() - data_size_);
        std::erase_if(pending_keys_, [&](const auto& entry) { return entry.second >= rows(); });
        n -= pending_to_drop;
    }
    if (n > 0) {
        prune_committed_rows(n);
    }
    dirty_ = true;
}

void JarWriter::prune_committed_rows(uint64_t n) {
    ensure(n <= jar_.rows(), [&]() {
        return "JarWriter: cannot prune " + std::to_string(n) + " rows out of " + std::to_string(jar_.rows());
    });
    jar_.set_rows(jar_.rows() - n);

    truncate_file(jar_.offsets_path(), jar_.expected_offsets_file_size());
    const Bytes last_offset{read_file_at(jar_.offsets_path(), 1 + jar_.rows() * jar_.columns() * sizeof(uint64_t), sizeof(uint64_t))};
    data_size_ = endian::load_little_u64(last_offset.data());
    truncate_file(jar_.data_path(), data_size_);

    // Pending rows are always behind committed ones
    STRATA_ASSERT(pending_rows_ == 0);
}

void JarWriter::rewrite_index() const {
    Bytes index;
    if (fs::exists(jar_.index_path())) {
        const Bytes existing{read_file(jar_.index_path())};
        index.reserve(existing.size() + pending_keys_.size() * Jar::kIndexEntrySize);
        for (size_t pos{0}; pos + Jar::kIndexEntrySize <= existing.size(); pos += Jar::kIndexEntrySize) {
            const uint64_t row{endian::load_big_u64(existing.data() + pos + kHashLength)};
            // Entries of pruned rows must not resolve to rows appended afterwards
            if (row < jar_.rows()) {
                index.append(existing.data() + pos, Jar::kIndexEntrySize);
            }
        }
    }
    uint8_t entry[Jar::kIndexEntrySize];
    for (const auto& [key, row] : pending_keys_) {
        std::memcpy(entry, key.bytes, kHashLength);
        endian::store_big_u64(entry + kHashLength, row);
        index.append(entry, Jar::kIndexEntrySize);
    }

    const size_t entries{index.size() / Jar::kIndexEntrySize};
    std::vector<size_t> order(entries);
    for (size_t i{0}; i < entries; ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](size_t lhs, size_t rhs) {
        return std::memcmp(index.data() + lhs * Jar::kIndexEntrySize, index.data() + rhs * Jar::kIndexEntrySize, kHashLength) < 0;
    });
    Bytes sorted;
    sorted.reserve(index.size());
    for (const size_t i : order) {
        sorted.append(index.data() + i * Jar::kIndexEntrySize, Jar::kIndexEntrySize);
    }
    write_file_atomically(jar_.index_path(), sorted);
}

void JarWriter::commit() {
    if (pending_rows_ > 0) {
        const uint64_t committed_rows{jar_.rows()};

        // Phase one: column data and offsets
        write_file_at(jar_.data_path(), data_size_, pending_data_);
        Bytes offsets(pending_offsets_.size() * sizeof(uint64_t), '\0');
        for (size_t i{0}; i < pending_offsets_.size(); ++i) {
            endian::store_little_u64(offsets.data() + i * sizeof(uint64_t), pending_offsets_[i]);
        }
        write_file_at(jar_.offsets_path(), jar_.expected_offsets_file_size(), offsets);
        if (!pending_keys_.empty()) {
            rewrite_index();
        }

        jar_.set_rows(committed_rows + pending_rows_);
        data_size_ = pending_offsets_.back();
    }

    // Phase two: the configuration file is the commit marker
    jar_.save_config();

    pending_rows_ = 0;
    pending_data_.clear();
    pending_offsets_.clear();
    pending_keys_.clear();
    dirty_ = false;
}

}  // namespace strata::db::static_files
