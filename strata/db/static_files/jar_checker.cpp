// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "jar_checker.hpp"

#include <absl/strings/str_format.h>

#include <strata/core/common/endian.hpp>
#include <strata/db/static_files/errors.hpp>
#include <strata/db/static_files/file_util.hpp>
#include <strata/infra/common/log.hpp>

namespace strata::db::static_files {

namespace fs = std::filesystem;

static uint64_t file_size_or_zero(const fs::path& path) {
    std::error_code ec;
    const auto size{fs::file_size(path, ec)};
    return ec ? 0 : size;
}

uint64_t JarChecker::offsets_file_size() const {
    return file_size_or_zero(jar_.offsets_path());
}

uint64_t JarChecker::data_file_size() const {
    return file_size_or_zero(jar_.data_path());
}

uint64_t JarChecker::read_offset(uint64_t index) const {
    const Bytes offset{read_file_at(jar_.offsets_path(), 1 + index * sizeof(uint64_t), sizeof(uint64_t))};
    return endian::load_little_u64(offset.data());
}

void JarChecker::fail(const std::string& reason) const {
    throw InconsistentJar{"inconsistent jar " + jar_.data_path().filename().string() + ": " + reason};
}

bool JarChecker::check(ConsistencyStrategy strategy) {
    const bool heal{strategy == ConsistencyStrategy::kHeal};
    const uint64_t columns{jar_.columns()};
    const uint64_t initial_rows{jar_.rows()};
    bool changed{false};

    uint64_t offsets_size{offsets_file_size()};
    if (offsets_size > 0) {
        const Bytes width{read_file_at(jar_.offsets_path(), 0, 1)};
        if (width[0] != Jar::kOffsetWidth) {
            fail(absl::StrFormat("unsupported offset width %d", width[0]));
        }
    }

    // 1. Offsets file against configured rows
    const uint64_t expected_offsets_size{jar_.expected_offsets_file_size()};
    if (offsets_size > expected_offsets_size) {
        if (!heal) fail(absl::StrFormat("offsets file size %d exceeds expected %d", offsets_size, expected_offsets_size));
        truncate_file(jar_.offsets_path(), expected_offsets_size);
        offsets_size = expected_offsets_size;
        changed = true;
    } else if (offsets_size < expected_offsets_size) {
        if (!heal) fail(absl::StrFormat("offsets file size %d below expected %d", offsets_size, expected_offsets_size));
        const uint64_t stored_offsets{offsets_size > 0 ? (offsets_size - 1) / sizeof(uint64_t) : 0};
        if (stored_offsets == 0) {
            Bytes empty_offsets(1 + sizeof(uint64_t), '\0');
            empty_offsets[0] = Jar::kOffsetWidth;
            write_file_at(jar_.offsets_path(), 0, empty_offsets);
            jar_.set_rows(0);
        } else {
            jar_.set_rows((stored_offsets - 1) / columns);
            truncate_file(jar_.offsets_path(), jar_.expected_offsets_file_size());
        }
        offsets_size = jar_.expected_offsets_file_size();
        changed = true;
    }

    // 2. Data file against the last offset
    const uint64_t data_size{data_file_size()};
    uint64_t last_offset{read_offset(jar_.rows() * columns)};
    if (data_size > last_offset) {
        if (!heal) fail(absl::StrFormat("data file size %d exceeds last offset %d", data_size, last_offset));
        truncate_file(jar_.data_path(), last_offset);
        changed = true;
    } else if (data_size < last_offset) {
        if (!heal) fail(absl::StrFormat("data file size %d below last offset %d", data_size, last_offset));
        // Rows whose data is missing are dropped from the tail
        uint64_t rows{jar_.rows()};
        while (rows > 0 && last_offset > data_size) {
            --rows;
            last_offset = read_offset(rows * columns);
        }
        if (last_offset > data_size) {
            fail(absl::StrFormat("first offset %d beyond data file size %d", last_offset, data_size));
        }
        jar_.set_rows(rows);
        truncate_file(jar_.offsets_path(), jar_.expected_offsets_file_size());
        truncate_file(jar_.data_path(), last_offset);
        changed = true;
    }

    if (jar_.rows() != initial_rows) {
        STRATA_WARN_M("Jar rows lost after interrupted write",
                      {"jar", jar_.data_path().filename().string(),
                       "committed", std::to_string(initial_rows),
                       "recovered", std::to_string(jar_.rows())});
        jar_.save_config();
    } else if (changed) {
        STRATA_INFO_M("Jar uncommitted tail truncated", {"jar", jar_.data_path().filename().string()});
    }
    return changed;
}

}  // namespace strata::db::static_files
