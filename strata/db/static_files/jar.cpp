// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "jar.hpp"

#include <algorithm>
#include <cstring>

#include <strata/core/common/endian.hpp>
#include <strata/db/static_files/errors.hpp>
#include <strata/db/static_files/file_util.hpp>
#include <strata/infra/common/decoding_exception.hpp>
#include <strata/infra/common/log.hpp>

namespace strata::db::static_files {

static std::filesystem::path sibling_path(const std::filesystem::path& data_path, const char* extension) {
    std::filesystem::path path{data_path};
    path += extension;
    return path;
}

// magic + version + columns + rows + max_row_size + header length
static constexpr size_t kConfigPrefixSize{4 + 1 + 4 + 8 + 8 + 4};

Jar::Jar(std::filesystem::path data_path, SegmentHeader user_header)
    : data_path_{std::move(data_path)},
      columns_{columns_of(user_header.segment())},
      user_header_{user_header} {}

std::filesystem::path Jar::offsets_path() const { return sibling_path(data_path_, ".off"); }

std::filesystem::path Jar::index_path() const { return sibling_path(data_path_, ".idx"); }

std::filesystem::path Jar::config_path() const { return sibling_path(data_path_, ".conf"); }

uint64_t Jar::expected_offsets_file_size() const {
    return 1 + (rows_ * columns_ + 1) * sizeof(uint64_t);
}

Jar Jar::load(const std::filesystem::path& data_path) {
    const auto config_path{sibling_path(data_path, ".conf")};
    if (!std::filesystem::exists(config_path)) {
        throw StaticFileError{"missing jar configuration: " + config_path.string()};
    }
    const Bytes config{read_file(config_path)};
    if (config.size() < kConfigPrefixSize) {
        throw StaticFileError{"truncated jar configuration: " + config_path.string()};
    }
    const uint8_t* p{config.data()};
    if (endian::load_big_u32(p) != kMagic) {
        throw StaticFileError{"bad magic in jar configuration: " + config_path.string()};
    }
    if (p[4] != kVersion) {
        throw StaticFileError{"unsupported jar version " + std::to_string(p[4]) + ": " + config_path.string()};
    }
    const uint32_t columns{endian::load_big_u32(p + 5)};
    const uint64_t rows{endian::load_big_u64(p + 9)};
    const uint64_t max_row_size{endian::load_big_u64(p + 17)};
    const uint32_t header_size{endian::load_big_u32(p + 25)};
    if (config.size() != kConfigPrefixSize + header_size) {
        throw StaticFileError{"bad jar configuration size: " + config_path.string()};
    }

    SegmentHeader header{[&]() {
        try {
            return SegmentHeader::decode(ByteView{config}.substr(kConfigPrefixSize));
        } catch (const DecodingException& ex) {
            throw StaticFileError{"bad segment header in " + config_path.string() + ": " + ex.what()};
        }
    }()};

    Jar jar{data_path, header};
    if (jar.columns_ != columns) {
        throw StaticFileError{"unexpected column count " + std::to_string(columns) + ": " + config_path.string()};
    }
    jar.rows_ = rows;
    jar.max_row_size_ = max_row_size;
    return jar;
}

void Jar::save_config() const {
    const Bytes header{user_header_.encode()};
    Bytes config(kConfigPrefixSize, '\0');
    uint8_t* p{config.data()};
    endian::store_big_u32(p, kMagic);
    p[4] = kVersion;
    endian::store_big_u32(p + 5, static_cast<uint32_t>(columns_));
    endian::store_big_u64(p + 9, rows_);
    endian::store_big_u64(p + 17, max_row_size_);
    endian::store_big_u32(p + 25, static_cast<uint32_t>(header.size()));
    config.append(header);

    write_file_atomically(config_path(), config);
}

void Jar::delete_files() const {
    // Configuration first so that a partial deletion leaves no loadable jar behind
    for (const auto& path : {config_path(), data_path_, offsets_path(), index_path()}) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            throw StaticFileError{"cannot delete " + path.string() + ": " + ec.message()};
        }
    }
    STRATA_DEBUG_M("Deleted static file", {"path", data_path_.filename().string()});
}

LoadedJar::LoadedJar(Jar jar)
    : jar_{std::move(jar)},
      data_file_{jar_.data_path()},
      offsets_file_{jar_.offsets_path()} {
    if (std::filesystem::exists(jar_.index_path())) {
        index_file_.emplace(jar_.index_path());
    }
    data_file_.advise_random();
}

std::optional<uint64_t> LoadedJar::offset_at(uint64_t index) const {
    const uint64_t position{1 + index * sizeof(uint64_t)};
    const auto region{offsets_file_.region()};
    if (region.empty() || region[0] != Jar::kOffsetWidth || position + sizeof(uint64_t) > region.size()) {
        return std::nullopt;
    }
    return endian::load_little_u64(region.data() + position);
}

std::optional<ByteView> LoadedJar::column(uint64_t row, size_t column) const {
    if (row >= jar_.rows() || column >= jar_.columns()) {
        return std::nullopt;
    }
    const uint64_t index{row * jar_.columns() + column};
    const auto begin{offset_at(index)};
    const auto end{offset_at(index + 1)};
    const auto data{data_file_.region()};
    if (!begin || !end || *begin > *end || *end > data.size()) {
        return std::nullopt;
    }
    return ByteView{data.data() + *begin, static_cast<size_t>(*end - *begin)};
}

std::optional<uint64_t> LoadedJar::find_row(const Hash& key) const {
    if (!index_file_) {
        return std::nullopt;
    }
    const auto region{index_file_->region()};
    const size_t entries{region.size() / Jar::kIndexEntrySize};

    // Lower bound over the sorted fixed width entries
    size_t low{0}, high{entries};
    while (low < high) {
        const size_t mid{low + (high - low) / 2};
        const uint8_t* entry{region.data() + mid * Jar::kIndexEntrySize};
        if (std::memcmp(entry, key.bytes, kHashLength) < 0) {
            low = mid + 1;
        } else {
            high = mid;
        }
    }
    for (size_t i{low}; i < entries; ++i) {
        const uint8_t* entry{region.data() + i * Jar::kIndexEntrySize};
        if (std::memcmp(entry, key.bytes, kHashLength) != 0) {
            break;
        }
        const uint64_t row{endian::load_big_u64(entry + kHashLength)};
        if (row < jar_.rows()) {
            return row;
        }
    }
    return std::nullopt;
}

}  // namespace strata::db::static_files
