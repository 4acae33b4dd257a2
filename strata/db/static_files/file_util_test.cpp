// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "file_util.hpp"

#include <filesystem>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <strata/core/common/util.hpp>
#include <strata/infra/common/directories.hpp>

namespace strata::db::static_files {

TEST_CASE("file_util", "[strata][db][static_files]") {
    TemporaryDirectory tmp_dir;
    const auto path{tmp_dir.path() / "data"};
    const Bytes content{*from_hex("0011223344556677")};

    SECTION("write then read") {
        write_file_at(path, 0, content);
        CHECK(read_file(path) == content);
        CHECK(read_file_at(path, 2, 3) == *from_hex("223344"));
        CHECK_THROWS_AS(read_file_at(path, 6, 4), std::runtime_error);
    }

    SECTION("write at offset truncates the tail") {
        write_file_at(path, 0, content);
        write_file_at(path, 4, *from_hex("ffff"));
        CHECK(read_file(path) == *from_hex("00112233ffff"));
        write_file_at(path, 2, {});
        CHECK(std::filesystem::file_size(path) == 2);
    }

    SECTION("truncate") {
        write_file_at(path, 0, content);
        truncate_file(path, 3);
        CHECK(read_file(path) == *from_hex("001122"));
        CHECK_THROWS_AS(truncate_file(tmp_dir.path() / "missing", 0), std::runtime_error);
    }

    SECTION("atomic replace") {
        write_file_atomically(path, content);
        CHECK(read_file(path) == content);
        write_file_atomically(path, *from_hex("aa"));
        CHECK(read_file(path) == *from_hex("aa"));
        CHECK_FALSE(std::filesystem::exists(tmp_dir.path() / "data.tmp"));
    }

    SECTION("missing file") {
        CHECK_THROWS(read_file(tmp_dir.path() / "missing"));
        CHECK_THROWS_AS(read_file_at(tmp_dir.path() / "missing", 0, 1), std::runtime_error);
    }
}

}  // namespace strata::db::static_files
