// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "watcher.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <thread>

#include <catch2/catch_test_macros.hpp>

#include <strata/db/static_files/provider.hpp>
#include <strata/db/static_files/test_util/sample_data.hpp>
#include <strata/infra/common/directories.hpp>
#include <strata/infra/test_util/log.hpp>

namespace strata::db::static_files {

namespace test = test_util;
using namespace std::chrono_literals;
using strata::test_util::SetLogVerbosityGuard;

static bool wait_until(const std::function<bool()>& condition) {
    const auto deadline{std::chrono::steady_clock::now() + 10s};
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

TEST_CASE("StaticFileWatcher", "[strata][db][static_files]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto writer_provider{StaticFileProvider::open({
        .directory = tmp_dir.path(),
        .access = StaticFileAccess::kReadWrite,
        .blocks_per_file = 10,
    })};

    SECTION("read-only instance follows the writer") {
        const auto reader{StaticFileProvider::open({
            .directory = tmp_dir.path(),
            .access = StaticFileAccess::kReadOnly,
            .blocks_per_file = 10,
            .watch_directory = true,
            .watch_poll_interval = 20ms,
        })};
        CHECK_FALSE(reader->get_highest_static_file_block(StaticFileSegment::headers));

        test::write_headers(*writer_provider, 0, 4);
        CHECK(wait_until([&]() { return reader->get_highest_static_file_block(StaticFileSegment::headers) == 4; }));
        CHECK(reader->header_by_number(4) == test::sample_header(4));

        // Rotation and a second jar
        test::write_headers(*writer_provider, 5, 14);
        CHECK(wait_until([&]() { return reader->get_highest_static_file_block(StaticFileSegment::headers) == 14; }));
        CHECK(reader->header_by_number(14) == test::sample_header(14));
        CHECK(reader->header_by_number(3) == test::sample_header(3));

        // Pruning is seen as well
        writer_provider->get_writer(14, StaticFileSegment::headers)->prune_headers(6);
        CHECK(wait_until([&]() { return reader->get_highest_static_file_block(StaticFileSegment::headers) == 8; }));
        CHECK_FALSE(reader->header_by_number(9));
    }

    SECTION("foreign files are ignored") {
        StaticFileWatcher watcher{std::weak_ptr<StaticFileProvider>{}, tmp_dir.path(), 20ms};

        std::ofstream{tmp_dir.path() / "notes.conf"} << "unrelated";
        std::ofstream{tmp_dir.path() / "static_file_headers_0_9.tmp"} << "unrelated";
        std::this_thread::sleep_for(100ms);
        CHECK(watcher.reinitializations() == 0);
    }

    SECTION("watcher stops with its provider") {
        auto reader{StaticFileProvider::read_only(tmp_dir.path(), /*watch_directory=*/true)};
        reader.reset();
        // Changes after the provider is gone must not reach it
        test::write_headers(*writer_provider, 0, 2);
        std::this_thread::sleep_for(50ms);
        SUCCEED();
    }

    SECTION("missing directory") {
        CHECK_THROWS_AS(StaticFileWatcher(std::weak_ptr<StaticFileProvider>{}, tmp_dir.path() / "missing", 20ms), StaticFileError);
    }
}

}  // namespace strata::db::static_files
