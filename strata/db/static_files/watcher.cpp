// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "watcher.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <map>
#include <optional>

#include <strata/db/static_files/errors.hpp>
#include <strata/db/static_files/provider.hpp>
#include <strata/db/static_files/segment.hpp>
#include <strata/infra/common/log.hpp>
#include <strata/infra/common/safe_strerror.hpp>

namespace strata::db::static_files {

namespace fs = std::filesystem;

struct StaticFileWatcher::State {
    std::weak_ptr<StaticFileProvider> provider;
    fs::path directory;
    std::chrono::milliseconds poll_interval;
    int inotify_fd{-1};
    std::atomic_bool stop_requested{false};
    std::atomic<uint64_t> reinitializations{0};

    ~State() {
        if (inotify_fd >= 0) {
            ::close(inotify_fd);
        }
    }
};

StaticFileWatcher::StaticFileWatcher(std::weak_ptr<StaticFileProvider> provider,
                                     fs::path directory,
                                     std::chrono::milliseconds poll_interval)
    : state_{std::make_shared<State>()} {
    state_->provider = std::move(provider);
    state_->directory = std::move(directory);
    state_->poll_interval = poll_interval;

    state_->inotify_fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (state_->inotify_fd < 0) {
        throw StaticFileError{"inotify_init1 failed: " + safe_strerror(errno)};
    }
    const uint32_t mask{IN_CLOSE_WRITE | IN_MOVED_TO | IN_MOVED_FROM | IN_DELETE | IN_ONLYDIR};
    if (::inotify_add_watch(state_->inotify_fd, state_->directory.c_str(), mask) < 0) {
        throw StaticFileError{"cannot watch " + state_->directory.string() + ": " + safe_strerror(errno)};
    }

    thread_ = std::thread{[state = state_]() { run(state); }};
    STRATA_DEBUG_M("Static file watcher started", {"path", state_->directory.string()});
}

StaticFileWatcher::~StaticFileWatcher() {
    state_->stop_requested = true;
    if (!thread_.joinable()) return;
    if (thread_.get_id() == std::this_thread::get_id()) {
        // The provider was released from the watcher thread itself, which owns a copy of the state
        thread_.detach();
    } else {
        thread_.join();
    }
}

uint64_t StaticFileWatcher::reinitializations() const {
    return state_->reinitializations.load();
}

void StaticFileWatcher::run(const std::shared_ptr<State>& state) {
    log::set_thread_name("sf-watcher");

    // Events older than the last seen change of the same file are stale, equal timestamps
    // are not skipped because two commits may fall within one file system clock tick
    std::map<fs::path, fs::file_time_type> last_event_time;

    alignas(inotify_event) std::array<char, 16 * 1024> buffer{};
    while (!state->stop_requested) {
        pollfd descriptor{.fd = state->inotify_fd, .events = POLLIN, .revents = 0};
        const int ready{::poll(&descriptor, 1, static_cast<int>(state->poll_interval.count()))};
        if (ready < 0) {
            if (errno == EINTR) continue;
            STRATA_ERROR_M("Static file watcher poll failed", {"error", safe_strerror(errno)});
            break;
        }
        if (ready == 0) continue;

        const ssize_t length{::read(state->inotify_fd, buffer.data(), buffer.size())};
        if (length < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                STRATA_WARN_M("Static file watch error", {"error", safe_strerror(errno)});
            }
            continue;
        }

        std::optional<fs::path> updated_file;
        for (ssize_t offset{0}; offset < length;) {
            const auto* event{reinterpret_cast<const inotify_event*>(buffer.data() + offset)};
            offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
            if (event->len == 0 || updated_file) continue;

            const fs::path path{state->directory / event->name};
            if (path.extension() != ".conf") continue;
            if (!parse_filename(path.stem().string())) continue;

            std::error_code ec;
            const auto modified{fs::last_write_time(path, ec)};
            if (!ec) {
                const auto it{last_event_time.find(path)};
                if (it != last_event_time.end() && it->second > modified) continue;
                last_event_time[path] = modified;
            }
            updated_file = path;
        }
        if (!updated_file) continue;

        const auto provider{state->provider.lock()};
        if (!provider) break;

        STRATA_INFO_M("Re-initializing static file index", {"updated_file", updated_file->stem().string()});
        try {
            provider->initialize_index();
            ++state->reinitializations;
        } catch (const std::exception& ex) {
            STRATA_WARN_M("Failed to re-initialize static file index", {"error", ex.what()});
        }
    }
    STRATA_DEBUG_M("Static file watcher stopped", {"path", state->directory.string()});
}

}  // namespace strata::db::static_files
