// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>

namespace strata::db::static_files {

class StaticFileProvider;

//! \brief Background thread re-initializing the index of a read-only provider when jar configurations change
//! \details Uses inotify on the (non-recursive) static file directory. Only .conf files named after
//! a segment range trigger a re-initialization, and only when newer than the last seen event.
//! The watcher holds a weak reference and exits once the provider is gone.
class StaticFileWatcher {
  public:
    //! \throws StaticFileError if the directory cannot be watched
    StaticFileWatcher(std::weak_ptr<StaticFileProvider> provider,
                      std::filesystem::path directory,
                      std::chrono::milliseconds poll_interval);
    ~StaticFileWatcher();

    StaticFileWatcher(const StaticFileWatcher&) = delete;
    StaticFileWatcher& operator=(const StaticFileWatcher&) = delete;

    //! \brief Number of index re-initializations done so far
    [[nodiscard]] uint64_t reinitializations() const;

  private:
    struct State;

    static void run(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
    std::thread thread_;
};

}  // namespace strata::db::static_files
