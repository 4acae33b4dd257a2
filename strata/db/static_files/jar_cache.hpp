// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include <absl/container/flat_hash_map.h>
#include <absl/hash/hash.h>

#include <strata/core/common/base.hpp>
#include <strata/db/static_files/jar.hpp>
#include <strata/db/static_files/segment.hpp>

namespace strata::db::static_files {

//! Cache key of a loaded jar: the end block of its fixed range and its segment
using JarCacheKey = std::pair<BlockNum, StaticFileSegment>;

//! \brief Concurrent map of loaded jars sharded by key hash, each shard under its own read-write lock
class JarCache {
  public:
    using Value = std::shared_ptr<const LoadedJar>;
    using KeyPredicate = std::function<bool(const JarCacheKey&)>;

    [[nodiscard]] Value get(const JarCacheKey& key) const {
        const Shard& shard{shard_of(key)};
        std::shared_lock lock{shard.mutex};
        const auto it{shard.jars.find(key)};
        return it != shard.jars.end() ? it->second : nullptr;
    }

    //! \brief Inserts the jar unless the key is already present
    //! \return the cached jar after the call
    Value get_or_insert(const JarCacheKey& key, Value jar) {
        Shard& shard{shard_of(key)};
        std::unique_lock lock{shard.mutex};
        const auto [it, _] = shard.jars.try_emplace(key, std::move(jar));
        return it->second;
    }

    void insert_or_assign(const JarCacheKey& key, Value jar) {
        Shard& shard{shard_of(key)};
        std::unique_lock lock{shard.mutex};
        shard.jars.insert_or_assign(key, std::move(jar));
    }

    //! \brief Removes the key returning the jar it held, if any
    Value remove(const JarCacheKey& key) {
        Shard& shard{shard_of(key)};
        std::unique_lock lock{shard.mutex};
        const auto it{shard.jars.find(key)};
        if (it == shard.jars.end()) {
            return nullptr;
        }
        Value jar{std::move(it->second)};
        shard.jars.erase(it);
        return jar;
    }

    //! \brief Keeps only the entries whose key satisfies the predicate
    void retain(const KeyPredicate& keep) {
        for (Shard& shard : shards_) {
            std::unique_lock lock{shard.mutex};
            absl::erase_if(shard.jars, [&](const auto& entry) { return !keep(entry.first); });
        }
    }

    void clear() {
        for (Shard& shard : shards_) {
            std::unique_lock lock{shard.mutex};
            shard.jars.clear();
        }
    }

    [[nodiscard]] size_t size() const {
        size_t total{0};
        for (const Shard& shard : shards_) {
            std::shared_lock lock{shard.mutex};
            total += shard.jars.size();
        }
        return total;
    }

  private:
    static constexpr size_t kShards{16};

    struct Shard {
        mutable std::shared_mutex mutex;
        absl::flat_hash_map<JarCacheKey, Value> jars;
    };

    Shard& shard_of(const JarCacheKey& key) { return shards_[absl::Hash<JarCacheKey>{}(key) % kShards]; }
    const Shard& shard_of(const JarCacheKey& key) const { return shards_[absl::Hash<JarCacheKey>{}(key) % kShards]; }

    std::array<Shard, kShards> shards_;
};

}  // namespace strata::db::static_files
