// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "writers.hpp"

#include <utility>

namespace strata::db::static_files {

static size_t slot_of(StaticFileSegment segment) {
    return static_cast<size_t>(segment);
}

std::shared_ptr<StaticFileWriter> StaticFileWriters::get_or_create(StaticFileSegment segment, const WriterFactory& factory) {
    std::scoped_lock lock{mutex_};
    auto& writer{writers_[slot_of(segment)]};
    if (!writer) {
        writer = factory();
    }
    return writer;
}

std::shared_ptr<StaticFileWriter> StaticFileWriters::get(StaticFileSegment segment) const {
    std::scoped_lock lock{mutex_};
    return writers_[slot_of(segment)];
}

std::shared_ptr<StaticFileWriter> StaticFileWriters::remove(StaticFileSegment segment) {
    std::scoped_lock lock{mutex_};
    return std::exchange(writers_[slot_of(segment)], nullptr);
}

void StaticFileWriters::commit() {
    std::scoped_lock lock{mutex_};
    for (const auto& writer : writers_) {
        if (writer) {
            writer->commit();
        }
    }
}

void StaticFileWriters::clear() {
    std::scoped_lock lock{mutex_};
    for (auto& writer : writers_) {
        writer.reset();
    }
}

}  // namespace strata::db::static_files
