// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <functional>
#include <memory>
#include <mutex>

#include <strata/db/static_files/segment.hpp>
#include <strata/db/static_files/writer.hpp>

namespace strata::db::static_files {

//! \brief Registry holding at most one writer per segment
class StaticFileWriters {
  public:
    using WriterFactory = std::function<std::shared_ptr<StaticFileWriter>()>;

    //! \brief The open writer of the segment, created by the factory if there is none
    std::shared_ptr<StaticFileWriter> get_or_create(StaticFileSegment segment, const WriterFactory& factory);

    //! \brief The open writer of the segment, nullptr if none
    std::shared_ptr<StaticFileWriter> get(StaticFileSegment segment) const;

    //! \brief Takes the open writer of the segment out of the registry
    //! \return the removed writer, nullptr if none
    std::shared_ptr<StaticFileWriter> remove(StaticFileSegment segment);

    //! \brief Commits all open writers
    void commit();

    //! \brief Drops all open writers
    void clear();

  private:
    mutable std::mutex mutex_;
    std::array<std::shared_ptr<StaticFileWriter>, kAllSegments.size()> writers_;
};

}  // namespace strata::db::static_files
