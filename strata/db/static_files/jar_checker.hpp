// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <strata/db/static_files/jar.hpp>

namespace strata::db::static_files {

//! How a jar whose files disagree with its configuration is handled
enum class ConsistencyStrategy {
    kHeal,   // truncate uncommitted tails and drop rows whose data was lost
    kThrow,  // raise InconsistentJar
};

//! \brief Validates the offsets and data files of a jar against its committed configuration
class JarChecker {
  public:
    explicit JarChecker(Jar& jar) : jar_{jar} {}

    //! \brief Checks the jar files and repairs them according to the strategy
    //! \return true if the files or the row count have been changed
    //! \throws InconsistentJar with the throw strategy or when the jar cannot be repaired
    bool check(ConsistencyStrategy strategy);

  private:
    [[nodiscard]] uint64_t offsets_file_size() const;
    [[nodiscard]] uint64_t data_file_size() const;
    [[nodiscard]] uint64_t read_offset(uint64_t index) const;

    void fail(const std::string& reason) const;

    Jar& jar_;
};

}  // namespace strata::db::static_files
