// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <absl/strings/str_format.h>

#include <strata/core/common/base.hpp>
#include <strata/db/static_files/segment.hpp>

namespace strata::db::static_files {

//! \brief Base class of all errors raised by the static-file storage
class StaticFileError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! \brief The requested block is outside all on-disk ranges of the segment
class MissingStaticFileBlock : public StaticFileError {
  public:
    MissingStaticFileBlock(StaticFileSegment segment, BlockNum block)
        : StaticFileError{absl::StrFormat("missing %s static file for block %d", to_string(segment), block)},
          segment_{segment},
          block_{block} {}

    StaticFileSegment segment() const { return segment_; }
    BlockNum block() const { return block_; }

  private:
    StaticFileSegment segment_;
    BlockNum block_;
};

//! \brief The requested transaction is outside all on-disk ranges of the segment
class MissingStaticFileTx : public StaticFileError {
  public:
    MissingStaticFileTx(StaticFileSegment segment, TxNum tx_num)
        : StaticFileError{absl::StrFormat("missing %s static file for transaction %d", to_string(segment), tx_num)},
          segment_{segment},
          tx_num_{tx_num} {}

    StaticFileSegment segment() const { return segment_; }
    TxNum tx_num() const { return tx_num_; }

  private:
    StaticFileSegment segment_;
    TxNum tx_num_;
};

//! \brief The operation needs data this storage does not hold
class UnsupportedProvider : public StaticFileError {
  public:
    explicit UnsupportedProvider(const std::string& operation)
        : StaticFileError{"operation not supported by static files: " + operation} {}
};

//! \brief A write operation was requested on a read-only provider
class ReadOnlyStaticFileAccess : public StaticFileError {
  public:
    ReadOnlyStaticFileAccess() : StaticFileError{"static file provider opened in read-only mode"} {}
};

//! \brief A jar whose files do not match its committed configuration
class InconsistentJar : public StaticFileError {
  public:
    using StaticFileError::StaticFileError;
};

class UnexpectedStaticFileBlockNumber : public StaticFileError {
  public:
    UnexpectedStaticFileBlockNumber(StaticFileSegment segment, BlockNum block, BlockNum expected)
        : StaticFileError{absl::StrFormat("unexpected %s block number %d, expected %d", to_string(segment), block, expected)} {}
};

class UnexpectedStaticFileTxNumber : public StaticFileError {
  public:
    UnexpectedStaticFileTxNumber(StaticFileSegment segment, TxNum tx_num, TxNum expected)
        : StaticFileError{absl::StrFormat("unexpected %s transaction number %d, expected %d", to_string(segment), tx_num, expected)} {}
};

//! \brief The directory lock is held by another read-write instance or cannot be taken
class StorageLockError : public StaticFileError {
  public:
    using StaticFileError::StaticFileError;
};

}  // namespace strata::db::static_files
