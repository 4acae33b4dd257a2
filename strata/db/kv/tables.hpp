// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <strata/db/kv/mdbx.hpp>

/*
Part of the chain data tables mirrored by the static files.
The static-file layer only reads them, to reconcile its own state with the database.
*/

namespace strata::db::table {

//! \details Stores canonical block headers
//! \struct
//! \verbatim
//!   key   : block number (BE 8 bytes)
//!   value : block header (RLP)
//! \endverbatim
inline constexpr const char* kHeadersName{"Header"};
inline constexpr MapConfig kHeaders{kHeadersName};

//! \details Stores the transaction numbering of each block body
//! \struct
//! \verbatim
//!   key   : block number (BE 8 bytes)
//!   value : first tx number (BE 8 bytes) + tx count (BE 8 bytes)
//! \endverbatim
inline constexpr const char* kBlockBodyIndicesName{"BlockBodyIndices"};
inline constexpr MapConfig kBlockBodyIndices{kBlockBodyIndicesName};

//! \details Stores transactions by their global number
//! \struct
//! \verbatim
//!   key   : tx number (BE 8 bytes)
//!   value : transaction (canonical encoding)
//! \endverbatim
inline constexpr const char* kTransactionsName{"Transactions"};
inline constexpr MapConfig kTransactions{kTransactionsName};

//! \details Stores receipts by the global number of their transaction
//! \struct
//! \verbatim
//!   key   : tx number (BE 8 bytes)
//!   value : receipt (RLP)
//! \endverbatim
inline constexpr const char* kReceiptsName{"Receipts"};
inline constexpr MapConfig kReceipts{kReceiptsName};

//! \details Stores the progress of each sync stage
//! \struct
//! \verbatim
//!   key   : stage name
//!   value : block number (BE 8 bytes)
//! \endverbatim
inline constexpr const char* kSyncStageProgressName{"SyncStage"};
inline constexpr MapConfig kSyncStageProgress{kSyncStageProgressName};

inline constexpr MapConfig kChainDataTables[]{
    kBlockBodyIndices,
    kHeaders,
    kReceipts,
    kSyncStageProgress,
    kTransactions,
};

//! \brief Ensures all defined tables are present in db with consistent flags. Should a table not exist it gets created
void check_or_create_chaindata_tables(RWTxn& txn);

}  // namespace strata::db::table
