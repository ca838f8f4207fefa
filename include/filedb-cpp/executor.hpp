/// @file executor.hpp
/// @brief execute() -- one load, apply, store cycle for a Transaction.

#pragma once

#include <filedb-cpp/transaction.hpp>

namespace filedb_cpp {

/// Run `tx` against its document.
///
/// Loads the whole document, applies the transaction to the in-memory
/// tree and stores the whole tree back, once. If apply fails nothing is
/// written. Load and store failures are handled according to the
/// document's DocumentOptions.
///
/// There is no locking: concurrent execute() calls on one file may
/// interleave, and the last store wins.
/// @throws Exception from apply, and from load/store when their policy
///   is to propagate.
void execute(const Transaction& tx);

}  // namespace filedb_cpp
