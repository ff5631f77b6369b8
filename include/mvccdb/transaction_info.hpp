#pragma once

/**
 * @file transaction_info.hpp
 * @brief Read-only views of transaction, table and engine state
 *
 * These are plain value types handed to monitoring layers; they never alias
 * engine internals.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "mvccdb/types.hpp"

namespace mvccdb {

/**
 * @brief Registry entry for a single transaction
 */
struct TransactionInfo {
    txn_id_t id = 0;
    IsolationLevel isolation = IsolationLevel::READ_COMMITTED;
    TransactionStatus status = TransactionStatus::ACTIVE;
    Timestamp started_at{};
    std::optional<Timestamp> ended_at;  ///< Unset while ACTIVE

    bool has_snapshot = false;
    size_t snapshot_size = 0;   ///< Committed ids frozen at begin
    size_t write_set_size = 0;  ///< Distinct (table, record) keys written
};

/**
 * @brief Registry contents grouped by status, each group ordered by id
 */
struct RegistrySnapshot {
    std::vector<TransactionInfo> active;
    std::vector<TransactionInfo> committed;
    std::vector<TransactionInfo> aborted;
};

/**
 * @brief Engine-wide counters
 */
struct EngineStats {
    size_t total_transactions = 0;
    size_t active_transactions = 0;
    size_t committed_transactions = 0;
    size_t aborted_transactions = 0;
    txn_id_t next_txn_id = 0;
    size_t table_count = 0;
    size_t version_count = 0;
};

/**
 * @brief Table metadata with diagnostic counters
 *
 * record_count counts the records a READ_COMMITTED transaction beginning now
 * would see. It is a diagnostic, not a transactional read.
 */
struct TableDescription {
    std::string name;
    std::vector<ColumnDef> columns;
    Timestamp created_at{};
    size_t record_count = 0;
    size_t version_count = 0;
};

}  // namespace mvccdb
