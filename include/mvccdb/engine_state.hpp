#pragma once

/**
 * @file engine_state.hpp
 * @brief Format-free dump of engine state for persistence layers
 *
 * The engine defines no on-disk format. A persistence layer calls
 * Database::export_state(), serializes EngineState however it likes, and
 * later hands an equivalent EngineState to Database::import_state() on a
 * fresh engine.
 */

#include <optional>
#include <string>
#include <vector>

#include "mvccdb/result.hpp"
#include "mvccdb/types.hpp"

namespace mvccdb {

struct VersionState {
    record_id_t record_id = 0;
    std::vector<Value> values;  ///< In schema column order
    txn_id_t created_by = 0;
    txn_id_t deleted_by = 0;    ///< 0 = not deleted
    Timestamp created_at{};
};

struct TableState {
    std::string name;
    std::vector<ColumnDef> columns;
    Timestamp created_at{};
    record_id_t next_record_id = 1;
    std::vector<VersionState> versions;  ///< Chain order within each record
};

struct TransactionState {
    txn_id_t id = 0;
    IsolationLevel isolation = IsolationLevel::READ_COMMITTED;
    TransactionStatus status = TransactionStatus::ACTIVE;
    Timestamp started_at{};
    std::optional<Timestamp> ended_at;
};

struct EngineState {
    std::vector<TableState> tables;
    std::vector<TransactionState> transactions;
};

}  // namespace mvccdb
