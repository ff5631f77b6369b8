#pragma once

/**
 * @file database.hpp
 * @brief Database class - the engine context and main entry point for mvccdb
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mvccdb/engine_state.hpp"
#include "mvccdb/predicate.hpp"
#include "mvccdb/result.hpp"
#include "mvccdb/status.hpp"
#include "mvccdb/transaction_info.hpp"
#include "mvccdb/types.hpp"

namespace mvccdb {

// Forward declarations
class DatabaseImpl;

/**
 * @brief Configuration options for opening an engine
 */
struct DatabaseOptions {
    /// Name used in log lines (default: "mvccdb")
    std::string name = "mvccdb";

    /// Isolation used by begin_transaction() without an argument
    IsolationLevel default_isolation = IsolationLevel::READ_COMMITTED;

    /// Run first-committer-wins validation for REPEATABLE_READ as well as
    /// SERIALIZABLE (default: true)
    bool repeatable_read_conflict_check = true;

    /// spdlog level name: trace, debug, info, warn, err, critical, off
    std::string log_level = "info";
};

/**
 * @brief In-memory MVCC engine
 *
 * A Database owns its catalog, version stores and transaction registry.
 * Instances are fully independent; nothing is shared through globals.
 * All methods are thread-safe. Readers never block writers and writers never
 * block readers; the only cross-transaction exclusion is taken inside commit
 * on the keys being committed.
 *
 * Example usage:
 * @code
 * mvccdb::Database db;
 * db.create_table("users", {{"name", mvccdb::TypeId::VARCHAR}});
 * mvccdb::txn_id_t txn;
 * db.begin_transaction(mvccdb::IsolationLevel::READ_COMMITTED, &txn);
 * db.insert(txn, "users", 1, {{"name", mvccdb::Value("Alice")}});
 * db.commit(txn);
 * @endcode
 */
class Database {
public:
    explicit Database(const DatabaseOptions& options = {});

    /**
     * @brief Destructor - closes the engine
     */
    ~Database();

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Movable
    Database(Database&&) noexcept;
    Database& operator=(Database&&) noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Catalog
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Status create_table(const std::string& name, const std::vector<ColumnDef>& columns);
    [[nodiscard]] Status drop_table(const std::string& name);
    [[nodiscard]] bool table_exists(const std::string& name) const;

    /// Table names in ascending order
    [[nodiscard]] std::vector<std::string> table_names() const;

    [[nodiscard]] Status describe_table(const std::string& name, TableDescription* out) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Transactions
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Begin a new transaction
     * @param isolation Isolation level
     * @param txn_id Receives the new transaction id
     * @return Status::InvalidIsolation for an out-of-range level
     */
    [[nodiscard]] Status begin_transaction(IsolationLevel isolation, txn_id_t* txn_id);

    /**
     * @brief Begin a new transaction with the isolation named by a string
     */
    [[nodiscard]] Status begin_transaction(std::string_view isolation, txn_id_t* txn_id);

    /**
     * @brief Begin a new transaction at DatabaseOptions::default_isolation
     */
    [[nodiscard]] Status begin_transaction(txn_id_t* txn_id);

    /**
     * @brief Commit a transaction
     *
     * Snapshot-isolated transactions are validated first; on a write-write
     * conflict the transaction ends ABORTED and
     * Status::SerializationConflict is returned.
     */
    [[nodiscard]] Status commit(txn_id_t txn_id);

    /**
     * @brief Roll back a transaction. Never blocks.
     */
    [[nodiscard]] Status rollback(txn_id_t txn_id);

    // ─────────────────────────────────────────────────────────────────────────
    // Data Operations
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Insert a record
     * @param record_id Key of the new record; allocated when absent
     * @param values Column assignments; unassigned columns are NULL
     */
    [[nodiscard]] Result insert(txn_id_t txn_id, const std::string& table,
                                std::optional<record_id_t> record_id, const ColumnValues& values);

    /**
     * @brief Create new versions of matching records with the assignments applied
     *
     * With a record id the single record is updated (Status::RecordNotFound
     * when it has no version visible to the writer). Without one, every
     * record matching the predicate (all records when null) is updated.
     */
    [[nodiscard]] Result update(txn_id_t txn_id, const std::string& table,
                                std::optional<record_id_t> record_id, const ColumnValues& values,
                                const Predicate* predicate = nullptr);

    /**
     * @brief Delete matching records; same targeting rules as update()
     */
    [[nodiscard]] Result remove(txn_id_t txn_id, const std::string& table,
                                std::optional<record_id_t> record_id,
                                const Predicate* predicate = nullptr);

    /**
     * @brief Read the rows visible to a transaction, in record-id order
     */
    [[nodiscard]] Result read(txn_id_t txn_id, const std::string& table,
                              const Predicate* predicate = nullptr) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Status transaction_info(txn_id_t txn_id, TransactionInfo* out) const;
    [[nodiscard]] RegistrySnapshot snapshot_of_registry() const;
    [[nodiscard]] EngineStats stats() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Persistence Hooks
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Dump every table, version and transaction
     */
    [[nodiscard]] EngineState export_state() const;

    /**
     * @brief Load a dump into an empty engine
     *
     * Transactions that were ACTIVE in the dump come back ABORTED.
     */
    [[nodiscard]] Status import_state(const EngineState& state);

    /**
     * @brief Close the engine; later calls fail with Status::Error
     */
    void close();

    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] std::string_view name() const noexcept;

private:
    std::unique_ptr<DatabaseImpl> impl_;
};

}  // namespace mvccdb
