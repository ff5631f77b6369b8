#pragma once

/**
 * @file transaction_registry.hpp
 * @brief Transaction lifecycle management
 *
 * The TransactionRegistry is responsible for:
 * 1. Allocating transaction ids (monotonic, never reused)
 * 2. Creating transactions and capturing snapshots for snapshot levels
 * 3. Coordinating commit (conflict validation) and rollback
 * 4. Answering status lookups for visibility checks
 *
 * Ended transactions stay in the registry for the life of the engine, since
 * version chains keep referring to their ids.
 */

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"
#include "mvccdb/engine_state.hpp"
#include "mvccdb/status.hpp"
#include "mvccdb/transaction_info.hpp"
#include "transaction/conflict_detector.hpp"
#include "transaction/snapshot_manager.hpp"
#include "transaction/transaction.hpp"

namespace mvccdb {

/**
 * @brief Manages transaction lifecycle
 *
 * Thread safety: All public methods are thread-safe.
 */
class TransactionRegistry {
public:
    TransactionRegistry(SnapshotManager& snapshots, ConflictDetector& detector);
    ~TransactionRegistry() = default;

    // Non-copyable
    TransactionRegistry(const TransactionRegistry&) = delete;
    TransactionRegistry& operator=(const TransactionRegistry&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Transaction Operations
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Begin a new transaction
     * @param isolation Isolation level for the transaction
     * @param txn_id Receives the new id
     * @return Status::InvalidIsolation for an out-of-range level
     */
    [[nodiscard]] Status begin(IsolationLevel isolation, txn_id_t* txn_id);

    /**
     * @brief Commit a transaction
     *
     * This method:
     * 1. Latches the write-set keys in ascending order
     * 2. Validates them for snapshot levels (first committer wins)
     * 3. Publishes COMMITTED and records the transaction as a writer
     * 4. Releases the latches
     *
     * @return Status::SerializationConflict (transaction ends ABORTED) or
     *         Status::InvalidTransaction (unknown or not ACTIVE)
     */
    [[nodiscard]] Status commit(txn_id_t txn_id);

    /**
     * @brief Roll back a transaction
     *
     * Marks it ABORTED immediately; no version is touched, since visibility
     * ignores everything an aborted transaction did. Never blocks on other
     * transactions.
     */
    [[nodiscard]] Status rollback(txn_id_t txn_id);

    // ─────────────────────────────────────────────────────────────────────────
    // Transaction Query
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Get a transaction by ID
     * @return Pointer to transaction or nullptr if not found
     */
    [[nodiscard]] Transaction* get_transaction(txn_id_t txn_id) const;

    /**
     * @brief Get a transaction that must be ACTIVE
     * @return Status::InvalidTransaction if unknown or ended
     */
    [[nodiscard]] Status get_active(txn_id_t txn_id, Transaction** txn) const;

    [[nodiscard]] std::optional<TransactionStatus> status_of(txn_id_t txn_id) const;

    /// Unknown ids are neither committed, active nor aborted
    [[nodiscard]] bool is_committed(txn_id_t txn_id) const;
    [[nodiscard]] bool is_active(txn_id_t txn_id) const;
    [[nodiscard]] bool is_aborted(txn_id_t txn_id) const;

    /**
     * @brief Whether commit will validate this transaction's write set
     *
     * False for unknown ids.
     */
    [[nodiscard]] bool validates_at_commit(txn_id_t txn_id) const;

    [[nodiscard]] Status info(txn_id_t txn_id, TransactionInfo* out) const;

    /**
     * @brief Every transaction grouped by status, ascending id within a group
     */
    [[nodiscard]] RegistrySnapshot snapshot_of_registry() const;

    /**
     * @brief Fill the transaction counters of stats
     */
    void fill_stats(EngineStats* stats) const;

    [[nodiscard]] txn_id_t next_txn_id() const noexcept {
        return next_txn_id_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t size() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Restore
    // ─────────────────────────────────────────────────────────────────────────

    /// All transactions in ascending id order
    [[nodiscard]] std::vector<TransactionState> export_state() const;

    /**
     * @brief Check a transaction dump without applying it
     * @return Status::Corruption for zero or repeated ids and invalid enums
     */
    [[nodiscard]] static Status validate_state(const std::vector<TransactionState>& transactions);

    /**
     * @brief Load a dump into an empty registry
     *
     * ACTIVE transactions come back ABORTED. Id allocation resumes after the
     * largest restored id.
     */
    [[nodiscard]] Status import_state(const std::vector<TransactionState>& transactions);

private:
    [[nodiscard]] static TransactionInfo make_info(const Transaction& txn);

    SnapshotManager& snapshots_;
    ConflictDetector& detector_;

    std::unordered_map<txn_id_t, std::unique_ptr<Transaction>> txn_map_;
    mutable std::shared_mutex latch_;
    std::atomic<txn_id_t> next_txn_id_;
};

}  // namespace mvccdb
