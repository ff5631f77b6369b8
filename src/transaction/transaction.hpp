#pragma once

/**
 * @file transaction.hpp
 * @brief Transaction object with status machine and write set tracking
 *
 * Transactions follow a three-state machine:
 *   ACTIVE -> COMMITTED | ABORTED
 *
 * ACTIVE is the only state in which a transaction may read or write.
 * COMMITTED and ABORTED are terminal; the move out of ACTIVE happens once,
 * by compare-and-swap, so concurrent commit and rollback calls cannot both
 * succeed.
 */

#include <atomic>
#include <mutex>
#include <optional>
#include <set>

#include "common/types.hpp"
#include "transaction/snapshot_manager.hpp"

namespace mvccdb {

/**
 * @brief Represents a transaction
 *
 * Each transaction has:
 * - A unique transaction ID, never reused
 * - An isolation level fixed at begin
 * - A status (ACTIVE, COMMITTED, ABORTED)
 * - A snapshot of committed ids (REPEATABLE_READ and SERIALIZABLE only)
 * - A write set of (table, record_id) keys, consulted at commit
 *
 * Thread safety: status is atomic; the write set and end time are guarded
 * by the transaction's own mutex.
 */
class Transaction {
public:
    /**
     * @brief Create a new ACTIVE transaction
     * @param txn_id Unique transaction identifier
     * @param isolation Isolation level
     * @param started_at Begin time
     * @param snapshot Committed set frozen at begin, if the level uses one
     */
    Transaction(txn_id_t txn_id, IsolationLevel isolation, Timestamp started_at,
                std::optional<Snapshot> snapshot = std::nullopt);

    ~Transaction() = default;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Accessors
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] txn_id_t txn_id() const noexcept { return txn_id_; }
    [[nodiscard]] IsolationLevel isolation_level() const noexcept { return isolation_level_; }
    [[nodiscard]] Timestamp started_at() const noexcept { return started_at_; }

    [[nodiscard]] TransactionStatus status() const noexcept {
        return status_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_active() const noexcept {
        return status() == TransactionStatus::ACTIVE;
    }

    [[nodiscard]] std::optional<Timestamp> ended_at() const;

    /**
     * @brief Snapshot frozen at begin, or nullptr for READ_UNCOMMITTED and
     *        READ_COMMITTED
     */
    [[nodiscard]] const Snapshot* snapshot() const noexcept {
        return snapshot_ ? &*snapshot_ : nullptr;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // State Management
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Leave ACTIVE for a terminal status and record the end time
     * @note Should only be called by TransactionRegistry and SnapshotManager
     * @return false if the transaction had already ended
     */
    [[nodiscard]] bool finish(TransactionStatus terminal);

    /**
     * @brief Force a terminal status and end time (restore only)
     */
    void restore_end(TransactionStatus terminal, std::optional<Timestamp> ended_at);

    // ─────────────────────────────────────────────────────────────────────────
    // Write Set Management
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Record that this transaction wrote a key
     */
    void add_write(const WriteKey& key);

    /**
     * @brief Copy of the write set in latch order
     */
    [[nodiscard]] std::set<WriteKey> write_set() const;

    [[nodiscard]] size_t write_set_size() const;

private:
    const txn_id_t txn_id_;
    const IsolationLevel isolation_level_;
    const Timestamp started_at_;
    const std::optional<Snapshot> snapshot_;

    std::atomic<TransactionStatus> status_{TransactionStatus::ACTIVE};

    mutable std::mutex mutex_;
    std::optional<Timestamp> ended_at_;
    std::set<WriteKey> write_set_;
};

}  // namespace mvccdb
