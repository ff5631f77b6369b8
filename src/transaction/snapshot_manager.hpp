#pragma once

/**
 * @file snapshot_manager.hpp
 * @brief Committed-transaction snapshots for snapshot-isolated transactions
 *
 * A Snapshot is the set of transaction ids that were COMMITTED at the
 * instant a REPEATABLE_READ or SERIALIZABLE transaction began. It is frozen
 * for the life of the transaction and replaces "is committed" in visibility
 * and conflict checks.
 */

#include <mutex>
#include <shared_mutex>
#include <vector>

#include "common/types.hpp"

namespace mvccdb {

class Transaction;

// ─────────────────────────────────────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────────────────────────────────────

class Snapshot {
public:
    Snapshot() = default;

    /// @param committed_ids Sorted ascending, no duplicates
    explicit Snapshot(std::vector<txn_id_t> committed_ids)
        : committed_ids_(std::move(committed_ids)) {}

    [[nodiscard]] bool contains(txn_id_t txn_id) const noexcept;

    [[nodiscard]] size_t size() const noexcept { return committed_ids_.size(); }

    [[nodiscard]] const std::vector<txn_id_t>& committed_ids() const noexcept {
        return committed_ids_;
    }

private:
    std::vector<txn_id_t> committed_ids_;
};

// ─────────────────────────────────────────────────────────────────────────────
// SnapshotManager
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Tracks the committed set and hands out snapshots of it
 *
 * Publishing a commit and capturing a snapshot exclude each other, so a
 * transaction is either in a snapshot and already COMMITTED, or absent from
 * it.
 *
 * Thread safety: all methods are thread-safe.
 */
class SnapshotManager {
public:
    SnapshotManager() = default;

    SnapshotManager(const SnapshotManager&) = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    /**
     * @brief Freeze the current committed set
     */
    [[nodiscard]] Snapshot capture() const;

    /**
     * @brief Move an ACTIVE transaction to COMMITTED and add it to the set
     * @return false if the transaction was no longer ACTIVE
     */
    [[nodiscard]] bool publish_commit(Transaction* txn);

    /**
     * @brief Replace the committed set (restore into an empty engine)
     */
    void reset(std::vector<txn_id_t> committed_ids);

    [[nodiscard]] size_t committed_count() const;

private:
    std::vector<txn_id_t> committed_ids_;  ///< Sorted ascending
    mutable std::shared_mutex latch_;
};

}  // namespace mvccdb
