/**
 * @file snapshot_manager.cpp
 * @brief Snapshot and SnapshotManager implementation
 */

#include "transaction/snapshot_manager.hpp"

#include <algorithm>

#include "transaction/transaction.hpp"

namespace mvccdb {

bool Snapshot::contains(txn_id_t txn_id) const noexcept {
    return std::binary_search(committed_ids_.begin(), committed_ids_.end(), txn_id);
}

Snapshot SnapshotManager::capture() const {
    std::shared_lock lock(latch_);
    return Snapshot(committed_ids_);
}

bool SnapshotManager::publish_commit(Transaction* txn) {
    std::unique_lock lock(latch_);
    if (!txn->finish(TransactionStatus::COMMITTED)) {
        return false;
    }

    // Commits arrive roughly in id order, so this is usually an append
    txn_id_t id = txn->txn_id();
    auto pos = std::upper_bound(committed_ids_.begin(), committed_ids_.end(), id);
    committed_ids_.insert(pos, id);
    return true;
}

void SnapshotManager::reset(std::vector<txn_id_t> committed_ids) {
    std::sort(committed_ids.begin(), committed_ids.end());
    committed_ids.erase(std::unique(committed_ids.begin(), committed_ids.end()),
                        committed_ids.end());
    std::unique_lock lock(latch_);
    committed_ids_ = std::move(committed_ids);
}

size_t SnapshotManager::committed_count() const {
    std::shared_lock lock(latch_);
    return committed_ids_.size();
}

}  // namespace mvccdb
