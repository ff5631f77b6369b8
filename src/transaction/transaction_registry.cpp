/**
 * @file transaction_registry.cpp
 * @brief Transaction Registry implementation
 */

#include "transaction/transaction_registry.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_set>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"

namespace mvccdb {

TransactionRegistry::TransactionRegistry(SnapshotManager& snapshots, ConflictDetector& detector)
    : snapshots_(snapshots), detector_(detector), next_txn_id_(config::kFirstTransactionId) {}

Status TransactionRegistry::begin(IsolationLevel isolation, txn_id_t* txn_id) {
    if (!is_valid_isolation_level(isolation)) {
        return Status::InvalidIsolation("Unsupported isolation level " +
                                        std::to_string(static_cast<int>(isolation)));
    }

    txn_id_t id = next_txn_id_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Snapshot> snapshot;
    if (isolation == IsolationLevel::REPEATABLE_READ ||
        isolation == IsolationLevel::SERIALIZABLE) {
        snapshot = snapshots_.capture();
    }

    auto txn = std::make_unique<Transaction>(id, isolation, std::chrono::system_clock::now(),
                                             std::move(snapshot));
    {
        std::unique_lock lock(latch_);
        txn_map_.emplace(id, std::move(txn));
    }

    LOG_DEBUG("Transaction {} started ({})", id, isolation_level_to_string(isolation));
    *txn_id = id;
    return Status::Ok();
}

Status TransactionRegistry::commit(txn_id_t txn_id) {
    Transaction* txn = nullptr;
    MVCCDB_RETURN_IF_ERROR(get_active(txn_id, &txn));

    std::set<WriteKey> keys = txn->write_set();
    auto latches = detector_.latch(keys);

    if (detector_.requires_validation(txn->isolation_level())) {
        Status status = detector_.validate(*txn, keys);
        if (!status.ok()) {
            if (!txn->finish(TransactionStatus::ABORTED)) {
                return Status::InvalidTransaction("Transaction " + std::to_string(txn_id) +
                                                  " ended during commit");
            }
            LOG_DEBUG("Transaction {} aborted at commit: {}", txn_id, status.message());
            return status;
        }
    }

    if (!snapshots_.publish_commit(txn)) {
        return Status::InvalidTransaction("Transaction " + std::to_string(txn_id) +
                                          " ended during commit");
    }
    detector_.record_writers(txn_id, keys);

    LOG_DEBUG("Transaction {} committed ({} keys)", txn_id, keys.size());
    return Status::Ok();
}

Status TransactionRegistry::rollback(txn_id_t txn_id) {
    Transaction* txn = nullptr;
    MVCCDB_RETURN_IF_ERROR(get_active(txn_id, &txn));

    if (!txn->finish(TransactionStatus::ABORTED)) {
        return Status::InvalidTransaction("Transaction " + std::to_string(txn_id) +
                                          " is not active");
    }

    LOG_DEBUG("Transaction {} rolled back", txn_id);
    return Status::Ok();
}

Transaction* TransactionRegistry::get_transaction(txn_id_t txn_id) const {
    std::shared_lock lock(latch_);
    auto it = txn_map_.find(txn_id);
    return (it != txn_map_.end()) ? it->second.get() : nullptr;
}

Status TransactionRegistry::get_active(txn_id_t txn_id, Transaction** txn) const {
    Transaction* found = get_transaction(txn_id);
    if (found == nullptr) {
        return Status::InvalidTransaction("Unknown transaction " + std::to_string(txn_id));
    }
    if (!found->is_active()) {
        return Status::InvalidTransaction("Transaction " + std::to_string(txn_id) + " is " +
                                          transaction_status_to_string(found->status()));
    }
    *txn = found;
    return Status::Ok();
}

std::optional<TransactionStatus> TransactionRegistry::status_of(txn_id_t txn_id) const {
    Transaction* txn = get_transaction(txn_id);
    if (txn == nullptr) {
        return std::nullopt;
    }
    return txn->status();
}

bool TransactionRegistry::is_committed(txn_id_t txn_id) const {
    return status_of(txn_id) == TransactionStatus::COMMITTED;
}

bool TransactionRegistry::is_active(txn_id_t txn_id) const {
    return status_of(txn_id) == TransactionStatus::ACTIVE;
}

bool TransactionRegistry::is_aborted(txn_id_t txn_id) const {
    return status_of(txn_id) == TransactionStatus::ABORTED;
}

bool TransactionRegistry::validates_at_commit(txn_id_t txn_id) const {
    Transaction* txn = get_transaction(txn_id);
    return txn != nullptr && detector_.requires_validation(txn->isolation_level());
}

TransactionInfo TransactionRegistry::make_info(const Transaction& txn) {
    TransactionInfo info;
    info.id = txn.txn_id();
    info.isolation = txn.isolation_level();
    info.ended_at = txn.ended_at();
    // Read status after ended_at so an ended transaction never lacks an end time
    info.status = txn.status();
    if (info.status == TransactionStatus::ACTIVE) {
        info.ended_at.reset();
    }
    info.started_at = txn.started_at();
    if (const Snapshot* snapshot = txn.snapshot()) {
        info.has_snapshot = true;
        info.snapshot_size = snapshot->size();
    }
    info.write_set_size = txn.write_set_size();
    return info;
}

Status TransactionRegistry::info(txn_id_t txn_id, TransactionInfo* out) const {
    Transaction* txn = get_transaction(txn_id);
    if (txn == nullptr) {
        return Status::InvalidTransaction("Unknown transaction " + std::to_string(txn_id));
    }
    *out = make_info(*txn);
    return Status::Ok();
}

RegistrySnapshot TransactionRegistry::snapshot_of_registry() const {
    RegistrySnapshot result;
    {
        std::shared_lock lock(latch_);
        for (const auto& [id, txn] : txn_map_) {
            TransactionInfo info = make_info(*txn);
            switch (info.status) {
                case TransactionStatus::ACTIVE:
                    result.active.push_back(std::move(info));
                    break;
                case TransactionStatus::COMMITTED:
                    result.committed.push_back(std::move(info));
                    break;
                case TransactionStatus::ABORTED:
                    result.aborted.push_back(std::move(info));
                    break;
            }
        }
    }

    auto by_id = [](const TransactionInfo& a, const TransactionInfo& b) { return a.id < b.id; };
    std::sort(result.active.begin(), result.active.end(), by_id);
    std::sort(result.committed.begin(), result.committed.end(), by_id);
    std::sort(result.aborted.begin(), result.aborted.end(), by_id);
    return result;
}

void TransactionRegistry::fill_stats(EngineStats* stats) const {
    std::shared_lock lock(latch_);
    stats->total_transactions = txn_map_.size();
    stats->active_transactions = 0;
    stats->committed_transactions = 0;
    stats->aborted_transactions = 0;
    for (const auto& [id, txn] : txn_map_) {
        switch (txn->status()) {
            case TransactionStatus::ACTIVE:
                ++stats->active_transactions;
                break;
            case TransactionStatus::COMMITTED:
                ++stats->committed_transactions;
                break;
            case TransactionStatus::ABORTED:
                ++stats->aborted_transactions;
                break;
        }
    }
    stats->next_txn_id = next_txn_id();
}

size_t TransactionRegistry::size() const {
    std::shared_lock lock(latch_);
    return txn_map_.size();
}

// ─────────────────────────────────────────────────────────────────────────────
// Restore
// ─────────────────────────────────────────────────────────────────────────────

std::vector<TransactionState> TransactionRegistry::export_state() const {
    std::vector<TransactionState> result;
    {
        std::shared_lock lock(latch_);
        result.reserve(txn_map_.size());
        for (const auto& [id, txn] : txn_map_) {
            TransactionState state;
            state.id = id;
            state.isolation = txn->isolation_level();
            state.ended_at = txn->ended_at();
            state.status = txn->status();
            if (state.status == TransactionStatus::ACTIVE) {
                state.ended_at.reset();
            }
            state.started_at = txn->started_at();
            result.push_back(std::move(state));
        }
    }
    std::sort(result.begin(), result.end(),
              [](const TransactionState& a, const TransactionState& b) { return a.id < b.id; });
    return result;
}

Status TransactionRegistry::validate_state(const std::vector<TransactionState>& transactions) {
    std::unordered_set<txn_id_t> seen;
    for (const auto& state : transactions) {
        if (state.id == INVALID_TXN_ID) {
            return Status::Corruption("Transaction id 0 is reserved");
        }
        if (!seen.insert(state.id).second) {
            return Status::Corruption("Transaction " + std::to_string(state.id) +
                                      " appears twice");
        }
        if (!is_valid_isolation_level(state.isolation)) {
            return Status::Corruption("Transaction " + std::to_string(state.id) +
                                      " has an invalid isolation level");
        }
        switch (state.status) {
            case TransactionStatus::ACTIVE:
            case TransactionStatus::COMMITTED:
            case TransactionStatus::ABORTED:
                break;
            default:
                return Status::Corruption("Transaction " + std::to_string(state.id) +
                                          " has an invalid status");
        }
    }
    return Status::Ok();
}

Status TransactionRegistry::import_state(const std::vector<TransactionState>& transactions) {
    MVCCDB_RETURN_IF_ERROR(validate_state(transactions));

    std::unique_lock lock(latch_);
    if (!txn_map_.empty()) {
        return Status::Error("Transaction registry is not empty");
    }

    Timestamp now = std::chrono::system_clock::now();
    txn_id_t max_id = 0;
    std::vector<txn_id_t> committed;

    for (const auto& state : transactions) {
        auto txn = std::make_unique<Transaction>(state.id, state.isolation, state.started_at);
        if (state.status == TransactionStatus::ACTIVE) {
            txn->restore_end(TransactionStatus::ABORTED, now);
        } else {
            txn->restore_end(state.status, state.ended_at.value_or(now));
        }
        if (state.status == TransactionStatus::COMMITTED) {
            committed.push_back(state.id);
        }
        max_id = std::max(max_id, state.id);
        txn_map_.emplace(state.id, std::move(txn));
    }

    snapshots_.reset(std::move(committed));
    next_txn_id_.store(std::max<txn_id_t>(max_id + 1, config::kFirstTransactionId),
                       std::memory_order_relaxed);

    LOG_INFO("Restored {} transactions, next id {}", transactions.size(), next_txn_id());
    return Status::Ok();
}

}  // namespace mvccdb
