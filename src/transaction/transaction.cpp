/**
 * @file transaction.cpp
 * @brief Transaction implementation
 */

#include "transaction/transaction.hpp"

#include <chrono>

namespace mvccdb {

Transaction::Transaction(txn_id_t txn_id, IsolationLevel isolation, Timestamp started_at,
                         std::optional<Snapshot> snapshot)
    : txn_id_(txn_id)
    , isolation_level_(isolation)
    , started_at_(started_at)
    , snapshot_(std::move(snapshot)) {}

std::optional<Timestamp> Transaction::ended_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ended_at_;
}

bool Transaction::finish(TransactionStatus terminal) {
    std::lock_guard<std::mutex> lock(mutex_);
    TransactionStatus expected = TransactionStatus::ACTIVE;
    if (!status_.compare_exchange_strong(expected, terminal, std::memory_order_acq_rel)) {
        return false;
    }
    ended_at_ = std::chrono::system_clock::now();
    return true;
}

void Transaction::restore_end(TransactionStatus terminal, std::optional<Timestamp> ended_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.store(terminal, std::memory_order_release);
    ended_at_ = ended_at;
}

void Transaction::add_write(const WriteKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_set_.insert(key);
}

std::set<WriteKey> Transaction::write_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_set_;
}

size_t Transaction::write_set_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_set_.size();
}

}  // namespace mvccdb
