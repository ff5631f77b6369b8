/**
 * @file conflict_detector.cpp
 * @brief ConflictDetector implementation
 */

#include "transaction/conflict_detector.hpp"

#include "common/logger.hpp"
#include "transaction/transaction.hpp"

namespace mvccdb {

bool ConflictDetector::requires_validation(IsolationLevel level) const noexcept {
  switch (level) {
  case IsolationLevel::SERIALIZABLE:
    return true;
  case IsolationLevel::REPEATABLE_READ:
    return check_repeatable_read_;
  default:
    return false;
  }
}

ConflictDetector::KeyState *ConflictDetector::find(const WriteKey &key) const {
  std::shared_lock lock(map_latch_);
  auto it = keys_.find(key);
  return it != keys_.end() ? it->second.get() : nullptr;
}

ConflictDetector::KeyState *
ConflictDetector::get_or_create(const WriteKey &key) {
  if (KeyState *state = find(key)) {
    return state;
  }
  std::unique_lock lock(map_latch_);
  auto &slot = keys_[key];
  if (!slot) {
    slot = std::make_unique<KeyState>();
  }
  return slot.get();
}

ConflictDetector::KeyLatches
ConflictDetector::latch(const std::set<WriteKey> &keys) {
  KeyLatches latches;
  latches.locks_.reserve(keys.size());
  // std::set iterates in ascending order, which every committer shares
  for (const auto &key : keys) {
    latches.locks_.emplace_back(get_or_create(key)->latch);
  }
  return latches;
}

Status ConflictDetector::validate(const Transaction &txn,
                                  const std::set<WriteKey> &keys) const {
  const Snapshot *snapshot = txn.snapshot();
  for (const auto &key : keys) {
    KeyState *state = find(key);
    if (state == nullptr) {
      continue;
    }
    for (txn_id_t writer : state->writers) {
      if (writer == txn.txn_id()) {
        continue;
      }
      if (snapshot != nullptr && snapshot->contains(writer)) {
        continue;
      }
      LOG_DEBUG("Transaction {} conflicts with {} on {}.{}", txn.txn_id(),
                writer, key.table, key.record_id);
      return Status::SerializationConflict(
          "Transaction " + std::to_string(txn.txn_id()) +
          " conflicts with committed transaction " + std::to_string(writer) +
          " on " + key.table + "." + std::to_string(key.record_id));
    }
  }
  return Status::Ok();
}

void ConflictDetector::record_writers(txn_id_t txn_id,
                                      const std::set<WriteKey> &keys) {
  for (const auto &key : keys) {
    KeyState *state = find(key);
    if (state != nullptr) {
      state->writers.push_back(txn_id);
    }
  }
}

size_t ConflictDetector::tracked_key_count() const {
  std::shared_lock lock(map_latch_);
  return keys_.size();
}

} // namespace mvccdb
