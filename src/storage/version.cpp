/**
 * @file version.cpp
 * @brief VersionChain implementation
 */

#include "storage/version.hpp"

#include <mutex>

namespace mvccdb {

Version *VersionChain::append(std::vector<Value> values, txn_id_t created_by,
                              Timestamp created_at, txn_id_t deleted_by) {
  std::unique_lock lock(latch_);
  versions_.emplace_back(record_id_, std::move(values), created_by, created_at,
                         deleted_by);
  return &versions_.back();
}

Version *VersionChain::append_if_newest(const Version *expected,
                                        std::vector<Value> values,
                                        txn_id_t created_by,
                                        Timestamp created_at) {
  std::unique_lock lock(latch_);
  const Version *current = versions_.empty() ? nullptr : &versions_.back();
  if (current != expected) {
    return nullptr;
  }
  versions_.emplace_back(record_id_, std::move(values), created_by, created_at);
  return &versions_.back();
}

std::vector<Version *> VersionChain::newest_first() {
  std::shared_lock lock(latch_);
  std::vector<Version *> result;
  result.reserve(versions_.size());
  for (auto it = versions_.rbegin(); it != versions_.rend(); ++it) {
    result.push_back(&*it);
  }
  return result;
}

Version *VersionChain::newest() {
  std::shared_lock lock(latch_);
  if (versions_.empty()) {
    return nullptr;
  }
  return &versions_.back();
}

size_t VersionChain::size() const {
  std::shared_lock lock(latch_);
  return versions_.size();
}

}  // namespace mvccdb
