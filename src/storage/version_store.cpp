/**
 * @file version_store.cpp
 * @brief VersionStore implementation
 */

#include "storage/version_store.hpp"

#include <mutex>

namespace mvccdb {

VersionChain *VersionStore::get_or_create_chain(record_id_t record_id) {
  VersionChain *chain = get_chain(record_id);
  if (chain == nullptr) {
    std::unique_lock lock(latch_);
    auto &slot = chains_[record_id];
    if (!slot) {
      slot = std::make_unique<VersionChain>(record_id);
    }
    chain = slot.get();
  }
  return chain;
}

Version *VersionStore::append(record_id_t record_id, std::vector<Value> values,
                              txn_id_t created_by, Timestamp created_at,
                              txn_id_t deleted_by) {
  VersionChain *chain = get_or_create_chain(record_id);
  Version *version =
      chain->append(std::move(values), created_by, created_at, deleted_by);
  version_count_.fetch_add(1, std::memory_order_relaxed);
  return version;
}

Version *VersionStore::append_if_newest(record_id_t record_id,
                                        const Version *expected,
                                        std::vector<Value> values,
                                        txn_id_t created_by,
                                        Timestamp created_at) {
  VersionChain *chain = get_or_create_chain(record_id);
  Version *version = chain->append_if_newest(expected, std::move(values),
                                             created_by, created_at);
  if (version != nullptr) {
    version_count_.fetch_add(1, std::memory_order_relaxed);
  }
  return version;
}

VersionChain *VersionStore::get_chain(record_id_t record_id) const {
  std::shared_lock lock(latch_);
  auto it = chains_.find(record_id);
  return it != chains_.end() ? it->second.get() : nullptr;
}

std::vector<VersionChain *> VersionStore::chains() const {
  std::shared_lock lock(latch_);
  std::vector<VersionChain *> result;
  result.reserve(chains_.size());
  for (const auto &[id, chain] : chains_) {
    result.push_back(chain.get());
  }
  return result;
}

size_t VersionStore::chain_count() const {
  std::shared_lock lock(latch_);
  return chains_.size();
}

record_id_t VersionStore::allocate_record_id() noexcept {
  return next_record_id_.fetch_add(1, std::memory_order_relaxed);
}

void VersionStore::observe_record_id(record_id_t record_id) noexcept {
  record_id_t current = next_record_id_.load(std::memory_order_relaxed);
  while (record_id >= current &&
         !next_record_id_.compare_exchange_weak(current, record_id + 1,
                                                std::memory_order_relaxed)) {
  }
}

}  // namespace mvccdb
