#pragma once

/**
 * @file version_store.hpp
 * @brief Per-table store of record version chains
 */

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

#include "common/config.hpp"
#include "storage/version.hpp"

namespace mvccdb {

/**
 * @brief Owns the version chains of one table
 *
 * Chains are created on first write and never removed while the table
 * exists. Record ids iterate in ascending order.
 *
 * Thread safety: all methods are thread-safe. The chain map is guarded by a
 * reader-writer latch held only for lookups and chain creation.
 */
class VersionStore {
public:
  VersionStore() = default;

  VersionStore(const VersionStore &) = delete;
  VersionStore &operator=(const VersionStore &) = delete;

  /**
   * @brief Append a version to a record's chain, creating the chain if needed
   */
  Version *append(record_id_t record_id, std::vector<Value> values,
                  txn_id_t created_by, Timestamp created_at,
                  txn_id_t deleted_by = INVALID_TXN_ID);

  /**
   * @brief Append unless the chain's newest version changed since expected
   *
   * Creates the chain if needed; an absent chain matches expected == nullptr.
   * @return nullptr if the newest version is no longer expected
   */
  Version *append_if_newest(record_id_t record_id, const Version *expected,
                            std::vector<Value> values, txn_id_t created_by,
                            Timestamp created_at);

  /**
   * @brief Chain for a record, or nullptr if the record was never written
   */
  [[nodiscard]] VersionChain *get_chain(record_id_t record_id) const;

  /**
   * @brief All chains in ascending record-id order
   */
  [[nodiscard]] std::vector<VersionChain *> chains() const;

  [[nodiscard]] size_t chain_count() const;

  [[nodiscard]] size_t version_count() const noexcept {
    return version_count_.load(std::memory_order_relaxed);
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Record Id Allocation
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Hand out the next unused record id
   */
  [[nodiscard]] record_id_t allocate_record_id() noexcept;

  /**
   * @brief Note a caller-chosen record id so allocation never returns it
   */
  void observe_record_id(record_id_t record_id) noexcept;

  [[nodiscard]] record_id_t next_record_id() const noexcept {
    return next_record_id_.load(std::memory_order_relaxed);
  }

  void set_next_record_id(record_id_t next) noexcept {
    next_record_id_.store(next, std::memory_order_relaxed);
  }

private:
  VersionChain *get_or_create_chain(record_id_t record_id);

  std::map<record_id_t, std::unique_ptr<VersionChain>> chains_;
  mutable std::shared_mutex latch_;
  std::atomic<size_t> version_count_{0};
  std::atomic<record_id_t> next_record_id_{config::kFirstRecordId};
};

}  // namespace mvccdb
