#pragma once

/**
 * @file version.hpp
 * @brief Record versions and per-record version chains
 *
 * Every write appends an immutable Version to its record's chain. The only
 * field that changes after publication is the deletion marker, which moves
 * by compare-and-swap.
 */

#include <atomic>
#include <deque>
#include <shared_mutex>
#include <vector>

#include "common/types.hpp"
#include "mvccdb/result.hpp"

namespace mvccdb {

// ─────────────────────────────────────────────────────────────────────────────
// Version
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief One version of a record
 */
struct Version {
  Version(record_id_t id, std::vector<Value> vals, txn_id_t creator,
          Timestamp at, txn_id_t deleter = INVALID_TXN_ID)
      : record_id(id), values(std::move(vals)), created_by(creator),
        created_at(at), deleted_by(deleter) {}

  Version(const Version &) = delete;
  Version &operator=(const Version &) = delete;

  const record_id_t record_id;
  const std::vector<Value> values;  ///< In schema column order
  const txn_id_t created_by;
  const Timestamp created_at;

  /// Transaction that deleted or superseded this version (INVALID_TXN_ID if none)
  std::atomic<txn_id_t> deleted_by;

  [[nodiscard]] txn_id_t deleter() const noexcept {
    return deleted_by.load(std::memory_order_acquire);
  }

  /**
   * @brief Move the deletion marker from expected to txn_id
   * @return false if the marker no longer holds expected
   */
  [[nodiscard]] bool claim(txn_id_t expected, txn_id_t txn_id) noexcept {
    return deleted_by.compare_exchange_strong(expected, txn_id,
                                              std::memory_order_acq_rel);
  }
};

// ─────────────────────────────────────────────────────────────────────────────
// VersionChain
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief All versions of a single record, oldest first
 *
 * Versions live in a deque so their addresses survive later appends; a
 * pointer obtained from the chain stays valid for the chain's lifetime.
 * Thread safety: all methods are thread-safe.
 */
class VersionChain {
public:
  explicit VersionChain(record_id_t record_id) : record_id_(record_id) {}

  VersionChain(const VersionChain &) = delete;
  VersionChain &operator=(const VersionChain &) = delete;

  [[nodiscard]] record_id_t record_id() const noexcept { return record_id_; }

  /**
   * @brief Append a new newest version
   */
  Version *append(std::vector<Value> values, txn_id_t created_by,
                  Timestamp created_at,
                  txn_id_t deleted_by = INVALID_TXN_ID);

  /**
   * @brief Append only if the newest version is still expected
   * @param expected Newest version the caller checked, nullptr for empty
   * @return The new version, or nullptr if another append came first
   */
  Version *append_if_newest(const Version *expected, std::vector<Value> values,
                            txn_id_t created_by, Timestamp created_at);

  /**
   * @brief Versions currently in the chain, newest first
   */
  [[nodiscard]] std::vector<Version *> newest_first();

  /**
   * @brief The newest version, or nullptr for an empty chain
   */
  [[nodiscard]] Version *newest();

  [[nodiscard]] size_t size() const;

private:
  record_id_t record_id_;
  std::deque<Version> versions_;
  mutable std::shared_mutex latch_;
};

}  // namespace mvccdb
