#pragma once

/**
 * @file conflict_detector.hpp
 * @brief First-committer-wins validation for snapshot-isolated commits
 *
 * The detector remembers, per (table, record_id) key, every transaction that
 * committed a write to it. A snapshot-isolated transaction may commit only if
 * no other transaction outside its snapshot committed a write to any key in
 * its write set.
 *
 * Committers latch exactly their write-set keys in ascending key order for
 * the duration of validate-and-publish. This is the only cross-transaction
 * exclusion in the engine; transactions with disjoint write sets never
 * contend.
 */

#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"
#include "mvccdb/status.hpp"

namespace mvccdb {

class Transaction;

class ConflictDetector {
public:
  /**
   * @param check_repeatable_read Validate REPEATABLE_READ commits as well as
   *        SERIALIZABLE ones
   */
  explicit ConflictDetector(bool check_repeatable_read = true)
      : check_repeatable_read_(check_repeatable_read) {}

  ConflictDetector(const ConflictDetector &) = delete;
  ConflictDetector &operator=(const ConflictDetector &) = delete;

  /**
   * @brief Latches held on a set of keys, released on destruction
   */
  class KeyLatches {
  public:
    KeyLatches() = default;
    KeyLatches(KeyLatches &&) noexcept = default;
    KeyLatches &operator=(KeyLatches &&) noexcept = default;

  private:
    friend class ConflictDetector;
    std::vector<std::unique_lock<std::mutex>> locks_;
  };

  /**
   * @brief Whether commits at this isolation level are validated
   */
  [[nodiscard]] bool requires_validation(IsolationLevel level) const noexcept;

  /**
   * @brief Latch the given keys in ascending order
   */
  [[nodiscard]] KeyLatches latch(const std::set<WriteKey> &keys);

  /**
   * @brief Check the keys against the committed writers outside txn's snapshot
   * @note Caller must hold the latches for keys
   * @return Status::SerializationConflict naming the first conflicting key
   */
  [[nodiscard]] Status validate(const Transaction &txn,
                                const std::set<WriteKey> &keys) const;

  /**
   * @brief Record txn as a committed writer of keys
   * @note Caller must hold the latches for keys
   */
  void record_writers(txn_id_t txn_id, const std::set<WriteKey> &keys);

  /// Number of keys ever committed or latched
  [[nodiscard]] size_t tracked_key_count() const;

private:
  struct KeyState {
    std::mutex latch;
    std::vector<txn_id_t> writers;  ///< Guarded by latch
  };

  [[nodiscard]] KeyState *get_or_create(const WriteKey &key);
  [[nodiscard]] KeyState *find(const WriteKey &key) const;

  const bool check_repeatable_read_;
  std::unordered_map<WriteKey, std::unique_ptr<KeyState>> keys_;
  mutable std::shared_mutex map_latch_;
};

} // namespace mvccdb
