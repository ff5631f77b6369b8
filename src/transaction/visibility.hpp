#pragma once

/**
 * @file visibility.hpp
 * @brief Per-isolation-level version visibility
 *
 * A transaction T judges, for each record, the newest version V of the chain
 * whose creator T can see. That version alone decides: the record is visible
 * as V when V passes T's isolation predicate, and invisible otherwise. Older
 * versions are never consulted once a newer one has a visible creator.
 *
 * READ_UNCOMMITTED:
 *   V.deleted_by is none. Uncommitted writes of ACTIVE transactions count;
 *   anything done by an ABORTED transaction does not.
 *
 * READ_COMMITTED:
 *   (V.created_by == T OR creator COMMITTED) AND
 *   (V.deleted_by is none OR (V.deleted_by != T AND deleter not COMMITTED))
 *
 * REPEATABLE_READ / SERIALIZABLE:
 *   The READ_COMMITTED predicate with "COMMITTED" replaced by "in T's
 *   snapshot".
 */

#include "common/types.hpp"
#include "storage/version.hpp"

namespace mvccdb {

class Transaction;
class TransactionRegistry;

class VisibilityResolver {
public:
  explicit VisibilityResolver(const TransactionRegistry &registry)
      : registry_(registry) {}

  /**
   * @brief Newest version of the chain visible to txn at its own level
   * @return nullptr if the record is invisible to txn
   */
  [[nodiscard]] Version *visible_version(const Transaction &txn,
                                         VersionChain &chain) const;

  /**
   * @brief Newest version of the chain visible to txn at the given level
   */
  [[nodiscard]] Version *visible_version(const Transaction &txn,
                                         VersionChain &chain,
                                         IsolationLevel level) const;

  /**
   * @brief Check a single version against the predicate for level
   */
  [[nodiscard]] bool is_visible(const Version &version, const Transaction &txn,
                                IsolationLevel level) const;

private:
  /// kSkip: creator not visible. kHidden: creator visible, deletion too.
  enum class Verdict { kSkip, kVisible, kHidden };

  [[nodiscard]] Verdict judge(const Version &version, const Transaction &txn,
                              IsolationLevel level) const;
  [[nodiscard]] Verdict judge_read_uncommitted(const Version &version) const;
  [[nodiscard]] Verdict judge_read_committed(const Version &version,
                                             const Transaction &txn) const;
  [[nodiscard]] Verdict judge_in_snapshot(const Version &version,
                                          const Transaction &txn) const;

  const TransactionRegistry &registry_;
};

} // namespace mvccdb
