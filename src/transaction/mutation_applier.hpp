#pragma once

/**
 * @file mutation_applier.hpp
 * @brief Insert, update and delete as version-chain operations
 *
 * Writers locate their target with the READ_COMMITTED predicate whatever
 * their own isolation level: the newest version that is committed (or their
 * own) and not deleted by a committed transaction. A snapshot transaction
 * that writes a version newer than its snapshot is caught at commit by the
 * ConflictDetector.
 *
 * - insert appends a first live version
 * - update claims the located version's deletion marker and appends a new
 *   version with the assignments applied to the located values
 * - delete claims the marker and appends nothing
 *
 * A marker held by another ACTIVE transaction is never overwritten; the
 * statement fails with Status::WriteConflict before writing anything. The one
 * exception is an update where both transactions validate at commit: the
 * update appends its version and the commit-time check aborts one of them.
 * insert likewise conflicts with a live version another ACTIVE transaction is
 * still inserting.
 */

#include <optional>

#include "catalog/catalog.hpp"
#include "mvccdb/predicate.hpp"
#include "transaction/transaction.hpp"
#include "transaction/visibility.hpp"

namespace mvccdb {

class TransactionRegistry;

class MutationApplier {
public:
  MutationApplier(const TransactionRegistry &registry,
                  const VisibilityResolver &resolver)
      : registry_(registry), resolver_(resolver) {}

  MutationApplier(const MutationApplier &) = delete;
  MutationApplier &operator=(const MutationApplier &) = delete;

  /**
   * @brief Insert a record
   * @param record_id Key to use; allocated from the table when absent
   * @param values Column assignments, unassigned columns are NULL
   * @param affected Receives 1 on success
   * @return Status::DuplicateKey if the key has a live visible version,
   *         Status::WriteConflict if another ACTIVE transaction is inserting it
   */
  [[nodiscard]] Status insert(Transaction *txn, const TableInfo &table,
                              std::optional<record_id_t> record_id,
                              const ColumnValues &values, size_t *affected);

  /**
   * @brief Update one record (record_id set) or every matching record
   * @return Status::RecordNotFound if record_id has no version to update,
   *         Status::WriteConflict if another ACTIVE transaction holds a
   *         target's deletion marker
   */
  [[nodiscard]] Status update(Transaction *txn, const TableInfo &table,
                              std::optional<record_id_t> record_id,
                              const ColumnValues &values,
                              const Predicate *predicate, size_t *affected);

  /**
   * @brief Delete one record (record_id set) or every matching record
   * @return Status::RecordNotFound if record_id has no version to delete,
   *         Status::WriteConflict if another ACTIVE transaction holds a
   *         target's deletion marker
   */
  [[nodiscard]] Status remove(Transaction *txn, const TableInfo &table,
                              std::optional<record_id_t> record_id,
                              const Predicate *predicate, size_t *affected);

  /**
   * @brief The version a writer would act on (READ_COMMITTED rules)
   */
  [[nodiscard]] Version *locate(const Transaction &txn,
                                VersionChain &chain) const;

private:
  enum class Claim { kClaimed, kHeldByActive, kStale };

  struct Target {
    VersionChain *chain;
    Version *version;
  };

  /// Try to take over the deletion marker of version
  [[nodiscard]] Claim claim(Version *version, txn_id_t txn_id) const;

  /// An update may append past holder's marker
  [[nodiscard]] bool may_supersede(const Transaction &txn,
                                   txn_id_t holder) const;

  /// WriteConflict if any target's marker is held by another ACTIVE writer
  [[nodiscard]] Status check_markers(const Transaction &txn,
                                     const TableInfo &table,
                                     const std::vector<Target> &targets,
                                     bool updating) const;

  /// Targets for update/remove in ascending record-id order
  [[nodiscard]] Status collect_targets(const Transaction &txn,
                                       const TableInfo &table,
                                       std::optional<record_id_t> record_id,
                                       const Predicate *predicate,
                                       std::vector<Target> *targets) const;

  /**
   * @brief Update (assignments set) or delete one target
   * @param applied Set when a write happened; false if the record vanished
   */
  [[nodiscard]] Status write_record(Transaction *txn, const TableInfo &table,
                                    Target target,
                                    const ColumnValues *assignments,
                                    const Predicate *predicate, bool *applied);

  const TransactionRegistry &registry_;
  const VisibilityResolver &resolver_;
};

} // namespace mvccdb
