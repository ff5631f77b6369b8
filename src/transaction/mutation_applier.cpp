/**
 * @file mutation_applier.cpp
 * @brief MutationApplier implementation
 */

#include "transaction/mutation_applier.hpp"

#include <chrono>

#include "common/status.hpp"
#include "transaction/transaction_registry.hpp"

namespace mvccdb {

namespace {

std::string describe(const TableInfo &table, record_id_t record_id) {
  return table.name + "." + std::to_string(record_id);
}

Row make_row(const TableInfo &table, const Version &version) {
  return Row(version.record_id, version.values, table.schema.column_names());
}

} // namespace

Version *MutationApplier::locate(const Transaction &txn,
                                 VersionChain &chain) const {
  return resolver_.visible_version(txn, chain,
                                   IsolationLevel::READ_COMMITTED);
}

MutationApplier::Claim MutationApplier::claim(Version *version,
                                              txn_id_t txn_id) const {
  for (;;) {
    txn_id_t marker = version->deleter();
    if (marker == INVALID_TXN_ID || registry_.is_aborted(marker)) {
      if (version->claim(marker, txn_id)) {
        return Claim::kClaimed;
      }
      continue;
    }
    if (marker != txn_id && registry_.is_active(marker)) {
      return Claim::kHeldByActive;
    }
    // Deleted by a transaction that has since committed, or by ourselves
    return Claim::kStale;
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Insert
// ─────────────────────────────────────────────────────────────────────────────

Status MutationApplier::insert(Transaction *txn, const TableInfo &table,
                               std::optional<record_id_t> record_id,
                               const ColumnValues &values, size_t *affected) {
  std::vector<Value> row(table.schema.column_count());
  MVCCDB_RETURN_IF_ERROR(table.schema.apply(values, &row));

  VersionStore &store = *table.store;
  record_id_t id;
  if (record_id.has_value()) {
    id = *record_id;
    store.observe_record_id(id);
  } else {
    id = store.allocate_record_id();
  }

  for (;;) {
    VersionChain *chain = store.get_chain(id);
    Version *newest = chain != nullptr ? chain->newest() : nullptr;
    if (chain != nullptr && locate(*txn, *chain) != nullptr) {
      return Status::DuplicateKey("Record " + describe(table, id) +
                                  " already exists");
    }
    if (newest != nullptr && newest->created_by != txn->txn_id() &&
        newest->deleter() == INVALID_TXN_ID &&
        registry_.is_active(newest->created_by)) {
      return Status::WriteConflict("Record " + describe(table, id) +
                                   " is being inserted by transaction " +
                                   std::to_string(newest->created_by));
    }
    if (store.append_if_newest(id, newest, row, txn->txn_id(),
                               std::chrono::system_clock::now()) != nullptr) {
      break;
    }
  }

  txn->add_write(WriteKey(table.name, id));
  *affected = 1;
  return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Update / Delete
// ─────────────────────────────────────────────────────────────────────────────

bool MutationApplier::may_supersede(const Transaction &txn,
                                    txn_id_t holder) const {
  // Commit validation rejects one of two validated writers of the same key
  return registry_.validates_at_commit(txn.txn_id()) &&
         registry_.validates_at_commit(holder);
}

Status MutationApplier::check_markers(const Transaction &txn,
                                      const TableInfo &table,
                                      const std::vector<Target> &targets,
                                      bool updating) const {
  for (const auto &target : targets) {
    txn_id_t marker = target.version->deleter();
    if (marker == INVALID_TXN_ID || marker == txn.txn_id() ||
        !registry_.is_active(marker)) {
      continue;
    }
    if (updating && may_supersede(txn, marker)) {
      continue;
    }
    return Status::WriteConflict(
        "Record " + describe(table, target.version->record_id) +
        " is being written by transaction " + std::to_string(marker));
  }
  return Status::Ok();
}

Status MutationApplier::collect_targets(const Transaction &txn,
                                        const TableInfo &table,
                                        std::optional<record_id_t> record_id,
                                        const Predicate *predicate,
                                        std::vector<Target> *targets) const {
  if (record_id.has_value()) {
    VersionChain *chain = table.store->get_chain(*record_id);
    Version *version = chain != nullptr ? locate(txn, *chain) : nullptr;
    if (version == nullptr) {
      return Status::RecordNotFound("Record " + describe(table, *record_id) +
                                    " not found");
    }
    if (predicate == nullptr || predicate->matches(make_row(table, *version))) {
      targets->push_back({chain, version});
    }
    return Status::Ok();
  }

  for (VersionChain *chain : table.store->chains()) {
    Version *version = locate(txn, *chain);
    if (version == nullptr) {
      continue;
    }
    if (predicate == nullptr || predicate->matches(make_row(table, *version))) {
      targets->push_back({chain, version});
    }
  }
  return Status::Ok();
}

Status MutationApplier::write_record(Transaction *txn, const TableInfo &table,
                                     Target target,
                                     const ColumnValues *assignments,
                                     const Predicate *predicate,
                                     bool *applied) {
  *applied = false;
  Version *version = target.version;

  while (version != nullptr) {
    std::vector<Value> new_values;
    if (assignments != nullptr) {
      new_values = version->values;
      MVCCDB_RETURN_IF_ERROR(table.schema.apply(*assignments, &new_values));
    }

    Claim result = claim(version, txn->txn_id());
    if (result == Claim::kStale) {
      version = locate(*txn, *target.chain);
      if (version != nullptr && predicate != nullptr &&
          !predicate->matches(make_row(table, *version))) {
        version = nullptr;
      }
      continue;
    }

    if (result == Claim::kHeldByActive) {
      txn_id_t holder = version->deleter();
      if (assignments == nullptr || !may_supersede(*txn, holder)) {
        return Status::WriteConflict("Record " +
                                     describe(table, version->record_id) +
                                     " is being written by transaction " +
                                     std::to_string(holder));
      }
    }

    if (assignments != nullptr) {
      table.store->append(version->record_id, std::move(new_values),
                          txn->txn_id(), std::chrono::system_clock::now());
    }
    txn->add_write(WriteKey(table.name, version->record_id));
    *applied = true;
    return Status::Ok();
  }
  return Status::Ok();
}

Status MutationApplier::update(Transaction *txn, const TableInfo &table,
                               std::optional<record_id_t> record_id,
                               const ColumnValues &values,
                               const Predicate *predicate, size_t *affected) {
  std::vector<Target> targets;
  MVCCDB_RETURN_IF_ERROR(
      collect_targets(*txn, table, record_id, predicate, &targets));

  // Reject bad assignments and held records before any version is written
  for (const auto &target : targets) {
    std::vector<Value> check = target.version->values;
    MVCCDB_RETURN_IF_ERROR(table.schema.apply(values, &check));
  }
  MVCCDB_RETURN_IF_ERROR(check_markers(*txn, table, targets, true));

  size_t count = 0;
  for (const auto &target : targets) {
    bool applied = false;
    MVCCDB_RETURN_IF_ERROR(
        write_record(txn, table, target, &values, predicate, &applied));
    if (applied) {
      ++count;
    }
  }

  if (record_id.has_value() && count == 0 && predicate == nullptr) {
    return Status::RecordNotFound("Record " + describe(table, *record_id) +
                                  " not found");
  }
  *affected = count;
  return Status::Ok();
}

Status MutationApplier::remove(Transaction *txn, const TableInfo &table,
                               std::optional<record_id_t> record_id,
                               const Predicate *predicate, size_t *affected) {
  std::vector<Target> targets;
  MVCCDB_RETURN_IF_ERROR(
      collect_targets(*txn, table, record_id, predicate, &targets));

  // Refuse the whole statement if any target is already being written
  MVCCDB_RETURN_IF_ERROR(check_markers(*txn, table, targets, false));

  size_t count = 0;
  for (const auto &target : targets) {
    bool applied = false;
    MVCCDB_RETURN_IF_ERROR(
        write_record(txn, table, target, nullptr, predicate, &applied));
    if (applied) {
      ++count;
    }
  }

  if (record_id.has_value() && count == 0 && predicate == nullptr) {
    return Status::RecordNotFound("Record " + describe(table, *record_id) +
                                  " not found");
  }
  *affected = count;
  return Status::Ok();
}

} // namespace mvccdb
