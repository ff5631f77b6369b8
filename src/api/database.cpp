/**
 * @file database.cpp
 * @brief Database class implementation
 */

#include "mvccdb/database.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <unordered_set>
#include <utility>

#include "catalog/catalog.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"
#include "transaction/conflict_detector.hpp"
#include "transaction/mutation_applier.hpp"
#include "transaction/snapshot_manager.hpp"
#include "transaction/transaction_registry.hpp"
#include "transaction/visibility.hpp"

namespace mvccdb {

class DatabaseImpl {
public:
  explicit DatabaseImpl(const DatabaseOptions &options)
      : options_(options), is_open_(true),
        detector_(options.repeatable_read_conflict_check),
        registry_(snapshots_, detector_), resolver_(registry_),
        applier_(registry_, resolver_) {
    Logger::init();
    if (!Logger::set_level(options_.log_level)) {
      LOG_WARN("Unknown log level '{}', keeping the current level",
               options_.log_level);
    }
    LOG_INFO("Opening engine: {} (default isolation {}, repeatable read "
             "validation {})",
             options_.name,
             isolation_level_to_string(options_.default_isolation),
             options_.repeatable_read_conflict_check ? "on" : "off");
  }

  ~DatabaseImpl() { close(); }

  // ─────────────────────────────────────────────────────────────────────────
  // Catalog
  // ─────────────────────────────────────────────────────────────────────────

  Status create_table(const std::string &name,
                      const std::vector<ColumnDef> &columns) {
    MVCCDB_RETURN_IF_ERROR(check_open());
    MVCCDB_RETURN_IF_ERROR(catalog_.create_table(
        name, columns, std::chrono::system_clock::now()));
    LOG_INFO("Created table {} ({} columns)", name, columns.size());
    return Status::Ok();
  }

  Status drop_table(const std::string &name) {
    MVCCDB_RETURN_IF_ERROR(check_open());
    MVCCDB_RETURN_IF_ERROR(catalog_.drop_table(name));
    LOG_INFO("Dropped table {}", name);
    return Status::Ok();
  }

  bool table_exists(const std::string &name) const {
    return catalog_.table_exists(name);
  }

  std::vector<std::string> table_names() const {
    return catalog_.get_table_names();
  }

  Status describe_table(const std::string &name, TableDescription *out) const {
    MVCCDB_RETURN_IF_ERROR(check_open());
    std::shared_ptr<TableInfo> table;
    MVCCDB_RETURN_IF_ERROR(get_table(name, &table));

    TableDescription desc;
    desc.name = table->name;
    for (const auto &column : table->schema.columns()) {
      desc.columns.push_back(column.to_def());
    }
    desc.created_at = table->created_at;
    desc.version_count = table->store->version_count();
    for (VersionChain *chain : table->store->chains()) {
      if (has_committed_live_version(*chain)) {
        ++desc.record_count;
      }
    }
    *out = std::move(desc);
    return Status::Ok();
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Transactions
  // ─────────────────────────────────────────────────────────────────────────

  Status begin_transaction(IsolationLevel isolation, txn_id_t *txn_id) {
    MVCCDB_RETURN_IF_ERROR(check_open());
    return registry_.begin(isolation, txn_id);
  }

  Status begin_transaction(std::string_view isolation, txn_id_t *txn_id) {
    IsolationLevel level;
    MVCCDB_RETURN_IF_ERROR(parse_isolation_level(isolation, &level));
    return begin_transaction(level, txn_id);
  }

  Status commit(txn_id_t txn_id) {
    MVCCDB_RETURN_IF_ERROR(check_open());
    return registry_.commit(txn_id);
  }

  Status rollback(txn_id_t txn_id) {
    MVCCDB_RETURN_IF_ERROR(check_open());
    return registry_.rollback(txn_id);
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Data Operations
  // ─────────────────────────────────────────────────────────────────────────

  Result insert(txn_id_t txn_id, const std::string &table_name,
                std::optional<record_id_t> record_id,
                const ColumnValues &values) {
    Transaction *txn = nullptr;
    std::shared_ptr<TableInfo> table;
    MVCCDB_RETURN_RESULT_IF_ERROR(prepare(txn_id, table_name, &txn, &table));

    size_t affected = 0;
    MVCCDB_RETURN_RESULT_IF_ERROR(
        applier_.insert(txn, *table, record_id, values, &affected));
    return Result(affected);
  }

  Result update(txn_id_t txn_id, const std::string &table_name,
                std::optional<record_id_t> record_id,
                const ColumnValues &values, const Predicate *predicate) {
    Transaction *txn = nullptr;
    std::shared_ptr<TableInfo> table;
    MVCCDB_RETURN_RESULT_IF_ERROR(prepare(txn_id, table_name, &txn, &table));
    MVCCDB_RETURN_RESULT_IF_ERROR(table->schema.check_predicate(predicate));

    size_t affected = 0;
    MVCCDB_RETURN_RESULT_IF_ERROR(applier_.update(txn, *table, record_id,
                                                  values, predicate, &affected));
    return Result(affected);
  }

  Result remove(txn_id_t txn_id, const std::string &table_name,
                std::optional<record_id_t> record_id,
                const Predicate *predicate) {
    Transaction *txn = nullptr;
    std::shared_ptr<TableInfo> table;
    MVCCDB_RETURN_RESULT_IF_ERROR(prepare(txn_id, table_name, &txn, &table));
    MVCCDB_RETURN_RESULT_IF_ERROR(table->schema.check_predicate(predicate));

    size_t affected = 0;
    MVCCDB_RETURN_RESULT_IF_ERROR(
        applier_.remove(txn, *table, record_id, predicate, &affected));
    return Result(affected);
  }

  Result read(txn_id_t txn_id, const std::string &table_name,
              const Predicate *predicate) const {
    Transaction *txn = nullptr;
    std::shared_ptr<TableInfo> table;
    MVCCDB_RETURN_RESULT_IF_ERROR(prepare(txn_id, table_name, &txn, &table));
    MVCCDB_RETURN_RESULT_IF_ERROR(table->schema.check_predicate(predicate));

    std::vector<std::string> names = table->schema.column_names();
    std::vector<Row> rows;
    for (VersionChain *chain : table->store->chains()) {
      Version *version = resolver_.visible_version(*txn, *chain);
      if (version == nullptr) {
        continue;
      }
      Row row(version->record_id, version->values, names);
      if (predicate != nullptr && !predicate->matches(row)) {
        continue;
      }
      rows.push_back(std::move(row));
    }
    return Result(std::move(rows), std::move(names));
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Introspection
  // ─────────────────────────────────────────────────────────────────────────

  Status transaction_info(txn_id_t txn_id, TransactionInfo *out) const {
    return registry_.info(txn_id, out);
  }

  RegistrySnapshot snapshot_of_registry() const {
    return registry_.snapshot_of_registry();
  }

  EngineStats stats() const {
    EngineStats stats;
    registry_.fill_stats(&stats);
    auto tables = catalog_.get_tables();
    stats.table_count = tables.size();
    for (const auto &table : tables) {
      stats.version_count += table->store->version_count();
    }
    return stats;
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Persistence Hooks
  // ─────────────────────────────────────────────────────────────────────────

  EngineState export_state() const {
    EngineState state;
    for (const auto &table : catalog_.get_tables()) {
      TableState table_state;
      table_state.name = table->name;
      for (const auto &column : table->schema.columns()) {
        table_state.columns.push_back(column.to_def());
      }
      table_state.created_at = table->created_at;
      table_state.next_record_id = table->store->next_record_id();

      for (VersionChain *chain : table->store->chains()) {
        auto versions = chain->newest_first();
        for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
          const Version &version = **it;
          table_state.versions.push_back(
              VersionState{version.record_id, version.values,
                           version.created_by, version.deleter(),
                           version.created_at});
        }
      }
      state.tables.push_back(std::move(table_state));
    }
    state.transactions = registry_.export_state();
    return state;
  }

  Status import_state(const EngineState &state) {
    MVCCDB_RETURN_IF_ERROR(check_open());
    std::lock_guard<std::mutex> lock(import_mutex_);

    if (catalog_.table_count() != 0 || registry_.size() != 0) {
      return Status::InvalidArgument(
          "State can only be imported into an empty engine");
    }

    // Validate everything before touching the engine
    MVCCDB_RETURN_IF_ERROR(
        TransactionRegistry::validate_state(state.transactions));
    std::unordered_set<txn_id_t> known;
    for (const auto &txn : state.transactions) {
      known.insert(txn.id);
    }

    Catalog scratch;
    for (const auto &table_state : state.tables) {
      std::shared_ptr<TableInfo> table;
      Status status = scratch.create_table(
          table_state.name, table_state.columns, table_state.created_at, &table);
      if (!status.ok()) {
        return Status::Corruption("Table " + table_state.name + ": " +
                                  std::string(status.message()));
      }
      for (const auto &version : table_state.versions) {
        MVCCDB_RETURN_IF_ERROR(
            validate_version(*table, version, known));
      }
    }

    // Apply
    MVCCDB_RETURN_IF_ERROR(registry_.import_state(state.transactions));
    size_t version_total = 0;
    for (const auto &table_state : state.tables) {
      std::shared_ptr<TableInfo> table;
      MVCCDB_RETURN_IF_ERROR(catalog_.create_table(
          table_state.name, table_state.columns, table_state.created_at,
          &table));

      record_id_t next = table_state.next_record_id;
      for (const auto &version : table_state.versions) {
        table->store->append(version.record_id, version.values,
                             version.created_by, version.created_at,
                             version.deleted_by);
        if (version.record_id >= next) {
          next = version.record_id + 1;
        }
      }
      table->store->set_next_record_id(next);
      version_total += table_state.versions.size();
    }

    LOG_INFO("Imported {} tables, {} versions into {}", state.tables.size(),
             version_total, options_.name);
    return Status::Ok();
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Lifecycle
  // ─────────────────────────────────────────────────────────────────────────

  void close() {
    if (is_open_.exchange(false)) {
      LOG_INFO("Closing engine: {}", options_.name);
    }
  }

  bool is_open() const noexcept { return is_open_.load(); }
  std::string_view name() const noexcept { return options_.name; }
  IsolationLevel default_isolation() const noexcept {
    return options_.default_isolation;
  }

private:
  Status check_open() const {
    if (!is_open_.load()) {
      return Status::Error("Engine " + options_.name + " is closed");
    }
    return Status::Ok();
  }

  Status get_table(const std::string &name,
                   std::shared_ptr<TableInfo> *table) const {
    *table = catalog_.get_table(name);
    if (*table == nullptr) {
      return Status::NotFound("Table not found: " + name);
    }
    return Status::Ok();
  }

  /// Resolve the ACTIVE transaction and the table for a data operation
  Status prepare(txn_id_t txn_id, const std::string &table_name,
                 Transaction **txn, std::shared_ptr<TableInfo> *table) const {
    MVCCDB_RETURN_IF_ERROR(check_open());
    MVCCDB_RETURN_IF_ERROR(registry_.get_active(txn_id, txn));
    return get_table(table_name, table);
  }

  /// Whether a fresh READ_COMMITTED reader would see the record
  bool has_committed_live_version(VersionChain &chain) const {
    for (Version *version : chain.newest_first()) {
      if (!registry_.is_committed(version->created_by)) {
        continue;
      }
      return !registry_.is_committed(version->deleter());
    }
    return false;
  }

  static Status validate_version(const TableInfo &table,
                                 const VersionState &version,
                                 const std::unordered_set<txn_id_t> &known) {
    std::string where = table.name + "." + std::to_string(version.record_id);
    if (known.count(version.created_by) == 0) {
      return Status::Corruption("Version of " + where +
                                " created by unknown transaction " +
                                std::to_string(version.created_by));
    }
    if (version.deleted_by != INVALID_TXN_ID &&
        known.count(version.deleted_by) == 0) {
      return Status::Corruption("Version of " + where +
                                " deleted by unknown transaction " +
                                std::to_string(version.deleted_by));
    }
    Status status = table.schema.validate(version.values);
    if (!status.ok()) {
      return Status::Corruption("Version of " + where + ": " +
                                std::string(status.message()));
    }
    return Status::Ok();
  }

  DatabaseOptions options_;
  std::atomic<bool> is_open_;

  Catalog catalog_;
  SnapshotManager snapshots_;
  ConflictDetector detector_;
  TransactionRegistry registry_;
  VisibilityResolver resolver_;
  MutationApplier applier_;

  std::mutex import_mutex_;
};

Database::Database(const DatabaseOptions &options)
    : impl_(std::make_unique<DatabaseImpl>(options)) {}

Database::~Database() = default;

Database::Database(Database &&) noexcept = default;
Database &Database::operator=(Database &&) noexcept = default;

Status Database::create_table(const std::string &name,
                              const std::vector<ColumnDef> &columns) {
  return impl_->create_table(name, columns);
}

Status Database::drop_table(const std::string &name) {
  return impl_->drop_table(name);
}

bool Database::table_exists(const std::string &name) const {
  return impl_->table_exists(name);
}

std::vector<std::string> Database::table_names() const {
  return impl_->table_names();
}

Status Database::describe_table(const std::string &name,
                                TableDescription *out) const {
  return impl_->describe_table(name, out);
}

Status Database::begin_transaction(IsolationLevel isolation, txn_id_t *txn_id) {
  return impl_->begin_transaction(isolation, txn_id);
}

Status Database::begin_transaction(std::string_view isolation,
                                   txn_id_t *txn_id) {
  return impl_->begin_transaction(isolation, txn_id);
}

Status Database::begin_transaction(txn_id_t *txn_id) {
  return impl_->begin_transaction(impl_->default_isolation(), txn_id);
}

Status Database::commit(txn_id_t txn_id) { return impl_->commit(txn_id); }

Status Database::rollback(txn_id_t txn_id) { return impl_->rollback(txn_id); }

Result Database::insert(txn_id_t txn_id, const std::string &table,
                        std::optional<record_id_t> record_id,
                        const ColumnValues &values) {
  return impl_->insert(txn_id, table, record_id, values);
}

Result Database::update(txn_id_t txn_id, const std::string &table,
                        std::optional<record_id_t> record_id,
                        const ColumnValues &values,
                        const Predicate *predicate) {
  return impl_->update(txn_id, table, record_id, values, predicate);
}

Result Database::remove(txn_id_t txn_id, const std::string &table,
                        std::optional<record_id_t> record_id,
                        const Predicate *predicate) {
  return impl_->remove(txn_id, table, record_id, predicate);
}

Result Database::read(txn_id_t txn_id, const std::string &table,
                      const Predicate *predicate) const {
  return impl_->read(txn_id, table, predicate);
}

Status Database::transaction_info(txn_id_t txn_id,
                                  TransactionInfo *out) const {
  return impl_->transaction_info(txn_id, out);
}

RegistrySnapshot Database::snapshot_of_registry() const {
  return impl_->snapshot_of_registry();
}

EngineStats Database::stats() const { return impl_->stats(); }

EngineState Database::export_state() const { return impl_->export_state(); }

Status Database::import_state(const EngineState &state) {
  return impl_->import_state(state);
}

void Database::close() { impl_->close(); }

bool Database::is_open() const noexcept { return impl_->is_open(); }

std::string_view Database::name() const noexcept { return impl_->name(); }

} // namespace mvccdb
