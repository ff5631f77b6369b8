/**
 * @file database_test.cpp
 * @brief Integration tests for Database class
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "mvccdb/mvccdb.hpp"
#include "test_utils.hpp"

namespace mvccdb {
namespace {

class DatabaseTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_ = std::make_unique<Database>(test::quiet_options());
    ASSERT_TRUE(db_->create_table("users", test::user_columns()).ok());
  }

  txn_id_t begin(IsolationLevel isolation = IsolationLevel::READ_COMMITTED) {
    return test::begin(*db_, isolation);
  }

  Result insert(txn_id_t txn, record_id_t id, const std::string &name,
                int32_t age) {
    return db_->insert(txn, "users", id,
                       {{"name", Value(name)}, {"age", Value(age)}});
  }

  /// Commit records 1..n (user<i>, age 20+i) in one transaction
  void seed(int n) {
    txn_id_t txn = begin();
    for (int i = 1; i <= n; ++i) {
      ASSERT_TRUE(insert(txn, i, "user" + std::to_string(i), 20 + i).ok());
    }
    ASSERT_TRUE(db_->commit(txn).ok());
  }

  Result read(txn_id_t txn, const Predicate *pred = nullptr) {
    return db_->read(txn, "users", pred);
  }

  std::unique_ptr<Database> db_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, OpenClose) {
  EXPECT_TRUE(db_->is_open());
  EXPECT_EQ(db_->name(), "test");

  db_->close();
  EXPECT_FALSE(db_->is_open());

  txn_id_t txn = 0;
  EXPECT_EQ(db_->begin_transaction(IsolationLevel::READ_COMMITTED, &txn).code(),
            StatusCode::kError);
  EXPECT_EQ(db_->create_table("orders", test::user_columns()).code(),
            StatusCode::kError);
}

TEST_F(DatabaseTest, CloseRejectsDataOperations) {
  txn_id_t txn = begin();
  db_->close();

  EXPECT_EQ(insert(txn, 1, "a", 1).status().code(), StatusCode::kError);
  EXPECT_EQ(read(txn).status().code(), StatusCode::kError);
  EXPECT_EQ(db_->commit(txn).code(), StatusCode::kError);
}

TEST_F(DatabaseTest, IndependentInstances) {
  Database other(test::quiet_options());
  EXPECT_FALSE(other.table_exists("users"));

  txn_id_t mine = begin();
  txn_id_t theirs = test::begin(other, IsolationLevel::READ_COMMITTED);
  EXPECT_EQ(mine, theirs);
}

TEST_F(DatabaseTest, Version) {
  EXPECT_STREQ(version(), "0.1.0");
  EXPECT_EQ(version_major(), 0);
  EXPECT_EQ(version_minor(), 1);
  EXPECT_EQ(version_patch(), 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Catalog
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, CatalogOperations) {
  EXPECT_EQ(db_->create_table("users", test::user_columns()).code(),
            StatusCode::kAlreadyExists);
  EXPECT_EQ(db_->create_table("9bad", test::user_columns()).code(),
            StatusCode::kInvalidArgument);
  ASSERT_TRUE(db_->create_table("accounts", {ColumnDef("balance", TypeId::BIGINT)})
                  .ok());

  EXPECT_EQ(db_->table_names(),
            (std::vector<std::string>{"accounts", "users"}));

  ASSERT_TRUE(db_->drop_table("accounts").ok());
  EXPECT_FALSE(db_->table_exists("accounts"));
  EXPECT_EQ(db_->drop_table("accounts").code(), StatusCode::kNotFound);
}

TEST_F(DatabaseTest, DroppedTableIsGone) {
  seed(2);
  ASSERT_TRUE(db_->drop_table("users").ok());

  txn_id_t txn = begin();
  EXPECT_EQ(read(txn).status().code(), StatusCode::kNotFound);
  EXPECT_EQ(insert(txn, 1, "a", 1).status().code(), StatusCode::kNotFound);
}

TEST_F(DatabaseTest, DescribeTable) {
  seed(3);
  txn_id_t txn = begin();
  ASSERT_TRUE(db_->remove(txn, "users", 3).ok());
  ASSERT_TRUE(db_->update(txn, "users", 1, {{"age", Value(int32_t(99))}}).ok());
  ASSERT_TRUE(insert(txn, 4, "pending", 1).ok());

  TableDescription desc;
  ASSERT_TRUE(db_->describe_table("users", &desc).ok());
  EXPECT_EQ(desc.name, "users");
  ASSERT_EQ(desc.columns.size(), 2u);
  EXPECT_EQ(desc.columns[0].name, "name");
  EXPECT_EQ(desc.columns[1].type, TypeId::INTEGER);
  // Uncommitted work is not counted as records, only as versions
  EXPECT_EQ(desc.record_count, 3u);
  EXPECT_EQ(desc.version_count, 5u);

  ASSERT_TRUE(db_->commit(txn).ok());
  ASSERT_TRUE(db_->describe_table("users", &desc).ok());
  EXPECT_EQ(desc.record_count, 3u);

  EXPECT_EQ(db_->describe_table("missing", &desc).code(),
            StatusCode::kNotFound);
}

// ─────────────────────────────────────────────────────────────────────────────
// Transactions
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, BeginByName) {
  txn_id_t txn = 0;
  ASSERT_TRUE(db_->begin_transaction("repeatable read", &txn).ok());

  TransactionInfo info;
  ASSERT_TRUE(db_->transaction_info(txn, &info).ok());
  EXPECT_EQ(info.isolation, IsolationLevel::REPEATABLE_READ);
  EXPECT_TRUE(info.has_snapshot);

  EXPECT_EQ(db_->begin_transaction("snapshot", &txn).code(),
            StatusCode::kInvalidIsolation);
}

TEST_F(DatabaseTest, BeginUsesDefaultIsolation) {
  DatabaseOptions options = test::quiet_options();
  options.default_isolation = IsolationLevel::SERIALIZABLE;
  Database db(options);

  txn_id_t txn = 0;
  ASSERT_TRUE(db.begin_transaction(&txn).ok());
  TransactionInfo info;
  ASSERT_TRUE(db.transaction_info(txn, &info).ok());
  EXPECT_EQ(info.isolation, IsolationLevel::SERIALIZABLE);
}

TEST_F(DatabaseTest, InvalidIsolationValue) {
  txn_id_t txn = 0;
  EXPECT_EQ(
      db_->begin_transaction(static_cast<IsolationLevel>(7), &txn).code(),
      StatusCode::kInvalidIsolation);
  EXPECT_EQ(db_->stats().total_transactions, 0u);
}

TEST_F(DatabaseTest, EndedTransactionIsInvalid) {
  txn_id_t txn = begin();
  ASSERT_TRUE(db_->commit(txn).ok());

  EXPECT_TRUE(db_->commit(txn).is_invalid_transaction());
  EXPECT_TRUE(db_->rollback(txn).is_invalid_transaction());
  EXPECT_TRUE(insert(txn, 1, "a", 1).status().is_invalid_transaction());
  EXPECT_TRUE(read(txn).status().is_invalid_transaction());
  EXPECT_TRUE(db_->commit(12345).is_invalid_transaction());
}

TEST_F(DatabaseTest, TransactionInfo) {
  txn_id_t txn = begin(IsolationLevel::SERIALIZABLE);
  ASSERT_TRUE(insert(txn, 1, "a", 1).ok());
  ASSERT_TRUE(insert(txn, 2, "b", 2).ok());

  TransactionInfo info;
  ASSERT_TRUE(db_->transaction_info(txn, &info).ok());
  EXPECT_EQ(info.id, txn);
  EXPECT_EQ(info.status, TransactionStatus::ACTIVE);
  EXPECT_FALSE(info.ended_at.has_value());
  EXPECT_EQ(info.write_set_size, 2u);

  ASSERT_TRUE(db_->rollback(txn).ok());
  ASSERT_TRUE(db_->transaction_info(txn, &info).ok());
  EXPECT_EQ(info.status, TransactionStatus::ABORTED);
  ASSERT_TRUE(info.ended_at.has_value());
  EXPECT_GE(*info.ended_at, info.started_at);

  EXPECT_TRUE(db_->transaction_info(999, &info).is_invalid_transaction());
}

TEST_F(DatabaseTest, SnapshotOfRegistry) {
  txn_id_t committed = begin();
  txn_id_t aborted = begin();
  txn_id_t active = begin(IsolationLevel::SERIALIZABLE);
  ASSERT_TRUE(db_->commit(committed).ok());
  ASSERT_TRUE(db_->rollback(aborted).ok());

  RegistrySnapshot snapshot = db_->snapshot_of_registry();
  ASSERT_EQ(snapshot.active.size(), 1u);
  ASSERT_EQ(snapshot.committed.size(), 1u);
  ASSERT_EQ(snapshot.aborted.size(), 1u);
  EXPECT_EQ(snapshot.active[0].id, active);
  EXPECT_EQ(snapshot.active[0].isolation, IsolationLevel::SERIALIZABLE);
  EXPECT_EQ(snapshot.committed[0].id, committed);
  EXPECT_TRUE(snapshot.committed[0].ended_at.has_value());
  EXPECT_EQ(snapshot.aborted[0].id, aborted);
}

TEST_F(DatabaseTest, Stats) {
  seed(2);
  txn_id_t aborted = begin();
  ASSERT_TRUE(insert(aborted, 3, "c", 3).ok());
  ASSERT_TRUE(db_->rollback(aborted).ok());
  begin();

  EngineStats stats = db_->stats();
  EXPECT_EQ(stats.total_transactions, 3u);
  EXPECT_EQ(stats.active_transactions, 1u);
  EXPECT_EQ(stats.committed_transactions, 1u);
  EXPECT_EQ(stats.aborted_transactions, 1u);
  EXPECT_EQ(stats.next_txn_id, 4u);
  EXPECT_EQ(stats.table_count, 1u);
  EXPECT_EQ(stats.version_count, 3u);
}

// ─────────────────────────────────────────────────────────────────────────────
// Data Operations
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, InsertAllocatesRecordIds) {
  txn_id_t txn = begin();
  ASSERT_TRUE(insert(txn, 5, "explicit", 1).ok());
  ASSERT_TRUE(
      db_->insert(txn, "users", std::nullopt, {{"name", Value("auto")}}).ok());

  Result result = read(txn);
  EXPECT_EQ(test::record_ids(result), (std::vector<record_id_t>{5, 6}));
  EXPECT_TRUE(result.rows()[1]["age"].is_null());
}

TEST_F(DatabaseTest, InsertValidatesValues) {
  txn_id_t txn = begin();
  EXPECT_EQ(db_->insert(txn, "users", 1, {{"nope", Value(int32_t(1))}})
                .status()
                .code(),
            StatusCode::kInvalidArgument);
  EXPECT_EQ(db_->insert(txn, "users", 1, {{"age", Value("old")}})
                .status()
                .code(),
            StatusCode::kInvalidArgument);
  EXPECT_TRUE(read(txn).rows().empty());
}

TEST_F(DatabaseTest, DuplicateKey) {
  seed(1);
  txn_id_t txn = begin();
  EXPECT_TRUE(insert(txn, 1, "again", 1).status().is_duplicate_key());

  // Once the record is deleted its id may be reused
  ASSERT_TRUE(db_->remove(txn, "users", 1).ok());
  EXPECT_TRUE(insert(txn, 1, "again", 1).ok());
}

TEST_F(DatabaseTest, ReadIsOrderedAndFiltered) {
  txn_id_t txn = begin();
  ASSERT_TRUE(insert(txn, 3, "c", 30).ok());
  ASSERT_TRUE(insert(txn, 1, "a", 10).ok());
  ASSERT_TRUE(insert(txn, 2, "b", 20).ok());

  EXPECT_EQ(test::record_ids(read(txn)),
            (std::vector<record_id_t>{1, 2, 3}));

  auto pred = Predicate::compare("age", ComparisonType::GREATER_THAN,
                                 Value(int32_t(15)));
  Result result = read(txn, pred.get());
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(test::record_ids(result), (std::vector<record_id_t>{2, 3}));
  EXPECT_EQ(result.column_names(),
            (std::vector<std::string>{"name", "age"}));

  auto bad = Predicate::eq("salary", Value(int32_t(1)));
  EXPECT_EQ(read(txn, bad.get()).status().code(),
            StatusCode::kInvalidArgument);
}

TEST_F(DatabaseTest, UpdateAndRemoveByPredicate) {
  seed(5);
  txn_id_t txn = begin();

  auto older = Predicate::compare("age", ComparisonType::GREATER_EQUAL,
                                  Value(int32_t(24)));
  Result updated = db_->update(txn, "users", std::nullopt,
                               {{"name", Value("senior")}}, older.get());
  ASSERT_TRUE(updated.ok());
  EXPECT_EQ(updated.affected_rows(), 2u);

  auto seniors = Predicate::eq("name", Value("senior"));
  EXPECT_EQ(read(txn, seniors.get()).row_count(), 2u);

  Result removed =
      db_->remove(txn, "users", std::nullopt, seniors.get());
  ASSERT_TRUE(removed.ok());
  EXPECT_EQ(removed.affected_rows(), 2u);
  EXPECT_EQ(test::record_ids(read(txn)),
            (std::vector<record_id_t>{1, 2, 3}));

  Result all = db_->remove(txn, "users", std::nullopt);
  EXPECT_EQ(all.affected_rows(), 3u);
  EXPECT_TRUE(read(txn).rows().empty());
}

TEST_F(DatabaseTest, UpdateMissingRecord) {
  txn_id_t txn = begin();
  EXPECT_TRUE(db_->update(txn, "users", 42, {{"age", Value(int32_t(1))}})
                  .status()
                  .is_record_not_found());
  EXPECT_TRUE(db_->remove(txn, "users", 42).status().is_record_not_found());
}

TEST_F(DatabaseTest, UncommittedWritesAreIsolated) {
  txn_id_t writer = begin();
  txn_id_t reader = begin();
  txn_id_t dirty = begin(IsolationLevel::READ_UNCOMMITTED);
  ASSERT_TRUE(insert(writer, 1, "draft", 1).ok());

  EXPECT_TRUE(read(reader).rows().empty());
  EXPECT_EQ(read(dirty).row_count(), 1u);

  ASSERT_TRUE(db_->commit(writer).ok());
  EXPECT_EQ(read(reader).row_count(), 1u);
}

TEST_F(DatabaseTest, RollbackIsPermanent) {
  txn_id_t txn = begin();
  ASSERT_TRUE(insert(txn, 1, "ghost", 1).ok());
  ASSERT_TRUE(db_->rollback(txn).ok());

  for (IsolationLevel level :
       {IsolationLevel::READ_UNCOMMITTED, IsolationLevel::READ_COMMITTED,
        IsolationLevel::REPEATABLE_READ, IsolationLevel::SERIALIZABLE}) {
    EXPECT_TRUE(read(begin(level)).rows().empty())
        << isolation_level_to_string(level);
  }

  // The id is free again
  txn_id_t next = begin();
  EXPECT_TRUE(insert(next, 1, "real", 1).ok());
  EXPECT_GT(next, txn);
}

// ─────────────────────────────────────────────────────────────────────────────
// Scenarios
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, CommittedInsertIsVisibleToLaterTransaction) {
  txn_id_t t1 = begin(IsolationLevel::READ_COMMITTED);
  ASSERT_TRUE(db_->insert(t1, "users", 1, {{"name", Value("Alice")}}).ok());
  ASSERT_TRUE(db_->commit(t1).ok());

  txn_id_t t2 = begin(IsolationLevel::READ_COMMITTED);
  Result result = read(t2);
  ASSERT_EQ(result.row_count(), 1u);
  EXPECT_EQ(result.rows()[0].record_id(), 1);
  EXPECT_EQ(result.rows()[0]["name"].as_string(), "Alice");
}

TEST_F(DatabaseTest, RepeatableReadKeepsItsSnapshot) {
  txn_id_t t1 = begin(IsolationLevel::REPEATABLE_READ);
  EXPECT_TRUE(read(t1).rows().empty());

  txn_id_t t2 = begin();
  ASSERT_TRUE(insert(t2, 1, "Bob", 30).ok());
  ASSERT_TRUE(db_->commit(t2).ok());

  EXPECT_TRUE(read(t1).rows().empty());
}

TEST_F(DatabaseTest, RepeatableReadSeesSameContent) {
  seed(1);
  txn_id_t reader = begin(IsolationLevel::REPEATABLE_READ);
  Result before = read(reader);

  txn_id_t writer = begin();
  ASSERT_TRUE(
      db_->update(writer, "users", 1, {{"age", Value(int32_t(77))}}).ok());
  ASSERT_TRUE(db_->commit(writer).ok());

  Result after = read(reader);
  ASSERT_EQ(after.row_count(), 1u);
  EXPECT_EQ(after.rows()[0].values(), before.rows()[0].values());

  // A read committed reader sees the new version
  EXPECT_EQ(read(begin()).rows()[0]["age"].as_int32(), 77);
}

TEST_F(DatabaseTest, ConcurrentSerializableUpdatesConflict) {
  seed(1);
  txn_id_t t1 = begin(IsolationLevel::SERIALIZABLE);
  txn_id_t t2 = begin(IsolationLevel::SERIALIZABLE);

  ASSERT_TRUE(db_->update(t1, "users", 1, {{"age", Value(int32_t(1))}}).ok());
  ASSERT_TRUE(db_->update(t2, "users", 1, {{"age", Value(int32_t(2))}}).ok());

  EXPECT_TRUE(db_->commit(t1).ok());
  EXPECT_TRUE(db_->commit(t2).is_serialization_conflict());

  TransactionInfo info;
  ASSERT_TRUE(db_->transaction_info(t2, &info).ok());
  EXPECT_EQ(info.status, TransactionStatus::ABORTED);

  EXPECT_EQ(read(begin()).rows()[0]["age"].as_int32(), 1);
}

TEST_F(DatabaseTest, RolledBackDeleteLeavesRecord) {
  seed(1);
  txn_id_t t1 = begin();
  ASSERT_TRUE(db_->remove(t1, "users", 1).ok());
  EXPECT_TRUE(read(t1).rows().empty());
  ASSERT_TRUE(db_->rollback(t1).ok());

  txn_id_t t2 = begin();
  EXPECT_EQ(test::record_ids(read(t2)), (std::vector<record_id_t>{1}));
}

TEST_F(DatabaseTest, ConcurrentDeleteReportsWriteConflict) {
  seed(1);
  txn_id_t t1 = begin();
  txn_id_t t2 = begin();
  ASSERT_TRUE(db_->remove(t1, "users", 1).ok());

  EXPECT_EQ(db_->remove(t2, "users", 1).status().code(),
            StatusCode::kWriteConflict);

  TransactionInfo info;
  ASSERT_TRUE(db_->transaction_info(t2, &info).ok());
  EXPECT_EQ(info.status, TransactionStatus::ACTIVE);

  ASSERT_TRUE(db_->rollback(t1).ok());
  EXPECT_TRUE(db_->remove(t2, "users", 1).ok());
}

TEST_F(DatabaseTest, ConcurrentReadCommittedUpdateReportsWriteConflict) {
  seed(1);
  txn_id_t t1 = begin();
  txn_id_t t2 = begin();
  ASSERT_TRUE(db_->update(t1, "users", 1, {{"age", Value(int32_t(1))}}).ok());
  EXPECT_EQ(db_->update(t2, "users", 1, {{"age", Value(int32_t(2))}})
                .status()
                .code(),
            StatusCode::kWriteConflict);

  ASSERT_TRUE(db_->commit(t1).ok());
  ASSERT_TRUE(db_->commit(t2).ok());
  Result after_update = read(begin());
  ASSERT_EQ(after_update.row_count(), 1);
  EXPECT_EQ(after_update.rows()[0]["age"].as_int32(), 1);

  txn_id_t deleter = begin();
  ASSERT_TRUE(db_->remove(deleter, "users", 1).ok());
  ASSERT_TRUE(db_->commit(deleter).ok());
  EXPECT_TRUE(read(begin()).rows().empty());
}

TEST_F(DatabaseTest, RolledBackSerializableUpdaterLeavesNoOlderVersionBehind) {
  seed(1);
  txn_id_t t1 = begin(IsolationLevel::SERIALIZABLE);
  txn_id_t t2 = begin(IsolationLevel::SERIALIZABLE);
  ASSERT_TRUE(db_->update(t1, "users", 1, {{"age", Value(int32_t(1))}}).ok());
  ASSERT_TRUE(db_->update(t2, "users", 1, {{"age", Value(int32_t(2))}}).ok());
  ASSERT_TRUE(db_->rollback(t1).ok());
  ASSERT_TRUE(db_->commit(t2).ok());

  txn_id_t deleter = begin();
  ASSERT_TRUE(db_->remove(deleter, "users", 1).ok());
  ASSERT_TRUE(db_->commit(deleter).ok());
  EXPECT_TRUE(read(begin()).rows().empty());
  EXPECT_TRUE(read(begin(IsolationLevel::READ_UNCOMMITTED)).rows().empty());
}

TEST_F(DatabaseTest, ConcurrentInsertOfSameKeyReportsWriteConflict) {
  txn_id_t t1 = begin();
  txn_id_t t2 = begin();
  ASSERT_TRUE(insert(t1, 7, "first", 1).ok());
  EXPECT_EQ(insert(t2, 7, "second", 2).status().code(),
            StatusCode::kWriteConflict);

  ASSERT_TRUE(db_->commit(t1).ok());
  ASSERT_TRUE(db_->commit(t2).ok());

  txn_id_t deleter = begin();
  ASSERT_TRUE(db_->remove(deleter, "users", 7).ok());
  ASSERT_TRUE(db_->commit(deleter).ok());
  EXPECT_TRUE(read(begin()).rows().empty());
}

TEST_F(DatabaseTest, SerializableDeleteOfNewerVersionIsRejectedAtCommit) {
  seed(1);
  txn_id_t snapshot_txn = begin(IsolationLevel::SERIALIZABLE);

  txn_id_t other = begin();
  ASSERT_TRUE(db_->update(other, "users", 1, {{"age", Value(int32_t(50))}}).ok());
  ASSERT_TRUE(db_->commit(other).ok());

  ASSERT_TRUE(db_->remove(snapshot_txn, "users", 1).ok());
  EXPECT_EQ(read(snapshot_txn).row_count(), 1);
  EXPECT_TRUE(db_->commit(snapshot_txn).is_serialization_conflict());

  Result result = read(begin());
  ASSERT_EQ(result.row_count(), 1);
  EXPECT_EQ(result.rows()[0]["age"].as_int32(), 50);
}

TEST_F(DatabaseTest, RepeatableReadCheckOption) {
  DatabaseOptions options = test::quiet_options();
  options.repeatable_read_conflict_check = false;
  Database db(options);
  ASSERT_TRUE(db.create_table("users", test::user_columns()).ok());

  txn_id_t seed_txn = test::begin(db, IsolationLevel::READ_COMMITTED);
  ASSERT_TRUE(db.insert(seed_txn, "users", 1, {{"age", Value(int32_t(0))}}).ok());
  ASSERT_TRUE(db.commit(seed_txn).ok());

  txn_id_t t1 = test::begin(db, IsolationLevel::REPEATABLE_READ);
  txn_id_t t2 = test::begin(db, IsolationLevel::REPEATABLE_READ);
  ASSERT_TRUE(db.update(t1, "users", 1, {{"age", Value(int32_t(1))}}).ok());
  EXPECT_TRUE(db.commit(t1).ok());

  // t2 overwrites a version newer than its snapshot and still commits
  ASSERT_TRUE(db.update(t2, "users", 1, {{"age", Value(int32_t(2))}}).ok());
  EXPECT_TRUE(db.commit(t2).ok());

  Result result = db.read(test::begin(db, IsolationLevel::READ_COMMITTED), "users");
  ASSERT_EQ(result.row_count(), 1);
  EXPECT_EQ(result.rows()[0]["age"].as_int32(), 2);
}

TEST_F(DatabaseTest, UncheckedRepeatableReadUpdatesConflictEagerly) {
  DatabaseOptions options = test::quiet_options();
  options.repeatable_read_conflict_check = false;
  Database db(options);
  ASSERT_TRUE(db.create_table("users", test::user_columns()).ok());

  txn_id_t seed_txn = test::begin(db, IsolationLevel::READ_COMMITTED);
  ASSERT_TRUE(db.insert(seed_txn, "users", 1, {{"age", Value(int32_t(0))}}).ok());
  ASSERT_TRUE(db.commit(seed_txn).ok());

  txn_id_t t1 = test::begin(db, IsolationLevel::REPEATABLE_READ);
  txn_id_t t2 = test::begin(db, IsolationLevel::REPEATABLE_READ);
  ASSERT_TRUE(db.update(t1, "users", 1, {{"age", Value(int32_t(1))}}).ok());
  EXPECT_EQ(db.update(t2, "users", 1, {{"age", Value(int32_t(2))}}).status().code(),
            StatusCode::kWriteConflict);
}

// ─────────────────────────────────────────────────────────────────────────────
// Export / Import
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, ExportImportRoundTrip) {
  seed(3);
  txn_id_t deleter = begin();
  ASSERT_TRUE(db_->remove(deleter, "users", 2).ok());
  ASSERT_TRUE(db_->commit(deleter).ok());
  txn_id_t in_flight = begin();
  ASSERT_TRUE(insert(in_flight, 9, "unfinished", 9).ok());

  EngineState state = db_->export_state();
  ASSERT_EQ(state.tables.size(), 1u);
  EXPECT_EQ(state.tables[0].versions.size(), 4u);
  EXPECT_EQ(state.transactions.size(), 3u);

  Database restored(test::quiet_options());
  ASSERT_TRUE(restored.import_state(state).ok());

  // The in-flight transaction comes back aborted
  TransactionInfo info;
  ASSERT_TRUE(restored.transaction_info(in_flight, &info).ok());
  EXPECT_EQ(info.status, TransactionStatus::ABORTED);
  EXPECT_TRUE(info.ended_at.has_value());

  txn_id_t txn = test::begin(restored, IsolationLevel::SERIALIZABLE);
  EXPECT_GT(txn, in_flight);
  Result result = restored.read(txn, "users");
  EXPECT_EQ(test::record_ids(result), (std::vector<record_id_t>{1, 3}));

  // Record ids continue past everything restored
  ASSERT_TRUE(restored.insert(txn, "users", std::nullopt,
                              {{"name", Value("next")}})
                  .ok());
  EXPECT_EQ(test::record_ids(restored.read(txn, "users")),
            (std::vector<record_id_t>{1, 3, 10}));
}

TEST_F(DatabaseTest, ImportRequiresEmptyEngine) {
  EngineState state = db_->export_state();
  EXPECT_EQ(db_->import_state(state).code(), StatusCode::kInvalidArgument);
}

TEST_F(DatabaseTest, ImportRejectsUnknownCreator) {
  seed(1);
  EngineState state = db_->export_state();
  state.tables[0].versions[0].created_by = 77;

  Database restored(test::quiet_options());
  EXPECT_EQ(restored.import_state(state).code(), StatusCode::kCorruption);
  EXPECT_TRUE(restored.table_names().empty());
  EXPECT_EQ(restored.stats().total_transactions, 0u);
}

TEST_F(DatabaseTest, ImportRejectsValuesNotMatchingSchema) {
  seed(1);
  EngineState state = db_->export_state();
  state.tables[0].versions[0].values[1] = Value("not a number");

  Database restored(test::quiet_options());
  EXPECT_EQ(restored.import_state(state).code(), StatusCode::kCorruption);
  EXPECT_TRUE(restored.table_names().empty());
}

TEST_F(DatabaseTest, ImportRejectsDuplicateTransactions) {
  seed(1);
  EngineState state = db_->export_state();
  state.transactions.push_back(state.transactions[0]);

  Database restored(test::quiet_options());
  EXPECT_EQ(restored.import_state(state).code(), StatusCode::kCorruption);
}

// ─────────────────────────────────────────────────────────────────────────────
// Concurrency
// ─────────────────────────────────────────────────────────────────────────────

TEST(DatabaseStressTest, SerializableIncrementsAreNeverLost) {
  Database db(test::quiet_options());
  ASSERT_TRUE(db.create_table("counters", {ColumnDef("value", TypeId::BIGINT)})
                  .ok());
  txn_id_t seed = test::begin(db, IsolationLevel::READ_COMMITTED);
  ASSERT_TRUE(
      db.insert(seed, "counters", 1, {{"value", Value(int64_t(0))}}).ok());
  ASSERT_TRUE(db.commit(seed).ok());

  constexpr int kThreads = 4;
  constexpr int kIncrements = 50;
  std::atomic<int> conflicts{0};
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      int done = 0;
      while (done < kIncrements) {
        txn_id_t txn = 0;
        if (!db.begin_transaction(IsolationLevel::SERIALIZABLE, &txn).ok()) {
          failures.fetch_add(1);
          return;
        }
        Result current = db.read(txn, "counters");
        if (!current.ok() || current.row_count() != 1) {
          failures.fetch_add(1);
          return;
        }
        int64_t value = current.rows()[0]["value"].as_int64();
        Result updated =
            db.update(txn, "counters", 1, {{"value", Value(value + 1)}});
        if (updated.status().code() == StatusCode::kWriteConflict) {
          conflicts.fetch_add(1);
          if (!db.rollback(txn).ok()) {
            failures.fetch_add(1);
            return;
          }
          continue;
        }
        if (!updated.ok()) {
          failures.fetch_add(1);
          return;
        }
        Status status = db.commit(txn);
        if (status.ok()) {
          ++done;
        } else if (status.is_serialization_conflict()) {
          conflicts.fetch_add(1);
        } else {
          failures.fetch_add(1);
          return;
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  ASSERT_EQ(failures.load(), 0);
  txn_id_t check = test::begin(db, IsolationLevel::READ_COMMITTED);
  Result result = db.read(check, "counters");
  ASSERT_EQ(result.row_count(), 1u);
  EXPECT_EQ(result.rows()[0]["value"].as_int64(),
            static_cast<int64_t>(kThreads * kIncrements));

  EngineStats stats = db.stats();
  EXPECT_EQ(stats.committed_transactions,
            static_cast<size_t>(1 + kThreads * kIncrements));
  EXPECT_EQ(stats.aborted_transactions, static_cast<size_t>(conflicts.load()));
}

TEST(DatabaseStressTest, SnapshotReadersSeeStableTotals) {
  // Writers move value between two accounts; every snapshot sums to 100
  Database db(test::quiet_options());
  ASSERT_TRUE(db.create_table("accounts", {ColumnDef("balance", TypeId::BIGINT)})
                  .ok());
  txn_id_t seed = test::begin(db, IsolationLevel::READ_COMMITTED);
  ASSERT_TRUE(
      db.insert(seed, "accounts", 1, {{"balance", Value(int64_t(50))}}).ok());
  ASSERT_TRUE(
      db.insert(seed, "accounts", 2, {{"balance", Value(int64_t(50))}}).ok());
  ASSERT_TRUE(db.commit(seed).ok());

  std::atomic<bool> stop{false};
  std::atomic<int> bad_totals{0};

  std::thread writer([&] {
    for (int i = 0; i < 200; ++i) {
      txn_id_t txn = 0;
      if (!db.begin_transaction(IsolationLevel::SERIALIZABLE, &txn).ok()) {
        break;
      }
      Result rows = db.read(txn, "accounts");
      int64_t a = rows.rows()[0]["balance"].as_int64();
      int64_t b = rows.rows()[1]["balance"].as_int64();
      int64_t amount = (i % 2 == 0) ? 1 : -1;
      if (!db.update(txn, "accounts", 1, {{"balance", Value(a - amount)}})
               .ok() ||
          !db.update(txn, "accounts", 2, {{"balance", Value(b + amount)}})
               .ok()) {
        (void)db.rollback(txn);
        continue;
      }
      (void)db.commit(txn);
    }
    stop.store(true);
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      while (!stop.load()) {
        txn_id_t txn = 0;
        if (!db.begin_transaction(IsolationLevel::REPEATABLE_READ, &txn)
                 .ok()) {
          return;
        }
        int64_t total = 0;
        for (const auto &row : db.read(txn, "accounts")) {
          total += row["balance"].as_int64();
        }
        if (total != 100) {
          bad_totals.fetch_add(1);
        }
        (void)db.commit(txn);
      }
    });
  }

  writer.join();
  for (auto &reader : readers) {
    reader.join();
  }
  EXPECT_EQ(bad_totals.load(), 0);
}

} // namespace
} // namespace mvccdb
