/**
 * @file query_benchmark.cpp
 * @brief Benchmarks for visible-version reads
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>

#include <mvccdb/mvccdb.hpp>

#include "bench_utils.hpp"
#include "sqlite_utils.hpp"

namespace {

using mvccdb::bench::SkipWithResult;
using mvccdb::bench::SkipWithStatus;

static void BM_Mvccdb_PointSelect(benchmark::State &state) {
    const int64_t rows = state.range(0);

    mvccdb::Database db(mvccdb::bench::bench_options());
    auto status = mvccdb::bench::populate(db, rows);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }

    mvccdb::txn_id_t txn = 0;
    status = db.begin_transaction(mvccdb::IsolationLevel::READ_COMMITTED, &txn);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }

    const int64_t target = rows > 0 ? rows / 2 : 0;
    auto predicate = mvccdb::Predicate::eq("value", mvccdb::Value(target));

    for (auto _ : state) {
        auto result = db.read(txn, "bench", predicate.get());
        if (!result.ok()) {
            SkipWithResult(state, result);
            return;
        }
        benchmark::DoNotOptimize(result.row_count());
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Mvccdb_PointSelect)->Arg(1000)->Arg(10000);

/// Full-table reads from snapshot transactions on several threads while the
/// table keeps a few versions per record
static void BM_Mvccdb_ConcurrentSnapshotScan(benchmark::State &state) {
    static std::unique_ptr<mvccdb::Database> db;
    constexpr int64_t kRows = 1000;

    if (state.thread_index() == 0) {
        db = std::make_unique<mvccdb::Database>(mvccdb::bench::bench_options());
        auto status = mvccdb::bench::populate(*db, kRows);

        // Stack a second committed version on every record
        mvccdb::txn_id_t txn = 0;
        if (status.ok()) {
            status = db->begin_transaction(mvccdb::IsolationLevel::READ_COMMITTED, &txn);
        }
        if (status.ok()) {
            auto result = db->update(txn, "bench", std::nullopt, {{"value", mvccdb::Value(int64_t{0})}});
            status = result.ok() ? db->commit(txn) : result.status();
        }
        if (!status.ok()) {
            SkipWithStatus(state, status);
        }
    }

    for (auto _ : state) {
        mvccdb::txn_id_t txn = 0;
        auto status = db->begin_transaction(mvccdb::IsolationLevel::REPEATABLE_READ, &txn);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            break;
        }
        auto result = db->read(txn, "bench");
        if (!result.ok()) {
            SkipWithResult(state, result);
            break;
        }
        benchmark::DoNotOptimize(result.row_count());
        status = db->commit(txn);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            break;
        }
    }

    state.SetItemsProcessed(state.iterations() * kRows);
    if (state.thread_index() == 0) {
        db.reset();
    }
}

BENCHMARK(BM_Mvccdb_ConcurrentSnapshotScan)->Threads(1)->Threads(4)->UseRealTime();

#ifdef MVCCDB_BENCH_HAS_SQLITE
static void BM_Sqlite_PointSelect(benchmark::State &state) {
    const int64_t rows = state.range(0);

    mvccdb::bench::SqliteDb db;
    if (!db.ok()) {
        state.SkipWithError("sqlite3_open failed");
        return;
    }

    std::string error;
    if (!db.exec("CREATE TABLE bench (id INTEGER PRIMARY KEY, value INTEGER);", &error)) {
        state.SkipWithError(error.c_str());
        return;
    }
    if (!db.exec("BEGIN;", &error)) {
        state.SkipWithError(error.c_str());
        return;
    }

    for (int64_t i = 1; i <= rows; ++i) {
        const std::string sql =
            "INSERT INTO bench VALUES (" + std::to_string(i) + ", " +
            std::to_string(i) + ");";
        if (!db.exec(sql, &error)) {
            state.SkipWithError(error.c_str());
            return;
        }
    }

    if (!db.exec("COMMIT;", &error)) {
        state.SkipWithError(error.c_str());
        return;
    }

    // Unindexed column, matching the full scan the engine performs
    const int64_t target = rows > 0 ? rows / 2 : 0;
    const std::string query =
        "SELECT id FROM bench WHERE value = " + std::to_string(target) + ";";

    for (auto _ : state) {
        if (!db.exec(query, &error)) {
            state.SkipWithError(error.c_str());
            return;
        }
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Sqlite_PointSelect)->Arg(1000)->Arg(10000);
#endif

}  // namespace
