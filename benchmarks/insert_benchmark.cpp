/**
 * @file insert_benchmark.cpp
 * @brief Benchmarks for insert and commit throughput
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

static void BM_Mvccdb_InsertBatch(benchmark::State &state) {
    const int64_t rows = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        {
            mvccdb::Database db(mvccdb::bench::bench_options());
            auto status = db.create_table(
                "bench", {mvccdb::ColumnDef("value", mvccdb::TypeId::BIGINT)});
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
            state.ResumeTiming();

            for (int64_t i = 1; i <= rows; ++i) {
                auto result = db.insert(txn, "bench", i, {{"value", mvccdb::Value(i)}});
                if (!result.ok()) {
                    SkipWithResult(state, result);
                    return;
                }
            }

            status = db.commit(txn);
            if (!status.ok()) {
                SkipWithStatus(state, status);
                return;
            }

            state.PauseTiming();
        }

        state.ResumeTiming();
    }

    state.SetItemsProcessed(state.iterations() * rows);
}

BENCHMARK(BM_Mvccdb_InsertBatch)->Arg(1000)->Arg(10000);

/// One SERIALIZABLE transaction per insert, threads writing disjoint keys
static void BM_Mvccdb_SerializableCommit(benchmark::State &state) {
    static std::unique_ptr<mvccdb::Database> db;
    if (state.thread_index() == 0) {
        db = std::make_unique<mvccdb::Database>(mvccdb::bench::bench_options());
        auto status = db->create_table(
            "bench", {mvccdb::ColumnDef("value", mvccdb::TypeId::BIGINT)});
        if (!status.ok()) {
            SkipWithStatus(state, status);
        }
    }

    // Each thread owns a disjoint id range
    int64_t next_id = static_cast<int64_t>(state.thread_index()) * 100000000 + 1;
    for (auto _ : state) {
        mvccdb::txn_id_t txn = 0;
        auto status = db->begin_transaction(mvccdb::IsolationLevel::SERIALIZABLE, &txn);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            break;
        }
        auto result = db->insert(txn, "bench", next_id, {{"value", mvccdb::Value(next_id)}});
        if (!result.ok()) {
            SkipWithResult(state, result);
            break;
        }
        status = db->commit(txn);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            break;
        }
        ++next_id;
    }

    state.SetItemsProcessed(state.iterations());
    if (state.thread_index() == 0) {
        db.reset();
    }
}

BENCHMARK(BM_Mvccdb_SerializableCommit)->Threads(1)->Threads(4)->UseRealTime();

#ifdef MVCCDB_BENCH_HAS_SQLITE
static void BM_Sqlite_InsertBatch(benchmark::State &state) {
    const int64_t rows = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        {
            mvccdb::bench::SqliteDb db;
            if (!db.ok()) {
                state.SkipWithError("sqlite3_open failed");
                return;
            }

            std::string error;
            if (!db.exec("CREATE TABLE bench (id INTEGER PRIMARY KEY, value INTEGER);",
                         &error)) {
                state.SkipWithError(error.c_str());
                return;
            }
            if (!db.exec("BEGIN;", &error)) {
                state.SkipWithError(error.c_str());
                return;
            }
            state.ResumeTiming();

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

            state.PauseTiming();
        }

        state.ResumeTiming();
    }

    state.SetItemsProcessed(state.iterations() * rows);
}

BENCHMARK(BM_Sqlite_InsertBatch)->Arg(1000)->Arg(10000);
#endif

}  // namespace
