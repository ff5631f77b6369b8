#pragma once

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

#include <mvccdb/mvccdb.hpp>

namespace mvccdb::bench {

inline DatabaseOptions bench_options() {
    DatabaseOptions options;
    options.name = "bench";
    options.log_level = "warn";
    return options;
}

inline void SkipWithStatus(benchmark::State &state, const Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

inline void SkipWithResult(benchmark::State &state, const Result &result) {
    SkipWithStatus(state, result.status());
}

/**
 * @brief Create table "bench" (value BIGINT) and commit records 1..rows
 */
inline Status populate(Database &db, int64_t rows) {
    Status status = db.create_table("bench", {ColumnDef("value", TypeId::BIGINT)});
    if (!status.ok()) {
        return status;
    }

    txn_id_t txn = 0;
    status = db.begin_transaction(IsolationLevel::READ_COMMITTED, &txn);
    if (!status.ok()) {
        return status;
    }
    for (int64_t i = 1; i <= rows; ++i) {
        Result result = db.insert(txn, "bench", i, {{"value", Value(i)}});
        if (!result.ok()) {
            return result.status();
        }
    }
    return db.commit(txn);
}

}  // namespace mvccdb::bench
