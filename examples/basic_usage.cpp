/**
 * @file basic_usage.cpp
 * @brief Basic usage example for mvccdb: one record seen through each
 *        isolation level
 */

#include <iostream>

#include <mvccdb/mvccdb.hpp>

namespace {

void print_rows(const char* label, const mvccdb::Result& result) {
    std::cout << "  " << label << ":";
    if (!result.ok()) {
        std::cout << " " << result.status().to_string() << "\n";
        return;
    }
    if (result.rows().empty()) {
        std::cout << " (no rows)";
    }
    for (const auto& row : result) {
        std::cout << " [" << row.record_id() << " " << row["name"].to_string() << " "
                  << row["balance"].to_string() << "]";
    }
    std::cout << "\n";
}

bool check(const mvccdb::Status& status, const char* what) {
    if (!status.ok()) {
        std::cerr << what << " failed: " << status.to_string() << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    std::cout << "mvccdb v" << mvccdb::version() << "\n\n";

    mvccdb::DatabaseOptions options;
    options.name = "example";
    options.log_level = "warn";
    mvccdb::Database db(options);

    if (!check(db.create_table("accounts", {mvccdb::ColumnDef("name", mvccdb::TypeId::VARCHAR, 32),
                                            mvccdb::ColumnDef("balance", mvccdb::TypeId::BIGINT)}),
               "CREATE TABLE")) {
        return 1;
    }

    mvccdb::txn_id_t setup = 0;
    if (!check(db.begin_transaction(mvccdb::IsolationLevel::READ_COMMITTED, &setup), "BEGIN") ||
        !check(db.insert(setup, "accounts", 1,
                         {{"name", mvccdb::Value("alice")}, {"balance", mvccdb::Value(int64_t{100})}})
                   .status(),
               "INSERT") ||
        !check(db.commit(setup), "COMMIT")) {
        return 1;
    }

    // One reader per isolation level, all started before the writer
    mvccdb::txn_id_t readers[4] = {};
    const mvccdb::IsolationLevel levels[4] = {
        mvccdb::IsolationLevel::READ_UNCOMMITTED, mvccdb::IsolationLevel::READ_COMMITTED,
        mvccdb::IsolationLevel::REPEATABLE_READ, mvccdb::IsolationLevel::SERIALIZABLE};
    for (int i = 0; i < 4; ++i) {
        if (!check(db.begin_transaction(levels[i], &readers[i]), "BEGIN")) {
            return 1;
        }
    }

    mvccdb::txn_id_t writer = 0;
    if (!check(db.begin_transaction(mvccdb::IsolationLevel::READ_COMMITTED, &writer), "BEGIN") ||
        !check(db.update(writer, "accounts", 1, {{"balance", mvccdb::Value(int64_t{50})}}).status(),
               "UPDATE")) {
        return 1;
    }

    std::cout << "Writer updated balance to 50 (uncommitted):\n";
    for (int i = 0; i < 4; ++i) {
        print_rows(mvccdb::isolation_level_to_string(levels[i]), db.read(readers[i], "accounts"));
    }

    if (!check(db.commit(writer), "COMMIT")) {
        return 1;
    }

    std::cout << "\nWriter committed:\n";
    for (int i = 0; i < 4; ++i) {
        print_rows(mvccdb::isolation_level_to_string(levels[i]), db.read(readers[i], "accounts"));
    }

    // The serializable reader now tries to write the same record
    mvccdb::txn_id_t late = readers[3];
    if (!check(db.update(late, "accounts", 1, {{"balance", mvccdb::Value(int64_t{0})}}).status(),
               "UPDATE")) {
        return 1;
    }
    auto status = db.commit(late);
    std::cout << "\nSerializable commit after a concurrent writer: " << status.to_string() << "\n";

    for (int i = 0; i < 3; ++i) {
        (void)db.commit(readers[i]);
    }

    auto stats = db.stats();
    std::cout << "\nTransactions: " << stats.committed_transactions << " committed, "
              << stats.aborted_transactions << " aborted, " << stats.active_transactions
              << " active\n";

    db.close();
    std::cout << "Engine closed.\n";
    return 0;
}
