#pragma once

/**
 * @file types.hpp
 * @brief Public identifiers, isolation levels and column types for mvccdb
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "mvccdb/status.hpp"

namespace mvccdb {

// ─────────────────────────────────────────────────────────────────────────────
// Identifiers
// ─────────────────────────────────────────────────────────────────────────────

/// Transaction identifier. Allocated from 1 upward, never reused.
using txn_id_t = uint64_t;

/// Logical record key, stable across all versions of a record
using record_id_t = int64_t;

/// Wall-clock timestamp used for diagnostics (never for visibility)
using Timestamp = std::chrono::system_clock::time_point;

// ─────────────────────────────────────────────────────────────────────────────
// Isolation Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class IsolationLevel : uint8_t {
    READ_UNCOMMITTED = 0,  // Sees uncommitted changes of other transactions
    READ_COMMITTED = 1,    // Sees the latest committed version on every read
    REPEATABLE_READ = 2,   // Sees the snapshot taken at begin
    SERIALIZABLE = 3       // Snapshot reads + first-committer-wins on commit
};

/**
 * @brief Convert an isolation level to its canonical name
 */
[[nodiscard]] constexpr const char* isolation_level_to_string(IsolationLevel level) noexcept {
    switch (level) {
        case IsolationLevel::READ_UNCOMMITTED: return "READ_UNCOMMITTED";
        case IsolationLevel::READ_COMMITTED:   return "READ_COMMITTED";
        case IsolationLevel::REPEATABLE_READ:  return "REPEATABLE_READ";
        case IsolationLevel::SERIALIZABLE:     return "SERIALIZABLE";
    }
    return "UNKNOWN";
}

/**
 * @brief Check that a (possibly cast) value names a real isolation level
 */
[[nodiscard]] constexpr bool is_valid_isolation_level(IsolationLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(IsolationLevel::SERIALIZABLE);
}

/**
 * @brief Parse an isolation level name
 *
 * Accepts the canonical names case-insensitively, with either underscores or
 * spaces between words ("read committed", "SERIALIZABLE").
 *
 * @return Status::InvalidIsolation for unknown names
 */
[[nodiscard]] Status parse_isolation_level(std::string_view name, IsolationLevel* out);

// ─────────────────────────────────────────────────────────────────────────────
// Transaction Status
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Transaction lifecycle: ACTIVE -> COMMITTED | ABORTED (terminal)
 */
enum class TransactionStatus : uint8_t {
    ACTIVE = 0,
    COMMITTED = 1,
    ABORTED = 2
};

[[nodiscard]] constexpr const char* transaction_status_to_string(TransactionStatus status) noexcept {
    switch (status) {
        case TransactionStatus::ACTIVE:    return "ACTIVE";
        case TransactionStatus::COMMITTED: return "COMMITTED";
        case TransactionStatus::ABORTED:   return "ABORTED";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Column Types
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Column data types supported by mvccdb
 */
enum class TypeId : uint8_t {
    INVALID = 0,
    BOOLEAN,
    INTEGER,    // 32-bit signed
    BIGINT,     // 64-bit signed
    DOUBLE,
    VARCHAR,    // Variable-length string
};

[[nodiscard]] constexpr const char* type_id_to_string(TypeId type) noexcept {
    switch (type) {
        case TypeId::BOOLEAN: return "BOOLEAN";
        case TypeId::INTEGER: return "INTEGER";
        case TypeId::BIGINT:  return "BIGINT";
        case TypeId::DOUBLE:  return "DOUBLE";
        case TypeId::VARCHAR: return "VARCHAR";
        default:              return "INVALID";
    }
}

/**
 * @brief Column declaration used when creating a table
 */
struct ColumnDef {
    std::string name;
    TypeId type = TypeId::INVALID;
    size_t length = 0;      ///< Max length for VARCHAR, 0 = unbounded
    bool nullable = true;

    ColumnDef() = default;
    ColumnDef(std::string n, TypeId t, size_t len = 0, bool null_ok = true)
        : name(std::move(n)), type(t), length(len), nullable(null_ok) {}
};

}  // namespace mvccdb
