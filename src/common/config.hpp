#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for mvccdb
 */

#include <cstddef>
#include <cstdint>

#include "mvccdb/types.hpp"

namespace mvccdb {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Transaction Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// First transaction id handed out by a fresh registry
constexpr txn_id_t kFirstTransactionId = 1;

// ─────────────────────────────────────────────────────────────────────────────
// Catalog Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Maximum table name length
constexpr size_t kMaxTableNameLength = 128;

/// Maximum column name length
constexpr size_t kMaxColumnNameLength = 64;

/// Maximum columns per table
constexpr size_t kMaxColumnsPerTable = 256;

/// First record id allocated for a table when the caller supplies none
constexpr record_id_t kFirstRecordId = 1;

// ─────────────────────────────────────────────────────────────────────────────
// Value Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Maximum VARCHAR length (also the bound for unbounded VARCHAR columns)
constexpr size_t kMaxVarcharLength = 65536;

// ─────────────────────────────────────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────────────────────────────────────

/// Default logger name
constexpr const char* kDefaultLoggerName = "mvccdb";

/// Log line pattern: time, coloured level, source location, message
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

}  // namespace config
}  // namespace mvccdb
