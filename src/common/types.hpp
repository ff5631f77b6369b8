#pragma once

/**
 * @file types.hpp
 * @brief Common type definitions for mvccdb
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <tuple>

#include "mvccdb/types.hpp"

namespace mvccdb {

// ─────────────────────────────────────────────────────────────────────────────
// Basic Type Aliases
// ─────────────────────────────────────────────────────────────────────────────

/// Object identifier (tables)
using oid_t = uint32_t;

/// Column identifier within a table
using column_id_t = uint16_t;

/// Position of a version inside its record's chain
using version_idx_t = uint32_t;

// ─────────────────────────────────────────────────────────────────────────────
// Invalid/Sentinel Values
// ─────────────────────────────────────────────────────────────────────────────

/// Invalid transaction ID; also means "not deleted" in Version::deleted_by
constexpr txn_id_t INVALID_TXN_ID = 0;

/// Invalid OID
constexpr oid_t INVALID_OID = 0;

/// Invalid column index
constexpr int INVALID_COLUMN = -1;

// ─────────────────────────────────────────────────────────────────────────────
// Write Key - identifies a record across tables
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief (table, record_id) pair tracked in write sets
 *
 * Ordering is lexicographic and is the global order in which commit latches
 * are acquired.
 */
struct WriteKey {
  std::string table;
  record_id_t record_id = 0;

  WriteKey() = default;
  WriteKey(std::string t, record_id_t r) : table(std::move(t)), record_id(r) {}

  bool operator==(const WriteKey &other) const noexcept {
    return record_id == other.record_id && table == other.table;
  }

  bool operator!=(const WriteKey &other) const noexcept {
    return !(*this == other);
  }

  bool operator<(const WriteKey &other) const noexcept {
    return std::tie(table, record_id) < std::tie(other.table, other.record_id);
  }
};

}  // namespace mvccdb

// Hash support for WriteKey
namespace std {
template <>
struct hash<mvccdb::WriteKey> {
  size_t operator()(const mvccdb::WriteKey &key) const noexcept {
    size_t h = hash<string>{}(key.table);
    return h ^ (hash<int64_t>{}(key.record_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};
}  // namespace std
