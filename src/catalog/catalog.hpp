#pragma once

/**
 * @file catalog.hpp
 * @brief System catalog for table metadata
 *
 * The catalog maps table names to TableInfo: the schema, creation time and
 * the VersionStore holding the table's records.
 */

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "catalog/schema.hpp"
#include "common/types.hpp"
#include "mvccdb/status.hpp"
#include "storage/version_store.hpp"

namespace mvccdb {

// ─────────────────────────────────────────────────────────────────────────────
// TableInfo - Complete table metadata
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Complete information about a table
 */
struct TableInfo {
  oid_t oid;                           ///< Unique table identifier
  std::string name;                    ///< Table name
  Schema schema;                       ///< Table schema (column definitions)
  Timestamp created_at;                ///< When the table was created
  std::shared_ptr<VersionStore> store; ///< Version chains of the table's records

  TableInfo(oid_t id, std::string n, Schema s, Timestamp at,
            std::shared_ptr<VersionStore> vs)
      : oid(id), name(std::move(n)), schema(std::move(s)), created_at(at),
        store(std::move(vs)) {}
};

// ─────────────────────────────────────────────────────────────────────────────
// Catalog - System catalog manager
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief System catalog - manages table metadata
 *
 * Lookups hand out shared ownership, so a table dropped while an operation
 * is running stays alive until that operation finishes.
 *
 * Thread safety: all methods are thread-safe.
 */
class Catalog {
public:
  Catalog() = default;
  ~Catalog() = default;

  Catalog(const Catalog &) = delete;
  Catalog &operator=(const Catalog &) = delete;

  // ─────────────────────────────────────────────────────────────────────────
  // Table Management
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Create a table
   * @param table_name Identifier: a letter followed by letters, digits or '_'
   * @param columns At least one column, names unique within the table
   * @param created_at Creation time to record
   * @param out Receives the new table (optional)
   * @return Status::InvalidArgument for bad names or columns,
   *         Status::AlreadyExists if the name is taken
   */
  [[nodiscard]] Status create_table(const std::string &table_name,
                                    const std::vector<ColumnDef> &columns,
                                    Timestamp created_at,
                                    std::shared_ptr<TableInfo> *out = nullptr);

  [[nodiscard]] Status drop_table(const std::string &table_name);

  /**
   * @brief Look up a table, nullptr if it does not exist
   */
  [[nodiscard]] std::shared_ptr<TableInfo>
  get_table(const std::string &table_name) const;

  [[nodiscard]] bool table_exists(const std::string &table_name) const;

  /// Table names in ascending order
  [[nodiscard]] std::vector<std::string> get_table_names() const;

  /// Every table in ascending name order
  [[nodiscard]] std::vector<std::shared_ptr<TableInfo>> get_tables() const;

  [[nodiscard]] size_t table_count() const;

  /**
   * @brief Check a table or column identifier
   */
  [[nodiscard]] static bool is_valid_identifier(const std::string &name,
                                                size_t max_length);

private:
  std::map<std::string, std::shared_ptr<TableInfo>> tables_;
  oid_t next_oid_ = 1;
  mutable std::shared_mutex latch_;
};

} // namespace mvccdb
