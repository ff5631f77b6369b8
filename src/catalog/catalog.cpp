/**
 * @file catalog.cpp
 * @brief Catalog implementation
 */

#include "catalog/catalog.hpp"

#include <cctype>
#include <mutex>
#include <unordered_set>

#include "common/config.hpp"

namespace mvccdb {

bool Catalog::is_valid_identifier(const std::string &name, size_t max_length) {
  if (name.empty() || name.size() > max_length) {
    return false;
  }
  if (!std::isalpha(static_cast<unsigned char>(name[0]))) {
    return false;
  }
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      return false;
    }
  }
  return true;
}

Status Catalog::create_table(const std::string &table_name,
                             const std::vector<ColumnDef> &columns,
                             Timestamp created_at,
                             std::shared_ptr<TableInfo> *out) {
  if (!is_valid_identifier(table_name, config::kMaxTableNameLength)) {
    return Status::InvalidArgument("Invalid table name: '" + table_name + "'");
  }
  if (columns.empty()) {
    return Status::InvalidArgument("Table " + table_name + " has no columns");
  }
  if (columns.size() > config::kMaxColumnsPerTable) {
    return Status::InvalidArgument("Too many columns for table " + table_name);
  }

  // Build the schema, rejecting bad or repeated column names
  std::vector<Column> schema_columns;
  schema_columns.reserve(columns.size());
  std::unordered_set<std::string> seen;
  for (const auto &def : columns) {
    if (!is_valid_identifier(def.name, config::kMaxColumnNameLength)) {
      return Status::InvalidArgument("Invalid column name: '" + def.name + "'");
    }
    if (!seen.insert(def.name).second) {
      return Status::InvalidArgument("Duplicate column name: " + def.name);
    }
    if (def.type == TypeId::INVALID) {
      return Status::InvalidArgument("Column " + def.name + " has no type");
    }
    if (def.type == TypeId::VARCHAR && def.length > config::kMaxVarcharLength) {
      return Status::InvalidArgument("VARCHAR too long for column " + def.name);
    }
    Column column(def.name, def.type, def.length);
    column.set_nullable(def.nullable);
    schema_columns.push_back(std::move(column));
  }

  std::unique_lock lock(latch_);
  if (tables_.count(table_name) > 0) {
    return Status::AlreadyExists("Table already exists: " + table_name);
  }

  auto info = std::make_shared<TableInfo>(
      next_oid_++, table_name, Schema(std::move(schema_columns)), created_at,
      std::make_shared<VersionStore>());
  tables_.emplace(table_name, info);

  if (out != nullptr) {
    *out = std::move(info);
  }
  return Status::Ok();
}

Status Catalog::drop_table(const std::string &table_name) {
  std::unique_lock lock(latch_);
  auto it = tables_.find(table_name);
  if (it == tables_.end()) {
    return Status::NotFound("Table not found: " + table_name);
  }
  tables_.erase(it);
  return Status::Ok();
}

std::shared_ptr<TableInfo>
Catalog::get_table(const std::string &table_name) const {
  std::shared_lock lock(latch_);
  auto it = tables_.find(table_name);
  return it != tables_.end() ? it->second : nullptr;
}

bool Catalog::table_exists(const std::string &table_name) const {
  std::shared_lock lock(latch_);
  return tables_.find(table_name) != tables_.end();
}

std::vector<std::string> Catalog::get_table_names() const {
  std::shared_lock lock(latch_);
  std::vector<std::string> names;
  names.reserve(tables_.size());
  for (const auto &[name, info] : tables_) {
    names.push_back(name);
  }
  return names;
}

std::vector<std::shared_ptr<TableInfo>> Catalog::get_tables() const {
  std::shared_lock lock(latch_);
  std::vector<std::shared_ptr<TableInfo>> result;
  result.reserve(tables_.size());
  for (const auto &[name, info] : tables_) {
    result.push_back(info);
  }
  return result;
}

size_t Catalog::table_count() const {
  std::shared_lock lock(latch_);
  return tables_.size();
}

} // namespace mvccdb
