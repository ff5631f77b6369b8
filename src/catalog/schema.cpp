/**
 * @file schema.cpp
 * @brief Schema implementation
 */

#include "catalog/schema.hpp"

namespace mvccdb {

Schema::Schema(std::vector<Column> columns) : columns_(std::move(columns)) {}

int Schema::get_column_index(const std::string &name) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name() == name) {
      return static_cast<int>(i);
    }
  }
  return INVALID_COLUMN;
}

std::vector<std::string> Schema::column_names() const {
  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const auto &column : columns_) {
    names.push_back(column.name());
  }
  return names;
}

Status Schema::apply(const ColumnValues &assignments,
                     std::vector<Value> *row) const {
  if (row->size() != columns_.size()) {
    return Status::Internal("Row width does not match schema");
  }

  std::vector<Value> updated = *row;
  std::vector<bool> assigned(columns_.size(), false);

  for (const auto &[name, value] : assignments) {
    int idx = get_column_index(name);
    if (idx == INVALID_COLUMN) {
      return Status::InvalidArgument("Column not found: " + name);
    }
    if (assigned[idx]) {
      return Status::InvalidArgument("Column assigned twice: " + name);
    }
    assigned[idx] = true;

    Status status = columns_[idx].coerce(value, &updated[idx]);
    if (!status.ok()) {
      return status;
    }
  }

  // Unassigned NOT NULL columns must already hold a value
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (updated[i].is_null() && !columns_[i].is_nullable()) {
      return Status::InvalidArgument("Column " + columns_[i].name() +
                                     " is NOT NULL");
    }
  }

  *row = std::move(updated);
  return Status::Ok();
}

Status Schema::check_predicate(const Predicate *predicate) const {
  if (predicate == nullptr) {
    return Status::Ok();
  }
  std::vector<std::string> referenced;
  predicate->collect_columns(&referenced);
  for (const auto &name : referenced) {
    if (get_column_index(name) == INVALID_COLUMN) {
      return Status::InvalidArgument("Column not found: " + name);
    }
  }
  return Status::Ok();
}

Status Schema::validate(const std::vector<Value> &row) const {
  if (row.size() != columns_.size()) {
    return Status::InvalidArgument("Row has " + std::to_string(row.size()) +
                                   " values, schema has " +
                                   std::to_string(columns_.size()));
  }
  for (size_t i = 0; i < columns_.size(); ++i) {
    Value coerced;
    Status status = columns_[i].coerce(row[i], &coerced);
    if (!status.ok()) {
      return status;
    }
    if (coerced != row[i]) {
      return Status::InvalidArgument("Value for column " + columns_[i].name() +
                                     " is not stored as " +
                                     type_id_to_string(columns_[i].type()));
    }
  }
  return Status::Ok();
}

}  // namespace mvccdb
