#pragma once

/**
 * @file schema.hpp
 * @brief Table schema definition
 */

#include <string>
#include <vector>

#include "catalog/column.hpp"
#include "mvccdb/predicate.hpp"

namespace mvccdb {

/**
 * @brief Table schema - defines the structure of a table
 */
class Schema {
public:
    Schema() = default;
    explicit Schema(std::vector<Column> columns);

    [[nodiscard]] const std::vector<Column>& columns() const noexcept {
        return columns_;
    }

    [[nodiscard]] size_t column_count() const noexcept {
        return columns_.size();
    }

    [[nodiscard]] const Column& column(size_t idx) const {
        return columns_.at(idx);
    }

    /// Get column index by name, returns -1 if not found
    [[nodiscard]] int get_column_index(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> column_names() const;

    /**
     * @brief Apply column assignments to a row laid out in schema order
     *
     * @param assignments Column name / value pairs
     * @param row In: base values (one per column). Out: assigned columns
     *            replaced by their coerced values
     * @return Status::InvalidArgument for unknown or repeated columns and for
     *         values the column rejects; row is untouched on error
     */
    [[nodiscard]] Status apply(const ColumnValues& assignments, std::vector<Value>* row) const;

    /**
     * @brief Check that a full row matches this schema exactly
     */
    [[nodiscard]] Status validate(const std::vector<Value>& row) const;

    /**
     * @brief Check that every column a predicate reads exists
     * @return Status::InvalidArgument naming the first unknown column
     */
    [[nodiscard]] Status check_predicate(const Predicate* predicate) const;

private:
    std::vector<Column> columns_;
};

}  // namespace mvccdb
