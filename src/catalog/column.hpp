#pragma once

/**
 * @file column.hpp
 * @brief Column metadata
 */

#include <string>

#include "common/types.hpp"
#include "mvccdb/result.hpp"
#include "mvccdb/status.hpp"

namespace mvccdb {

/**
 * @brief Column definition in a table schema
 */
class Column {
public:
    Column(std::string name, TypeId type, size_t length = 0);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] TypeId type() const noexcept { return type_; }
    [[nodiscard]] size_t length() const noexcept { return length_; }
    [[nodiscard]] bool is_nullable() const noexcept { return nullable_; }

    void set_nullable(bool nullable) noexcept { nullable_ = nullable; }

    /**
     * @brief Convert a caller-supplied value to this column's storage type
     *
     * INTEGER accepts any integer that fits in 32 bits, BIGINT any integer,
     * DOUBLE any number. VARCHAR values are checked against length().
     *
     * @return Status::InvalidArgument on a type mismatch, overflow, length
     *         violation or NULL in a NOT NULL column
     */
    [[nodiscard]] Status coerce(const Value& value, Value* out) const;

    [[nodiscard]] ColumnDef to_def() const { return ColumnDef(name_, type_, length_, nullable_); }

private:
    std::string name_;
    TypeId type_;
    size_t length_;
    bool nullable_ = true;
};

}  // namespace mvccdb
