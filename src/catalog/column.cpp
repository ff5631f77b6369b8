/**
 * @file column.cpp
 * @brief Column implementation
 */

#include "catalog/column.hpp"

#include <limits>

#include "common/config.hpp"

namespace mvccdb {

Column::Column(std::string name, TypeId type, size_t length)
    : name_(std::move(name)), type_(type), length_(length) {}

Status Column::coerce(const Value &value, Value *out) const {
  auto mismatch = [&]() {
    return Status::InvalidArgument("Column " + name_ + " expects " +
                                   type_id_to_string(type_) + ", got " +
                                   value.to_string());
  };

  if (value.is_null()) {
    if (!nullable_) {
      return Status::InvalidArgument("Column " + name_ + " is NOT NULL");
    }
    *out = Value();
    return Status::Ok();
  }

  switch (type_) {
  case TypeId::BOOLEAN:
    if (!value.is_bool()) {
      return mismatch();
    }
    *out = value;
    return Status::Ok();

  case TypeId::INTEGER: {
    if (value.is_int32()) {
      *out = value;
      return Status::Ok();
    }
    if (!value.is_int64()) {
      return mismatch();
    }
    int64_t v = value.as_int64();
    if (v < std::numeric_limits<int32_t>::min() ||
        v > std::numeric_limits<int32_t>::max()) {
      return Status::InvalidArgument("Value out of INTEGER range for column " +
                                     name_);
    }
    *out = Value(static_cast<int32_t>(v));
    return Status::Ok();
  }

  case TypeId::BIGINT:
    if (value.is_int64()) {
      *out = value;
      return Status::Ok();
    }
    if (value.is_int32()) {
      *out = Value(static_cast<int64_t>(value.as_int32()));
      return Status::Ok();
    }
    return mismatch();

  case TypeId::DOUBLE:
    if (value.is_double()) {
      *out = value;
    } else if (value.is_int32()) {
      *out = Value(static_cast<double>(value.as_int32()));
    } else if (value.is_int64()) {
      *out = Value(static_cast<double>(value.as_int64()));
    } else {
      return mismatch();
    }
    return Status::Ok();

  case TypeId::VARCHAR: {
    if (!value.is_string()) {
      return mismatch();
    }
    size_t limit = length_ == 0 ? config::kMaxVarcharLength : length_;
    if (value.as_string().size() > limit) {
      return Status::InvalidArgument("Value too long for column " + name_);
    }
    *out = value;
    return Status::Ok();
  }

  default:
    return Status::Internal("Column " + name_ + " has no type");
  }
}

}  // namespace mvccdb
