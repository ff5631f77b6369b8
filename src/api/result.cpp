/**
 * @file result.cpp
 * @brief Result and Value implementations
 */

#include "mvccdb/result.hpp"

#include <stdexcept>

namespace mvccdb {

// ─────────────────────────────────────────────────────────────────────────────
// Value implementation
// ─────────────────────────────────────────────────────────────────────────────

bool Value::as_bool() const {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    throw std::runtime_error("Value is not a bool");
}

int32_t Value::as_int32() const {
    if (auto* v = std::get_if<int32_t>(&value_)) return *v;
    throw std::runtime_error("Value is not an int32");
}

int64_t Value::as_int64() const {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    throw std::runtime_error("Value is not an int64");
}

double Value::as_double() const {
    if (auto* v = std::get_if<double>(&value_)) return *v;
    throw std::runtime_error("Value is not a double");
}

const std::string& Value::as_string() const {
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    throw std::runtime_error("Value is not a string");
}

std::optional<bool> Value::try_bool() const noexcept {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    return std::nullopt;
}

std::optional<int32_t> Value::try_int32() const noexcept {
    if (auto* v = std::get_if<int32_t>(&value_)) return *v;
    return std::nullopt;
}

std::optional<int64_t> Value::try_int64() const noexcept {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    return std::nullopt;
}

std::optional<double> Value::try_double() const noexcept {
    if (auto* v = std::get_if<double>(&value_)) return *v;
    return std::nullopt;
}

std::optional<std::string_view> Value::try_string() const noexcept {
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    return std::nullopt;
}

std::optional<int> Value::compare(const Value& other) const noexcept {
    if (is_null() || other.is_null()) return std::nullopt;

    auto is_integer = [](const Value& v) { return v.is_int32() || v.is_int64(); };
    auto to_int64 = [](const Value& v) -> int64_t {
        if (auto* i = std::get_if<int32_t>(&v.value_)) return *i;
        return std::get<int64_t>(v.value_);
    };
    auto to_double = [&](const Value& v) -> double {
        if (auto* d = std::get_if<double>(&v.value_)) return *d;
        return static_cast<double>(to_int64(v));
    };

    if (is_integer(*this) && is_integer(other)) {
        int64_t l = to_int64(*this);
        int64_t r = to_int64(other);
        return (l < r) ? -1 : (l > r) ? 1 : 0;
    }
    if (is_numeric() && other.is_numeric()) {
        double l = to_double(*this);
        double r = to_double(other);
        return (l < r) ? -1 : (l > r) ? 1 : 0;
    }
    if (is_string() && other.is_string()) {
        int c = std::get<std::string>(value_).compare(std::get<std::string>(other.value_));
        return (c < 0) ? -1 : (c > 0) ? 1 : 0;
    }
    if (is_bool() && other.is_bool()) {
        bool l = std::get<bool>(value_);
        bool r = std::get<bool>(other.value_);
        return (l == r) ? 0 : (l ? 1 : -1);
    }
    return std::nullopt;
}

std::string Value::to_string() const {
    if (is_null()) return "NULL";
    if (auto* v = std::get_if<bool>(&value_)) return *v ? "true" : "false";
    if (auto* v = std::get_if<int32_t>(&value_)) return std::to_string(*v);
    if (auto* v = std::get_if<int64_t>(&value_)) return std::to_string(*v);
    if (auto* v = std::get_if<double>(&value_)) return std::to_string(*v);
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Row implementation
// ─────────────────────────────────────────────────────────────────────────────

Row::Row(record_id_t record_id, std::vector<Value> values, std::vector<std::string> column_names)
    : record_id_(record_id), values_(std::move(values)), column_names_(std::move(column_names)) {}

const Value& Row::operator[](size_t index) const {
    return values_.at(index);
}

const Value& Row::operator[](std::string_view name) const {
    for (size_t i = 0; i < column_names_.size(); ++i) {
        if (column_names_[i] == name) {
            return values_[i];
        }
    }
    throw std::runtime_error("Column not found: " + std::string(name));
}

// ─────────────────────────────────────────────────────────────────────────────
// Result implementation
// ─────────────────────────────────────────────────────────────────────────────

Result::Result(Status status) : status_(std::move(status)) {}

Result::Result(std::vector<Row> rows, std::vector<std::string> column_names)
    : status_(Status::Ok()),
      rows_(std::move(rows)),
      column_names_(std::move(column_names)) {}

Result::Result(size_t affected_rows)
    : status_(Status::Ok()), affected_rows_(affected_rows) {}

}  // namespace mvccdb
