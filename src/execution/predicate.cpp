/**
 * @file predicate.cpp
 * @brief Predicate implementations
 */

#include "mvccdb/predicate.hpp"

namespace mvccdb {

const char *comparison_type_to_string(ComparisonType type) noexcept {
  switch (type) {
  case ComparisonType::EQUAL:
    return "=";
  case ComparisonType::NOT_EQUAL:
    return "<>";
  case ComparisonType::LESS_THAN:
    return "<";
  case ComparisonType::LESS_EQUAL:
    return "<=";
  case ComparisonType::GREATER_THAN:
    return ">";
  case ComparisonType::GREATER_EQUAL:
    return ">=";
  }
  return "?";
}

// ─────────────────────────────────────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<Predicate> Predicate::compare(std::string column,
                                              ComparisonType op, Value value) {
  return std::make_unique<ComparisonPredicate>(std::move(column), op,
                                               std::move(value));
}

std::unique_ptr<Predicate> Predicate::eq(std::string column, Value value) {
  return compare(std::move(column), ComparisonType::EQUAL, std::move(value));
}

std::unique_ptr<Predicate> Predicate::all_of(std::unique_ptr<Predicate> left,
                                             std::unique_ptr<Predicate> right) {
  return std::make_unique<LogicalPredicate>(LogicalOpType::AND, std::move(left),
                                            std::move(right));
}

std::unique_ptr<Predicate> Predicate::any_of(std::unique_ptr<Predicate> left,
                                             std::unique_ptr<Predicate> right) {
  return std::make_unique<LogicalPredicate>(LogicalOpType::OR, std::move(left),
                                            std::move(right));
}

std::unique_ptr<Predicate> Predicate::negate(std::unique_ptr<Predicate> operand) {
  return std::make_unique<LogicalPredicate>(LogicalOpType::NOT,
                                            std::move(operand));
}

std::unique_ptr<Predicate> Predicate::is_null(std::string column, bool negated) {
  return std::make_unique<IsNullPredicate>(std::move(column), negated);
}

// ─────────────────────────────────────────────────────────────────────────────
// ComparisonPredicate
// ─────────────────────────────────────────────────────────────────────────────

ComparisonPredicate::ComparisonPredicate(std::string column, ComparisonType op,
                                         Value value)
    : Predicate(PredicateType::COMPARISON), column_(std::move(column)), op_(op),
      value_(std::move(value)) {}

Value ComparisonPredicate::evaluate(const Row &row) const {
  const Value &lval = row[column_];

  // NULL comparisons return NULL (except IS NULL)
  std::optional<int> cmp = lval.compare(value_);
  if (!cmp.has_value()) {
    if (lval.is_null() || value_.is_null()) {
      return Value();
    }
    // Incomparable types are simply unequal
    return Value(op_ == ComparisonType::NOT_EQUAL);
  }

  int cmp_result = *cmp;
  bool result = false;
  switch (op_) {
  case ComparisonType::EQUAL:
    result = (cmp_result == 0);
    break;
  case ComparisonType::NOT_EQUAL:
    result = (cmp_result != 0);
    break;
  case ComparisonType::LESS_THAN:
    result = (cmp_result < 0);
    break;
  case ComparisonType::LESS_EQUAL:
    result = (cmp_result <= 0);
    break;
  case ComparisonType::GREATER_THAN:
    result = (cmp_result > 0);
    break;
  case ComparisonType::GREATER_EQUAL:
    result = (cmp_result >= 0);
    break;
  }

  return Value(result);
}

void ComparisonPredicate::collect_columns(
    std::vector<std::string> *columns) const {
  columns->push_back(column_);
}

std::unique_ptr<Predicate> ComparisonPredicate::clone() const {
  return std::make_unique<ComparisonPredicate>(column_, op_, value_);
}

std::string ComparisonPredicate::to_string() const {
  std::string rendered =
      value_.is_string() ? "'" + value_.as_string() + "'" : value_.to_string();
  return column_ + " " + comparison_type_to_string(op_) + " " + rendered;
}

// ─────────────────────────────────────────────────────────────────────────────
// LogicalPredicate
// ─────────────────────────────────────────────────────────────────────────────

LogicalPredicate::LogicalPredicate(LogicalOpType op,
                                   std::unique_ptr<Predicate> left,
                                   std::unique_ptr<Predicate> right)
    : Predicate(PredicateType::LOGICAL), op_(op), left_(std::move(left)),
      right_(std::move(right)) {}

Value LogicalPredicate::evaluate(const Row &row) const {
  Value lval = left_->evaluate(row);

  switch (op_) {
  case LogicalOpType::NOT: {
    if (lval.is_null())
      return Value();
    return Value(!lval.as_bool());
  }

  case LogicalOpType::AND: {
    // Short-circuit: if left is false, result is false
    if (!lval.is_null() && !lval.as_bool()) {
      return Value(false);
    }
    Value rval = right_->evaluate(row);
    if (!rval.is_null() && !rval.as_bool()) {
      return Value(false);
    }
    if (lval.is_null() || rval.is_null()) {
      return Value();
    }
    return Value(true);
  }

  case LogicalOpType::OR: {
    // Short-circuit: if left is true, result is true
    if (!lval.is_null() && lval.as_bool()) {
      return Value(true);
    }
    Value rval = right_->evaluate(row);
    if (!rval.is_null() && rval.as_bool()) {
      return Value(true);
    }
    if (lval.is_null() || rval.is_null()) {
      return Value();
    }
    return Value(false);
  }
  }

  return Value();
}

void LogicalPredicate::collect_columns(std::vector<std::string> *columns) const {
  left_->collect_columns(columns);
  if (right_) {
    right_->collect_columns(columns);
  }
}

std::unique_ptr<Predicate> LogicalPredicate::clone() const {
  return std::make_unique<LogicalPredicate>(
      op_, left_->clone(), right_ ? right_->clone() : nullptr);
}

std::string LogicalPredicate::to_string() const {
  switch (op_) {
  case LogicalOpType::NOT:
    return "NOT (" + left_->to_string() + ")";
  case LogicalOpType::AND:
    return "(" + left_->to_string() + " AND " + right_->to_string() + ")";
  case LogicalOpType::OR:
    return "(" + left_->to_string() + " OR " + right_->to_string() + ")";
  }
  return "";
}

// ─────────────────────────────────────────────────────────────────────────────
// IsNullPredicate
// ─────────────────────────────────────────────────────────────────────────────

IsNullPredicate::IsNullPredicate(std::string column, bool negated)
    : Predicate(PredicateType::IS_NULL), column_(std::move(column)),
      negated_(negated) {}

Value IsNullPredicate::evaluate(const Row &row) const {
  bool is_null = row[column_].is_null();
  return Value(negated_ ? !is_null : is_null);
}

void IsNullPredicate::collect_columns(std::vector<std::string> *columns) const {
  columns->push_back(column_);
}

std::unique_ptr<Predicate> IsNullPredicate::clone() const {
  return std::make_unique<IsNullPredicate>(column_, negated_);
}

std::string IsNullPredicate::to_string() const {
  return column_ + (negated_ ? " IS NOT NULL" : " IS NULL");
}

} // namespace mvccdb
