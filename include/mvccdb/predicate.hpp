#pragma once

/**
 * @file predicate.hpp
 * @brief Structured row predicates for read, update and remove
 *
 * Predicates are built by the caller (the engine never parses text) and
 * evaluated against each visible row. Evaluation follows SQL three-valued
 * logic: a comparison involving NULL yields NULL, and a row matches only
 * when the predicate yields TRUE.
 */

#include <memory>
#include <string>
#include <vector>

#include "mvccdb/result.hpp"

namespace mvccdb {

// ─────────────────────────────────────────────────────────────────────────────
// Predicate Types
// ─────────────────────────────────────────────────────────────────────────────

enum class PredicateType {
    COMPARISON,  // column <op> constant
    LOGICAL,     // AND, OR, NOT
    IS_NULL,     // IS NULL / IS NOT NULL
};

enum class ComparisonType {
    EQUAL,          // =
    NOT_EQUAL,      // <> or !=
    LESS_THAN,      // <
    LESS_EQUAL,     // <=
    GREATER_THAN,   // >
    GREATER_EQUAL,  // >=
};

enum class LogicalOpType {
    AND,
    OR,
    NOT,
};

[[nodiscard]] const char* comparison_type_to_string(ComparisonType type) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Predicate Base Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Base class for all predicates
 */
class Predicate {
public:
    explicit Predicate(PredicateType type) : type_(type) {}
    virtual ~Predicate() = default;

    [[nodiscard]] PredicateType type() const noexcept { return type_; }

    /**
     * @brief Evaluate against a row
     * @return A boolean Value, or NULL when the outcome is unknown
     */
    [[nodiscard]] virtual Value evaluate(const Row& row) const = 0;

    /**
     * @brief Append every column name this predicate reads
     */
    virtual void collect_columns(std::vector<std::string>* columns) const = 0;

    [[nodiscard]] virtual std::unique_ptr<Predicate> clone() const = 0;

    [[nodiscard]] virtual std::string to_string() const = 0;

    /**
     * @brief True iff the predicate evaluates to TRUE for the row
     */
    [[nodiscard]] bool matches(const Row& row) const {
        Value result = evaluate(row);
        return !result.is_null() && result.as_bool();
    }

    // Builders
    [[nodiscard]] static std::unique_ptr<Predicate> compare(std::string column, ComparisonType op,
                                                            Value value);
    [[nodiscard]] static std::unique_ptr<Predicate> eq(std::string column, Value value);
    [[nodiscard]] static std::unique_ptr<Predicate> all_of(std::unique_ptr<Predicate> left,
                                                           std::unique_ptr<Predicate> right);
    [[nodiscard]] static std::unique_ptr<Predicate> any_of(std::unique_ptr<Predicate> left,
                                                           std::unique_ptr<Predicate> right);
    [[nodiscard]] static std::unique_ptr<Predicate> negate(std::unique_ptr<Predicate> operand);
    [[nodiscard]] static std::unique_ptr<Predicate> is_null(std::string column, bool negated = false);

private:
    PredicateType type_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Comparison Predicate
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Compares a column against a constant
 */
class ComparisonPredicate : public Predicate {
public:
    ComparisonPredicate(std::string column, ComparisonType op, Value value);

    [[nodiscard]] Value evaluate(const Row& row) const override;
    void collect_columns(std::vector<std::string>* columns) const override;
    [[nodiscard]] std::unique_ptr<Predicate> clone() const override;
    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] const std::string& column() const noexcept { return column_; }
    [[nodiscard]] ComparisonType op() const noexcept { return op_; }
    [[nodiscard]] const Value& value() const noexcept { return value_; }

private:
    std::string column_;
    ComparisonType op_;
    Value value_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Logical Predicate
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief AND / OR of two predicates, or NOT of one (right is null)
 */
class LogicalPredicate : public Predicate {
public:
    LogicalPredicate(LogicalOpType op, std::unique_ptr<Predicate> left,
                     std::unique_ptr<Predicate> right = nullptr);

    [[nodiscard]] Value evaluate(const Row& row) const override;
    void collect_columns(std::vector<std::string>* columns) const override;
    [[nodiscard]] std::unique_ptr<Predicate> clone() const override;
    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] LogicalOpType op() const noexcept { return op_; }

private:
    LogicalOpType op_;
    std::unique_ptr<Predicate> left_;
    std::unique_ptr<Predicate> right_;
};

// ─────────────────────────────────────────────────────────────────────────────
// IS NULL Predicate
// ─────────────────────────────────────────────────────────────────────────────

class IsNullPredicate : public Predicate {
public:
    IsNullPredicate(std::string column, bool negated);

    [[nodiscard]] Value evaluate(const Row& row) const override;
    void collect_columns(std::vector<std::string>* columns) const override;
    [[nodiscard]] std::unique_ptr<Predicate> clone() const override;
    [[nodiscard]] std::string to_string() const override;

private:
    std::string column_;
    bool negated_;
};

}  // namespace mvccdb
