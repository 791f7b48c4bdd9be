#pragma once

#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sqlpager {

class SqlBuilder;
class TableReference;
class Query;

// ============================================================================
// Expression Tree
// ============================================================================

enum class ExpressionKind {
    COLUMN,
    LITERAL,
    COMPARISON,
    BETWEEN,
    NULLITY,
    IN_LIST,
    LOGICAL,
    NOT,
    AGGREGATE,
    FUNCTION,
    NATIVE,
    SUBQUERY
};

// Binding strength used to decide where parentheses are needed
namespace precedence {
    inline constexpr int kOr = 1;
    inline constexpr int kAnd = 2;
    inline constexpr int kNot = 3;
    inline constexpr int kPredicate = 4;
    inline constexpr int kAtom = 5;
}

/**
 * @brief Immutable expression node
 *
 * Nodes are shared (ExprPtr) between a query and the queries derived from
 * it, so nothing here may change after construction.
 */
class Expression {
public:
    virtual ~Expression() = default;

    [[nodiscard]] ExpressionKind kind() const { return kind_; }

    virtual void render(SqlBuilder& builder) const = 0;

    /**
     * @brief Direct operands. Sub-query bodies are not operands.
     */
    [[nodiscard]] virtual std::vector<const Expression*> children() const { return {}; }

    [[nodiscard]] virtual int precedence() const { return precedence::kAtom; }

    /**
     * @brief True if an aggregate appears in this tree (sub-queries excluded)
     */
    [[nodiscard]] bool contains_aggregate() const;

    // Renders `operand`, parenthesized when it binds looser than `parent_precedence`
    static void render_operand(SqlBuilder& builder, const Expression& operand, int parent_precedence);

protected:
    explicit Expression(ExpressionKind kind) : kind_(kind) {}

private:
    ExpressionKind kind_;
};

using ExprPtr = std::shared_ptr<const Expression>;

class ColumnExpression final : public Expression {
public:
    ColumnExpression(const TableReference& table, std::string column)
        : Expression(ExpressionKind::COLUMN), table_(&table), column_(std::move(column)) {}

    void render(SqlBuilder& builder) const override;

    [[nodiscard]] const TableReference& table() const { return *table_; }
    [[nodiscard]] const std::string& column() const { return column_; }

private:
    const TableReference* table_;
    std::string column_;
};

class LiteralExpression final : public Expression {
public:
    explicit LiteralExpression(SqlValue value)
        : Expression(ExpressionKind::LITERAL), value_(std::move(value)) {}

    void render(SqlBuilder& builder) const override;

    [[nodiscard]] const SqlValue& value() const { return value_; }

private:
    SqlValue value_;
};

enum class ComparisonOp { EQ, NE, LT, LE, GT, GE, LIKE };

class ComparisonExpression final : public Expression {
public:
    ComparisonExpression(ComparisonOp op, ExprPtr lhs, ExprPtr rhs)
        : Expression(ExpressionKind::COMPARISON), op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override { return {lhs_.get(), rhs_.get()}; }
    [[nodiscard]] int precedence() const override { return precedence::kPredicate; }

    [[nodiscard]] ComparisonOp op() const { return op_; }

private:
    ComparisonOp op_;
    ExprPtr lhs_;
    ExprPtr rhs_;
};

class BetweenExpression final : public Expression {
public:
    BetweenExpression(ExprPtr expr, ExprPtr low, ExprPtr high, bool negated)
        : Expression(ExpressionKind::BETWEEN),
          expr_(std::move(expr)), low_(std::move(low)), high_(std::move(high)), negated_(negated) {}

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override {
        return {expr_.get(), low_.get(), high_.get()};
    }
    [[nodiscard]] int precedence() const override { return precedence::kPredicate; }

private:
    ExprPtr expr_;
    ExprPtr low_;
    ExprPtr high_;
    bool negated_;
};

class NullityExpression final : public Expression {
public:
    NullityExpression(ExprPtr expr, bool negated)
        : Expression(ExpressionKind::NULLITY), expr_(std::move(expr)), negated_(negated) {}

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override { return {expr_.get()}; }
    [[nodiscard]] int precedence() const override { return precedence::kPredicate; }

private:
    ExprPtr expr_;
    bool negated_;
};

class InListExpression final : public Expression {
public:
    InListExpression(ExprPtr expr, std::vector<ExprPtr> values, bool negated)
        : Expression(ExpressionKind::IN_LIST),
          expr_(std::move(expr)), values_(std::move(values)), negated_(negated) {}

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override;
    [[nodiscard]] int precedence() const override { return precedence::kPredicate; }

private:
    ExprPtr expr_;
    std::vector<ExprPtr> values_;
    bool negated_;
};

enum class LogicalOp { AND, OR };

class LogicalExpression final : public Expression {
public:
    LogicalExpression(LogicalOp op, std::vector<ExprPtr> operands)
        : Expression(ExpressionKind::LOGICAL), op_(op), operands_(std::move(operands)) {}

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override;
    [[nodiscard]] int precedence() const override {
        return op_ == LogicalOp::AND ? precedence::kAnd : precedence::kOr;
    }

private:
    LogicalOp op_;
    std::vector<ExprPtr> operands_;
};

class NotExpression final : public Expression {
public:
    explicit NotExpression(ExprPtr operand)
        : Expression(ExpressionKind::NOT), operand_(std::move(operand)) {}

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override { return {operand_.get()}; }
    [[nodiscard]] int precedence() const override { return precedence::kNot; }

private:
    ExprPtr operand_;
};

enum class AggregateFunction { COUNT, SUM, AVG, MIN, MAX };

class AggregateExpression final : public Expression {
public:
    // A null argument renders count(*)
    AggregateExpression(AggregateFunction function, ExprPtr argument, bool distinct)
        : Expression(ExpressionKind::AGGREGATE),
          function_(function), argument_(std::move(argument)), distinct_(distinct) {}

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override;

    [[nodiscard]] AggregateFunction function() const { return function_; }

private:
    AggregateFunction function_;
    ExprPtr argument_;
    bool distinct_;
};

class FunctionExpression final : public Expression {
public:
    FunctionExpression(std::string name, std::vector<ExprPtr> arguments)
        : Expression(ExpressionKind::FUNCTION), name_(std::move(name)), arguments_(std::move(arguments)) {}

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override;

private:
    std::string name_;
    std::vector<ExprPtr> arguments_;
};

/**
 * @brief Opaque SQL fragment, copied verbatim
 *
 * Its '?' placeholders are bound to params() in order. The fragment is not
 * inspected, so it never counts as a reference to any table.
 */
class NativeExpression final : public Expression {
public:
    NativeExpression(std::string sql, std::vector<SqlValue> params)
        : Expression(ExpressionKind::NATIVE), sql_(std::move(sql)), params_(std::move(params)) {}

    void render(SqlBuilder& builder) const override;

    [[nodiscard]] const std::string& sql() const { return sql_; }
    [[nodiscard]] const std::vector<SqlValue>& params() const { return params_; }

private:
    std::string sql_;
    std::vector<SqlValue> params_;
};

enum class SubQueryMode { EXISTS, NOT_EXISTS, IN, NOT_IN, SCALAR };

class SubQueryExpression final : public Expression {
public:
    // `lhs` is required for IN / NOT_IN and ignored otherwise
    SubQueryExpression(SubQueryMode mode, std::shared_ptr<const Query> query, ExprPtr lhs = nullptr);

    void render(SqlBuilder& builder) const override;
    [[nodiscard]] std::vector<const Expression*> children() const override;
    [[nodiscard]] int precedence() const override {
        return mode_ == SubQueryMode::SCALAR ? precedence::kAtom : precedence::kPredicate;
    }

    [[nodiscard]] SubQueryMode mode() const { return mode_; }
    [[nodiscard]] const Query& query() const { return *query_; }

private:
    SubQueryMode mode_;
    std::shared_ptr<const Query> query_;
    ExprPtr lhs_;
};

// ============================================================================
// Factory functions
// ============================================================================

namespace expr {

[[nodiscard]] ExprPtr col(const TableReference& table, std::string column);
[[nodiscard]] ExprPtr id(const TableReference& table);
[[nodiscard]] ExprPtr value(SqlValue v);

[[nodiscard]] ExprPtr eq(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr eq(ExprPtr lhs, SqlValue rhs);
[[nodiscard]] ExprPtr ne(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr ne(ExprPtr lhs, SqlValue rhs);
[[nodiscard]] ExprPtr lt(ExprPtr lhs, SqlValue rhs);
[[nodiscard]] ExprPtr le(ExprPtr lhs, SqlValue rhs);
[[nodiscard]] ExprPtr gt(ExprPtr lhs, SqlValue rhs);
[[nodiscard]] ExprPtr ge(ExprPtr lhs, SqlValue rhs);
[[nodiscard]] ExprPtr like(ExprPtr lhs, std::string pattern);

[[nodiscard]] ExprPtr between(ExprPtr e, SqlValue low, SqlValue high);
[[nodiscard]] ExprPtr not_between(ExprPtr e, SqlValue low, SqlValue high);
[[nodiscard]] ExprPtr is_null(ExprPtr e);
[[nodiscard]] ExprPtr is_not_null(ExprPtr e);
[[nodiscard]] ExprPtr in(ExprPtr e, std::vector<SqlValue> values);
[[nodiscard]] ExprPtr not_in(ExprPtr e, std::vector<SqlValue> values);

[[nodiscard]] ExprPtr and_(std::vector<ExprPtr> operands);
[[nodiscard]] ExprPtr or_(std::vector<ExprPtr> operands);
[[nodiscard]] ExprPtr not_(ExprPtr operand);

[[nodiscard]] ExprPtr count(ExprPtr argument);
[[nodiscard]] ExprPtr count_star();
[[nodiscard]] ExprPtr count_distinct(ExprPtr argument);
[[nodiscard]] ExprPtr sum(ExprPtr argument);
[[nodiscard]] ExprPtr avg(ExprPtr argument);
[[nodiscard]] ExprPtr min(ExprPtr argument);
[[nodiscard]] ExprPtr max(ExprPtr argument);

[[nodiscard]] ExprPtr func(std::string name, std::vector<ExprPtr> arguments);

/**
 * @throws std::invalid_argument if the number of '?' in `sql` differs from params.size()
 */
[[nodiscard]] ExprPtr native(std::string sql, std::vector<SqlValue> params = {});

[[nodiscard]] ExprPtr exists(std::shared_ptr<const Query> subquery);
[[nodiscard]] ExprPtr not_exists(std::shared_ptr<const Query> subquery);
[[nodiscard]] ExprPtr in(ExprPtr e, std::shared_ptr<const Query> subquery);
[[nodiscard]] ExprPtr not_in(ExprPtr e, std::shared_ptr<const Query> subquery);
[[nodiscard]] ExprPtr scalar(std::shared_ptr<const Query> subquery);

} // namespace expr

} // namespace sqlpager
