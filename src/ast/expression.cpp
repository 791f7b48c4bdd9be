#include "ast/expression.hpp"
#include "ast/query.hpp"
#include "ast/table_reference.hpp"
#include "render/sql_builder.hpp"
#include "render/sql_renderer.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace sqlpager {

namespace {

std::string_view comparison_to_sql(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::EQ: return " = ";
        case ComparisonOp::NE: return " <> ";
        case ComparisonOp::LT: return " < ";
        case ComparisonOp::LE: return " <= ";
        case ComparisonOp::GT: return " > ";
        case ComparisonOp::GE: return " >= ";
        case ComparisonOp::LIKE: return " like ";
        default: return " = ";
    }
}

std::string_view aggregate_to_sql(AggregateFunction function) {
    switch (function) {
        case AggregateFunction::COUNT: return "count";
        case AggregateFunction::SUM: return "sum";
        case AggregateFunction::AVG: return "avg";
        case AggregateFunction::MIN: return "min";
        case AggregateFunction::MAX: return "max";
        default: return "count";
    }
}

std::vector<const Expression*> raw_pointers(const std::vector<ExprPtr>& exprs) {
    std::vector<const Expression*> result;
    result.reserve(exprs.size());
    for (const auto& e : exprs) {
        result.push_back(e.get());
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Expression
// ============================================================================

bool Expression::contains_aggregate() const {
    if (kind_ == ExpressionKind::AGGREGATE) return true;
    const auto operands = children();
    return std::any_of(operands.begin(), operands.end(),
        [](const Expression* e) { return e->contains_aggregate(); });
}

void Expression::render_operand(SqlBuilder& builder, const Expression& operand, int parent_precedence) {
    if (operand.precedence() < parent_precedence) {
        builder.sql("(");
        operand.render(builder);
        builder.sql(")");
    } else {
        operand.render(builder);
    }
}

// ============================================================================
// Leaves
// ============================================================================

void ColumnExpression::render(SqlBuilder& builder) const {
    builder.sql(builder.alias_of(*table_)).sql(".").sql(column_);
}

void LiteralExpression::render(SqlBuilder& builder) const {
    builder.variable(value_);
}

void NativeExpression::render(SqlBuilder& builder) const {
    size_t param_index = 0;
    size_t start = 0;
    for (size_t pos = sql_.find('?'); pos != std::string::npos; pos = sql_.find('?', start)) {
        builder.sql(std::string_view(sql_).substr(start, pos - start));
        builder.variable(params_[param_index++]);
        start = pos + 1;
    }
    builder.sql(std::string_view(sql_).substr(start));
}

// ============================================================================
// Predicates
// ============================================================================

void ComparisonExpression::render(SqlBuilder& builder) const {
    render_operand(builder, *lhs_, precedence::kAtom);
    builder.sql(comparison_to_sql(op_));
    render_operand(builder, *rhs_, precedence::kAtom);
}

void BetweenExpression::render(SqlBuilder& builder) const {
    render_operand(builder, *expr_, precedence::kAtom);
    builder.sql(negated_ ? " not between " : " between ");
    render_operand(builder, *low_, precedence::kAtom);
    builder.sql(" and ");
    render_operand(builder, *high_, precedence::kAtom);
}

void NullityExpression::render(SqlBuilder& builder) const {
    render_operand(builder, *expr_, precedence::kAtom);
    builder.sql(negated_ ? " is not null" : " is null");
}

std::vector<const Expression*> InListExpression::children() const {
    auto result = raw_pointers(values_);
    result.insert(result.begin(), expr_.get());
    return result;
}

void InListExpression::render(SqlBuilder& builder) const {
    // "x in ()" is not valid SQL
    if (values_.empty()) {
        builder.sql(negated_ ? "1 = 1" : "1 = 0");
        return;
    }
    render_operand(builder, *expr_, precedence::kAtom);
    builder.sql(negated_ ? " not in (" : " in (");
    for (size_t i = 0; i < values_.size(); ++i) {
        if (i > 0) builder.sql(", ");
        render_operand(builder, *values_[i], precedence::kAtom);
    }
    builder.sql(")");
}

std::vector<const Expression*> LogicalExpression::children() const {
    return raw_pointers(operands_);
}

void LogicalExpression::render(SqlBuilder& builder) const {
    if (operands_.empty()) {
        builder.sql(op_ == LogicalOp::AND ? "1 = 1" : "1 = 0");
        return;
    }
    const std::string_view separator = op_ == LogicalOp::AND ? " and " : " or ";
    for (size_t i = 0; i < operands_.size(); ++i) {
        if (i > 0) builder.sql(separator);
        render_operand(builder, *operands_[i], precedence());
    }
}

void NotExpression::render(SqlBuilder& builder) const {
    builder.sql("not (");
    operand_->render(builder);
    builder.sql(")");
}

// ============================================================================
// Functions
// ============================================================================

std::vector<const Expression*> AggregateExpression::children() const {
    if (!argument_) return {};
    return {argument_.get()};
}

void AggregateExpression::render(SqlBuilder& builder) const {
    builder.sql(aggregate_to_sql(function_)).sql("(");
    if (!argument_) {
        builder.sql("*");
    } else {
        if (distinct_) builder.sql("distinct ");
        argument_->render(builder);
    }
    builder.sql(")");
}

std::vector<const Expression*> FunctionExpression::children() const {
    return raw_pointers(arguments_);
}

void FunctionExpression::render(SqlBuilder& builder) const {
    builder.sql(name_).sql("(");
    for (size_t i = 0; i < arguments_.size(); ++i) {
        if (i > 0) builder.sql(", ");
        arguments_[i]->render(builder);
    }
    builder.sql(")");
}

// ============================================================================
// Sub-queries
// ============================================================================

SubQueryExpression::SubQueryExpression(SubQueryMode mode, std::shared_ptr<const Query> query, ExprPtr lhs)
    : Expression(ExpressionKind::SUBQUERY), mode_(mode), query_(std::move(query)), lhs_(std::move(lhs)) {
    if (!query_) {
        throw std::invalid_argument("sub-query expression requires a query");
    }
    if ((mode_ == SubQueryMode::IN || mode_ == SubQueryMode::NOT_IN) && !lhs_) {
        throw std::invalid_argument("IN sub-query requires a left-hand expression");
    }
}

std::vector<const Expression*> SubQueryExpression::children() const {
    if (!lhs_) return {};
    return {lhs_.get()};
}

void SubQueryExpression::render(SqlBuilder& builder) const {
    switch (mode_) {
        case SubQueryMode::EXISTS:
            builder.sql("exists(");
            break;
        case SubQueryMode::NOT_EXISTS:
            builder.sql("not exists(");
            break;
        case SubQueryMode::IN:
            render_operand(builder, *lhs_, precedence::kAtom);
            builder.sql(" in (");
            break;
        case SubQueryMode::NOT_IN:
            render_operand(builder, *lhs_, precedence::kAtom);
            builder.sql(" not in (");
            break;
        case SubQueryMode::SCALAR:
            builder.sql("(");
            break;
    }
    SqlRenderer::render_nested(builder, *query_);
    builder.sql(")");
}

// ============================================================================
// Factory functions
// ============================================================================

namespace expr {

ExprPtr col(const TableReference& table, std::string column) {
    return std::make_shared<ColumnExpression>(table, std::move(column));
}

ExprPtr id(const TableReference& table) {
    return std::make_shared<ColumnExpression>(table, table.entity().id_column);
}

ExprPtr value(SqlValue v) {
    return std::make_shared<LiteralExpression>(std::move(v));
}

ExprPtr eq(ExprPtr lhs, ExprPtr rhs) {
    return std::make_shared<ComparisonExpression>(ComparisonOp::EQ, std::move(lhs), std::move(rhs));
}

ExprPtr eq(ExprPtr lhs, SqlValue rhs) {
    return eq(std::move(lhs), value(std::move(rhs)));
}

ExprPtr ne(ExprPtr lhs, ExprPtr rhs) {
    return std::make_shared<ComparisonExpression>(ComparisonOp::NE, std::move(lhs), std::move(rhs));
}

ExprPtr ne(ExprPtr lhs, SqlValue rhs) {
    return ne(std::move(lhs), value(std::move(rhs)));
}

ExprPtr lt(ExprPtr lhs, SqlValue rhs) {
    return std::make_shared<ComparisonExpression>(ComparisonOp::LT, std::move(lhs), value(std::move(rhs)));
}

ExprPtr le(ExprPtr lhs, SqlValue rhs) {
    return std::make_shared<ComparisonExpression>(ComparisonOp::LE, std::move(lhs), value(std::move(rhs)));
}

ExprPtr gt(ExprPtr lhs, SqlValue rhs) {
    return std::make_shared<ComparisonExpression>(ComparisonOp::GT, std::move(lhs), value(std::move(rhs)));
}

ExprPtr ge(ExprPtr lhs, SqlValue rhs) {
    return std::make_shared<ComparisonExpression>(ComparisonOp::GE, std::move(lhs), value(std::move(rhs)));
}

ExprPtr like(ExprPtr lhs, std::string pattern) {
    return std::make_shared<ComparisonExpression>(
        ComparisonOp::LIKE, std::move(lhs), value(std::move(pattern)));
}

ExprPtr between(ExprPtr e, SqlValue low, SqlValue high) {
    return std::make_shared<BetweenExpression>(
        std::move(e), value(std::move(low)), value(std::move(high)), false);
}

ExprPtr not_between(ExprPtr e, SqlValue low, SqlValue high) {
    return std::make_shared<BetweenExpression>(
        std::move(e), value(std::move(low)), value(std::move(high)), true);
}

ExprPtr is_null(ExprPtr e) {
    return std::make_shared<NullityExpression>(std::move(e), false);
}

ExprPtr is_not_null(ExprPtr e) {
    return std::make_shared<NullityExpression>(std::move(e), true);
}

namespace {

std::vector<ExprPtr> to_literals(std::vector<SqlValue> values) {
    std::vector<ExprPtr> result;
    result.reserve(values.size());
    for (auto& v : values) {
        result.push_back(value(std::move(v)));
    }
    return result;
}

} // anonymous namespace

ExprPtr in(ExprPtr e, std::vector<SqlValue> values) {
    return std::make_shared<InListExpression>(std::move(e), to_literals(std::move(values)), false);
}

ExprPtr not_in(ExprPtr e, std::vector<SqlValue> values) {
    return std::make_shared<InListExpression>(std::move(e), to_literals(std::move(values)), true);
}

ExprPtr and_(std::vector<ExprPtr> operands) {
    return std::make_shared<LogicalExpression>(LogicalOp::AND, std::move(operands));
}

ExprPtr or_(std::vector<ExprPtr> operands) {
    return std::make_shared<LogicalExpression>(LogicalOp::OR, std::move(operands));
}

ExprPtr not_(ExprPtr operand) {
    return std::make_shared<NotExpression>(std::move(operand));
}

ExprPtr count(ExprPtr argument) {
    return std::make_shared<AggregateExpression>(AggregateFunction::COUNT, std::move(argument), false);
}

ExprPtr count_star() {
    return std::make_shared<AggregateExpression>(AggregateFunction::COUNT, nullptr, false);
}

ExprPtr count_distinct(ExprPtr argument) {
    return std::make_shared<AggregateExpression>(AggregateFunction::COUNT, std::move(argument), true);
}

ExprPtr sum(ExprPtr argument) {
    return std::make_shared<AggregateExpression>(AggregateFunction::SUM, std::move(argument), false);
}

ExprPtr avg(ExprPtr argument) {
    return std::make_shared<AggregateExpression>(AggregateFunction::AVG, std::move(argument), false);
}

ExprPtr min(ExprPtr argument) {
    return std::make_shared<AggregateExpression>(AggregateFunction::MIN, std::move(argument), false);
}

ExprPtr max(ExprPtr argument) {
    return std::make_shared<AggregateExpression>(AggregateFunction::MAX, std::move(argument), false);
}

ExprPtr func(std::string name, std::vector<ExprPtr> arguments) {
    return std::make_shared<FunctionExpression>(std::move(name), std::move(arguments));
}

ExprPtr native(std::string sql, std::vector<SqlValue> params) {
    const auto placeholders = static_cast<size_t>(std::count(sql.begin(), sql.end(), '?'));
    if (placeholders != params.size()) {
        throw std::invalid_argument(std::format(
            "native SQL '{}' has {} placeholders but {} parameters", sql, placeholders, params.size()));
    }
    return std::make_shared<NativeExpression>(std::move(sql), std::move(params));
}

ExprPtr exists(std::shared_ptr<const Query> subquery) {
    return std::make_shared<SubQueryExpression>(SubQueryMode::EXISTS, std::move(subquery));
}

ExprPtr not_exists(std::shared_ptr<const Query> subquery) {
    return std::make_shared<SubQueryExpression>(SubQueryMode::NOT_EXISTS, std::move(subquery));
}

ExprPtr in(ExprPtr e, std::shared_ptr<const Query> subquery) {
    return std::make_shared<SubQueryExpression>(SubQueryMode::IN, std::move(subquery), std::move(e));
}

ExprPtr not_in(ExprPtr e, std::shared_ptr<const Query> subquery) {
    return std::make_shared<SubQueryExpression>(SubQueryMode::NOT_IN, std::move(subquery), std::move(e));
}

ExprPtr scalar(std::shared_ptr<const Query> subquery) {
    return std::make_shared<SubQueryExpression>(SubQueryMode::SCALAR, std::move(subquery));
}

} // namespace expr

} // namespace sqlpager
