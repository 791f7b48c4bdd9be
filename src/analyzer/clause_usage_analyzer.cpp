#include "analyzer/clause_usage_analyzer.hpp"
#include "ast/query.hpp"

namespace sqlpager {

// ============================================================================
// ClauseUsage
// ============================================================================

void ClauseUsage::record(const TableReference& table, ClauseKind kind) {
    usage_[&table] |= clause_mask::bit(kind);
}

ClauseMask ClauseUsage::usage_of(const TableReference& table) const {
    const auto it = usage_.find(&table);
    return it != usage_.end() ? it->second : clause_mask::kNone;
}

// ============================================================================
// ClauseUsageAnalyzer
// ============================================================================

ClauseUsage ClauseUsageAnalyzer::analyze(const Query& query) {
    ClauseUsage usage;

    for (const auto& e : query.selections()) walk(*e, ClauseKind::SELECT, usage);
    for (const auto& e : query.predicates()) walk(*e, ClauseKind::WHERE, usage);
    for (const auto& e : query.group_by_items()) walk(*e, ClauseKind::GROUP_BY, usage);
    for (const auto& e : query.having_predicates()) walk(*e, ClauseKind::HAVING, usage);
    for (const auto& item : query.orderings()) walk(*item.expression, ClauseKind::ORDER_BY, usage);

    return usage;
}

void ClauseUsageAnalyzer::walk_query(const Query& query, ClauseKind kind, ClauseUsage& usage) {
    // Every clause of a nested query counts as the enclosing clause
    for (const auto& e : query.selections()) walk(*e, kind, usage);
    for (const auto& e : query.predicates()) walk(*e, kind, usage);
    for (const auto& e : query.group_by_items()) walk(*e, kind, usage);
    for (const auto& e : query.having_predicates()) walk(*e, kind, usage);
    for (const auto& item : query.orderings()) walk(*item.expression, kind, usage);
}

void ClauseUsageAnalyzer::walk(const Expression& expression, ClauseKind kind, ClauseUsage& usage) {
    switch (expression.kind()) {
        case ExpressionKind::COLUMN:
            record_path(static_cast<const ColumnExpression&>(expression).table(), kind, usage);
            return;
        case ExpressionKind::SUBQUERY:
            walk_query(static_cast<const SubQueryExpression&>(expression).query(), kind, usage);
            break;
        default:
            break;
    }
    for (const Expression* child : expression.children()) {
        walk(*child, kind, usage);
    }
}

void ClauseUsageAnalyzer::record_path(const TableReference& table, ClauseKind kind, ClauseUsage& usage) {
    for (const TableReference* t = &table; t != nullptr; t = t->parent()) {
        usage.record(*t, kind);
    }
}

} // namespace sqlpager
