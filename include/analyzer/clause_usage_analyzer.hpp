#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <unordered_map>

namespace sqlpager {

class Expression;
class Query;
class TableReference;

/**
 * @brief Clause kinds in which each table reference is used
 *
 * Ephemeral: computed per analysis call, keyed by reference identity.
 */
class ClauseUsage {
public:
    void record(const TableReference& table, ClauseKind kind);

    [[nodiscard]] ClauseMask usage_of(const TableReference& table) const;

    [[nodiscard]] bool is_used(const TableReference& table) const {
        return usage_of(table) != clause_mask::kNone;
    }

    [[nodiscard]] bool is_used_by(const TableReference& table, ClauseKind kind) const {
        return clause_mask::test(usage_of(table), kind);
    }

    [[nodiscard]] bool is_used_by_filter(const TableReference& table) const {
        return clause_mask::test(usage_of(table), clause_mask::kFilter);
    }

    [[nodiscard]] size_t size() const { return usage_.size(); }

private:
    std::unordered_map<const TableReference*, ClauseMask> usage_;
};

/**
 * @brief Computes ClauseUsage for a query
 *
 * Every column leaf records its table and all of that table's ancestors:
 * reading store.country.NAME needs the joins to store and to country.
 * Sub-queries are walked under the clause kind in which they appear, so a
 * correlated reference to an outer table counts as usage of that clause.
 * Opaque native fragments reference nothing.
 *
 * Pure; never mutates the query.
 */
class ClauseUsageAnalyzer {
public:
    [[nodiscard]] static ClauseUsage analyze(const Query& query);

private:
    static void walk_query(const Query& query, ClauseKind kind, ClauseUsage& usage);
    static void walk(const Expression& expression, ClauseKind kind, ClauseUsage& usage);
    static void record_path(const TableReference& table, ClauseKind kind, ClauseUsage& usage);
};

} // namespace sqlpager
