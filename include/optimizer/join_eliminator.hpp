#pragma once

#include "analyzer/clause_usage_analyzer.hpp"

#include <cstddef>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sqlpager {

class Query;
class TableReference;

/**
 * @brief Why a table reference was kept or dropped
 */
enum class EliminationVerdict {
    ROOT,
    ELIMINATED,
    COLLECTION_ASSOCIATION,     // may multiply rows
    FILTER_USAGE,               // used by where / group by / having
    COUNT_SELECT_USAGE,         // used by the derived query itself
    INNER_JOIN_NOT_GUARANTEED,  // inner join over a nullable or computed association
    ANCESTOR_RETAINED,          // eliminable, but an ancestor join is kept
    DESCENDANT_RETAINED,        // eliminable, but a descendant join needs its alias
    OPTIMIZATION_DISABLED
};

[[nodiscard]] std::string_view elimination_verdict_to_string(EliminationVerdict verdict);

struct JoinDecision {
    const TableReference* table;
    EliminationVerdict verdict;

    [[nodiscard]] bool retained() const { return verdict != EliminationVerdict::ELIMINATED; }
};

/**
 * @brief Retained table set plus one decision per registered reference
 *
 * decisions are in registry order (root first).
 */
struct PruneResult {
    std::unordered_set<const TableReference*> retained;
    std::vector<JoinDecision> decisions;

    [[nodiscard]] bool is_retained(const TableReference& table) const {
        return retained.contains(&table);
    }

    [[nodiscard]] size_t eliminated_count() const { return decisions.size() - retained.size(); }
};

/**
 * @brief Drops joins that cannot change the row count of a derived query
 *
 * A non-root reference r is eliminable iff all hold:
 *   (a) its association is not a collection;
 *   (b) the original query does not use r in where / group by / having,
 *       and the derived query does not use r at all;
 *   (c) r is a left outer join, or an inner join over a foreign-key based,
 *       non-nullable association (exactly one partner row guaranteed).
 * r is eliminated iff every reference on the path root..r and every
 * reference below r is eliminable. Eliminated references therefore have
 * only eliminated descendants.
 *
 * Only the outermost query's registry is considered: joins inside
 * sub-queries are rendered as-is. Anything ineligible is retained; a wrong
 * elimination would silently corrupt the row count.
 */
class JoinEliminator {
public:
    struct Config {
        bool enabled = true;
    };

    JoinEliminator();
    explicit JoinEliminator(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    /**
     * @param derived Derived query (reselected); a non-derived query keeps every join
     * @param original_usage ClauseUsage of the query it was derived from
     */
    [[nodiscard]] PruneResult prune(const Query& derived, const ClauseUsage& original_usage) const;

private:
    [[nodiscard]] static EliminationVerdict local_verdict(
        const TableReference& table,
        const ClauseUsage& original_usage,
        const ClauseUsage& derived_usage);

    [[nodiscard]] static PruneResult retain_all(const Query& query, EliminationVerdict verdict);

    Config config_;
};

} // namespace sqlpager
