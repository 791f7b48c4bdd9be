#pragma once

#include "ast/query.hpp"

#include <memory>
#include <vector>

namespace sqlpager {

/**
 * @brief Derives new queries from a base query without mutating it
 *
 * A derived query shares the base's join registry and its where / group by /
 * having clauses. Derivation freezes the shared registry, so joins can no
 * longer be added to either query.
 */
class QueryReselector {
public:
    /**
     * @brief Replace the select clause, drop ordering and paging
     *
     * Checks, in order:
     *   - base must not be derived                 (RESELECT_NOT_ALLOWED)
     *   - base select must not aggregate           (AGGREGATE_SELECT_NOT_RESELECTABLE)
     *   - base must not have a group by clause     (GROUPED_QUERY_NOT_RESELECTABLE)
     *
     * @throws QueryError
     */
    [[nodiscard]] static std::shared_ptr<const Query> reselect(
        const Query& base, std::vector<ExprPtr> new_select);

    /**
     * @brief Copy of `query` without order by and limit/offset
     *
     * Keeps the derived flag of its input.
     */
    [[nodiscard]] static std::shared_ptr<const Query> without_sorting_and_paging(const Query& query);

    /**
     * @brief reselect(base, { count(root.id) })
     */
    [[nodiscard]] static std::shared_ptr<const Query> count_query(const Query& base);
};

} // namespace sqlpager
