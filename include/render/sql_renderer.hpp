#pragma once

#include "dialect/dialect.hpp"
#include "render/sql_builder.hpp"

namespace sqlpager {

class Query;
class TableReference;
struct PruneResult;

/**
 * @brief Turns a Query AST into SQL text plus positional parameters
 *
 * Output shape:
 *   select <items> from ROOT as tb_1_
 *     [inner join | left join] T as tb_n_ on <parent>.<col> = tb_n_.<col> ...
 *     [where ...] [group by ...] [having ...] [order by ...]
 *
 * Aliases are assigned per call: the outer query's tables first, in
 * pre-order of the join tree with children in registration order, then the
 * tables of each sub-query as it is rendered. Rendering freezes the query.
 */
class SqlRenderer {
public:
    /**
     * @param pruning Tables to emit; nullptr emits every registered join
     */
    [[nodiscard]] static RenderResult render_body(const Query& query,
                                                  const PruneResult* pruning = nullptr);

    /**
     * @brief Body plus dialect paging when the query has a limit
     * @throws QueryError UNSUPPORTED_DIALECT, INVALID_PAGING
     */
    [[nodiscard]] static RenderResult render(const Query& query, Dialect dialect);

    // Renders a sub-query into an enclosing statement's builder
    static void render_nested(SqlBuilder& builder, const Query& query);

private:
    static void render_statement(SqlBuilder& builder, const Query& query,
                                 const PruneResult* pruning, bool nested);

    static void assign_aliases(SqlBuilder& builder, const Query& query,
                               const TableReference& table, const PruneResult* pruning);

    static void render_from(SqlBuilder& builder, const Query& query,
                            const TableReference& table, const PruneResult* pruning);
};

} // namespace sqlpager
