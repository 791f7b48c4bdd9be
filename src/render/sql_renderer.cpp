#include "render/sql_renderer.hpp"
#include "ast/query.hpp"
#include "optimizer/join_eliminator.hpp"
#include "render/pagination_renderer.hpp"

namespace sqlpager {

namespace {

bool is_emitted(const TableReference& table, const PruneResult* pruning) {
    return pruning == nullptr || table.is_root() || pruning->is_retained(table);
}

void render_conjunction(SqlBuilder& builder, std::string_view keyword,
                        const std::vector<ExprPtr>& predicates) {
    if (predicates.empty()) return;
    builder.sql(keyword);
    for (size_t i = 0; i < predicates.size(); ++i) {
        if (i > 0) builder.sql(" and ");
        Expression::render_operand(builder, *predicates[i], precedence::kAnd);
    }
}

void render_list(SqlBuilder& builder, std::string_view keyword, const std::vector<ExprPtr>& items) {
    if (items.empty()) return;
    builder.sql(keyword);
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) builder.sql(", ");
        items[i]->render(builder);
    }
}

} // namespace

RenderResult SqlRenderer::render_body(const Query& query, const PruneResult* pruning) {
    SqlBuilder builder;
    render_statement(builder, query, pruning, false);
    return std::move(builder).build();
}

RenderResult SqlRenderer::render(const Query& query, Dialect dialect) {
    RenderResult body = render_body(query);
    const auto& paging = query.paging();
    if (!paging) return body;
    return render_pagination(dialect, body, paging->limit, paging->offset);
}

void SqlRenderer::render_nested(SqlBuilder& builder, const Query& query) {
    render_statement(builder, query, nullptr, true);
}

void SqlRenderer::render_statement(SqlBuilder& builder, const Query& query,
                                   const PruneResult* pruning, bool nested) {
    query.freeze();

    // Aliases first: select items may reference any joined table
    assign_aliases(builder, query, query.root(), pruning);

    builder.sql("select ");
    if (query.selections().empty()) {
        if (nested) {
            builder.sql("1");
        } else {
            builder.sql(builder.alias_of(query.root())).sql(".*");
        }
    } else {
        for (size_t i = 0; i < query.selections().size(); ++i) {
            if (i > 0) builder.sql(", ");
            query.selections()[i]->render(builder);
        }
    }

    const TableReference& root = query.root();
    builder.sql(" from ").sql(root.entity().table).sql(" as ").sql(builder.alias_of(root));
    for (const TableReference* child : query.registry().children_of(root)) {
        render_from(builder, query, *child, pruning);
    }

    render_conjunction(builder, " where ", query.predicates());
    render_list(builder, " group by ", query.group_by_items());
    render_conjunction(builder, " having ", query.having_predicates());

    if (!query.orderings().empty()) {
        builder.sql(" order by ");
        for (size_t i = 0; i < query.orderings().size(); ++i) {
            const auto& item = query.orderings()[i];
            if (i > 0) builder.sql(", ");
            item.expression->render(builder);
            builder.sql(item.mode == OrderMode::DESC ? " desc" : " asc");
        }
    }
}

void SqlRenderer::assign_aliases(SqlBuilder& builder, const Query& query,
                                 const TableReference& table, const PruneResult* pruning) {
    if (!is_emitted(table, pruning)) return;
    builder.assign_alias(table);
    for (const TableReference* child : query.registry().children_of(table)) {
        assign_aliases(builder, query, *child, pruning);
    }
}

void SqlRenderer::render_from(SqlBuilder& builder, const Query& query,
                              const TableReference& table, const PruneResult* pruning) {
    // An eliminated table never has retained descendants
    if (!is_emitted(table, pruning)) return;

    const std::string& parent_alias = builder.alias_of(*table.parent());
    const std::string& alias = builder.alias_of(table);

    builder.sql(table.join_type() == JoinType::LEFT_OUTER ? " left join " : " inner join ")
           .sql(table.entity().table)
           .sql(" as ")
           .sql(alias)
           .sql(" on ");

    const auto& columns = table.association()->join_columns;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) builder.sql(" and ");
        builder.sql(parent_alias).sql(".").sql(columns[i].source)
               .sql(" = ")
               .sql(alias).sql(".").sql(columns[i].target);
    }

    for (const TableReference* child : query.registry().children_of(table)) {
        render_from(builder, query, *child, pruning);
    }
}

} // namespace sqlpager
