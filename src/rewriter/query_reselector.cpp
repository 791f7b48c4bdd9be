#include "rewriter/query_reselector.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace sqlpager {

std::shared_ptr<const Query> QueryReselector::reselect(const Query& base,
                                                       std::vector<ExprPtr> new_select) {
    if (base.is_derived()) {
        throw QueryError(QueryErrorCode::RESELECT_NOT_ALLOWED, base.name(),
            "the query is already derived and cannot be reselected again");
    }

    const bool aggregated = std::any_of(base.selections().begin(), base.selections().end(),
        [](const ExprPtr& e) { return e->contains_aggregate(); });
    if (aggregated) {
        throw QueryError(QueryErrorCode::AGGREGATE_SELECT_NOT_RESELECTABLE, base.name(),
            "the select clause contains an aggregate expression");
    }

    if (!base.group_by_items().empty()) {
        throw QueryError(QueryErrorCode::GROUPED_QUERY_NOT_RESELECTABLE, base.name(),
            std::format("the query has {} group by expression(s)", base.group_by_items().size()));
    }

    for (const auto& e : new_select) {
        if (!e) {
            throw std::invalid_argument("reselect: null select expression");
        }
        base.ensure_visible(*e);
    }

    base.freeze();

    auto derived = std::make_shared<Query>(Query::ConstructionTag{}, base);
    derived->select_ = std::move(new_select);
    derived->order_by_.clear();
    derived->paging_.reset();
    derived->derived_ = true;
    return derived;
}

std::shared_ptr<const Query> QueryReselector::without_sorting_and_paging(const Query& query) {
    query.freeze();

    auto copy = std::make_shared<Query>(Query::ConstructionTag{}, query);
    copy->order_by_.clear();
    copy->paging_.reset();
    return copy;
}

std::shared_ptr<const Query> QueryReselector::count_query(const Query& base) {
    return reselect(base, {expr::count(expr::id(base.root()))});
}

} // namespace sqlpager
