#include "pager/plan_explainer.hpp"
#include "ast/table_reference.hpp"

#include <format>

namespace sqlpager {

namespace {

PlanExplainer::StatementExplanation explain_statement(const RenderResult& statement) {
    PlanExplainer::StatementExplanation out;
    out.sql = statement.sql;
    out.params.reserve(statement.params.size());
    for (const auto& p : statement.params) {
        out.params.push_back(value_to_string(p));
    }
    return out;
}

nlohmann::json statement_to_json(const PlanExplainer::StatementExplanation& statement) {
    return {
        {"sql", statement.sql},
        {"params", statement.params}
    };
}

} // namespace

PlanExplainer::Explanation PlanExplainer::explain(const PagePlan& plan) {
    Explanation exp;
    exp.query_name = plan.query_name;
    exp.dialect = std::string(dialect_to_string(plan.dialect));
    exp.count_statement = explain_statement(plan.count_statement);
    exp.data_statement = explain_statement(plan.data_statement);
    exp.eliminated_count = plan.pruning.eliminated_count();

    exp.joins.reserve(plan.pruning.decisions.size());
    for (const auto& decision : plan.pruning.decisions) {
        if (decision.table->is_root()) continue;
        JoinExplanation join;
        join.path = decision.table->path();
        join.table = decision.table->entity().table;
        join.join_type = std::string(join_type_to_string(decision.table->join_type()));
        join.verdict = std::string(elimination_verdict_to_string(decision.verdict));
        join.retained = decision.retained();
        exp.joins.push_back(std::move(join));
    }

    if (exp.joins.empty()) {
        exp.summary = std::format("Page {} (size {}) of '{}' on {}: no joins",
            plan.page_index, plan.page_size, plan.query_name, exp.dialect);
    } else {
        exp.summary = std::format("Page {} (size {}) of '{}' on {}: {} of {} join(s) eliminated from the count query",
            plan.page_index, plan.page_size, plan.query_name, exp.dialect,
            exp.eliminated_count, exp.joins.size());
    }
    return exp;
}

nlohmann::json PlanExplainer::Explanation::to_json() const {
    nlohmann::json joins_json = nlohmann::json::array();
    for (const auto& join : joins) {
        joins_json.push_back({
            {"path", join.path},
            {"table", join.table},
            {"join_type", join.join_type},
            {"verdict", join.verdict},
            {"retained", join.retained}
        });
    }

    return {
        {"query", query_name},
        {"dialect", dialect},
        {"summary", summary},
        {"count_statement", statement_to_json(count_statement)},
        {"data_statement", statement_to_json(data_statement)},
        {"joins", joins_json},
        {"eliminated_count", eliminated_count}
    };
}

} // namespace sqlpager
