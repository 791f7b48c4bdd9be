#include "render/sql_builder.hpp"
#include "ast/table_reference.hpp"
#include "core/error.hpp"

#include <format>

namespace sqlpager {

SqlBuilder& SqlBuilder::sql(std::string_view text) {
    sql_ += text;
    return *this;
}

SqlBuilder& SqlBuilder::variable(SqlValue value) {
    sql_ += '?';
    params_.push_back(std::move(value));
    return *this;
}

SqlBuilder& SqlBuilder::append(const RenderResult& fragment) {
    sql_ += fragment.sql;
    params_.insert(params_.end(), fragment.params.begin(), fragment.params.end());
    return *this;
}

const std::string& SqlBuilder::assign_alias(const TableReference& table) {
    auto [it, inserted] = aliases_.try_emplace(&table, std::format("tb_{}_", next_alias_));
    if (inserted) ++next_alias_;
    return it->second;
}

const std::string& SqlBuilder::alias_of(const TableReference& table) const {
    const auto it = aliases_.find(&table);
    if (it == aliases_.end()) {
        throw QueryError(QueryErrorCode::FOREIGN_TABLE_REFERENCE, "",
            std::format("table '{}' is not part of the statement being rendered", table.path()));
    }
    return it->second;
}

RenderResult SqlBuilder::build() && {
    return RenderResult{std::move(sql_), std::move(params_)};
}

} // namespace sqlpager
