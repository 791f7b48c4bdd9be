#include "ast/query.hpp"
#include "core/error.hpp"

#include <format>
#include <stdexcept>

namespace sqlpager {

namespace {

void require_expression(const ExprPtr& expression, std::string_view clause) {
    if (!expression) {
        throw std::invalid_argument(std::format("{}: null expression", clause));
    }
}

} // namespace

std::shared_ptr<Query> Query::create(std::shared_ptr<const IMetadataProvider> metadata,
                                     std::string_view root_entity,
                                     std::string name) {
    const EntityType* entity = metadata ? metadata->find_entity(root_entity) : nullptr;
    if (!entity) {
        throw QueryError(QueryErrorCode::UNKNOWN_ENTITY, std::string(name),
            std::format("entity '{}' is not defined", root_entity));
    }
    if (name.empty()) name = entity->name;

    auto registry = std::make_shared<JoinRegistry>(*entity, name);
    return std::make_shared<Query>(ConstructionTag{},
        std::move(metadata), std::move(registry), std::move(name));
}

Query::Query(ConstructionTag,
             std::shared_ptr<const IMetadataProvider> metadata,
             std::shared_ptr<JoinRegistry> registry,
             std::string name)
    : metadata_(std::move(metadata)),
      registry_(std::move(registry)),
      name_(std::move(name)) {}

std::shared_ptr<Query> Query::subquery(std::string_view root_entity) const {
    auto sub = create(metadata_, root_entity, std::format("{}/{}", name_, root_entity));
    sub->enclosing_.reserve(enclosing_.size() + 1);
    sub->enclosing_.push_back(registry_);
    sub->enclosing_.insert(sub->enclosing_.end(), enclosing_.begin(), enclosing_.end());
    return sub;
}

const TableReference& Query::join(const TableReference& parent,
                                  std::string_view property,
                                  JoinType join_type) {
    const auto* association = metadata_->find_association(parent.entity().name, property);
    if (!association) {
        throw QueryError(QueryErrorCode::UNKNOWN_ASSOCIATION, name_,
            std::format("entity '{}' has no association '{}'", parent.entity().name, property));
    }
    const auto* target = metadata_->find_entity(association->target);
    if (!target) {
        throw QueryError(QueryErrorCode::UNKNOWN_ENTITY, name_,
            std::format("target entity '{}' of '{}' is not defined",
                association->target, association->path()));
    }
    return registry_->join(parent, *association, *target, join_type);
}

Query& Query::select(ExprPtr expression) {
    ensure_mutable("select");
    require_expression(expression, "select");
    ensure_visible(*expression);
    select_.push_back(std::move(expression));
    return *this;
}

Query& Query::where(ExprPtr predicate) {
    ensure_mutable("where");
    require_expression(predicate, "where");
    ensure_visible(*predicate);
    where_.push_back(std::move(predicate));
    return *this;
}

Query& Query::group_by(ExprPtr expression) {
    ensure_mutable("group by");
    require_expression(expression, "group by");
    ensure_visible(*expression);
    group_by_.push_back(std::move(expression));
    return *this;
}

Query& Query::having(ExprPtr predicate) {
    ensure_mutable("having");
    require_expression(predicate, "having");
    ensure_visible(*predicate);
    having_.push_back(std::move(predicate));
    return *this;
}

Query& Query::order_by(ExprPtr expression, OrderMode mode) {
    ensure_mutable("order by");
    require_expression(expression, "order by");
    ensure_visible(*expression);
    order_by_.push_back(OrderItem{std::move(expression), mode});
    return *this;
}

Query& Query::limit(int64_t limit, int64_t offset) {
    ensure_mutable("limit");
    if (limit < 0 || offset < 0) {
        throw QueryError(QueryErrorCode::INVALID_PAGING, name_,
            std::format("limit ({}) and offset ({}) must not be negative", limit, offset));
    }
    if (!enclosing_.empty()) {
        throw QueryError(QueryErrorCode::INVALID_PAGING, name_, "sub-queries cannot be paged");
    }
    paging_ = Paging{limit, offset};
    return *this;
}

bool Query::can_see(const TableReference& table) const {
    if (registry_->owns(table)) return true;
    for (const auto& outer : enclosing_) {
        if (outer->owns(table)) return true;
    }
    return false;
}

void Query::ensure_mutable(std::string_view operation) const {
    if (registry_->frozen()) {
        throw QueryError(QueryErrorCode::QUERY_FROZEN, name_,
            std::format("cannot add {} clause after the query was frozen", operation));
    }
}

void Query::ensure_visible(const Expression& expression) const {
    if (expression.kind() == ExpressionKind::COLUMN) {
        const auto& column = static_cast<const ColumnExpression&>(expression);
        if (!can_see(column.table())) {
            throw QueryError(QueryErrorCode::FOREIGN_TABLE_REFERENCE, name_,
                std::format("column '{}' belongs to table '{}' of another query",
                    column.column(), column.table().path()));
        }
        return;
    }
    for (const Expression* child : expression.children()) {
        ensure_visible(*child);
    }
}

} // namespace sqlpager
