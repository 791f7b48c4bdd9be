#pragma once

#include "ast/expression.hpp"
#include "ast/join_registry.hpp"
#include "meta/metadata_registry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlpager {

struct OrderItem {
    ExprPtr expression;
    OrderMode mode = OrderMode::ASC;
};

struct Paging {
    int64_t limit = 0;
    int64_t offset = 0;
};

/**
 * @brief Query AST: root table, joined tables, clause trees, paging
 *
 * Lifecycle:
 * 1. Construction phase: create(), join(), where(), select(), ... build the
 *    query in place.
 * 2. The first reselect or render freezes the join registry. From then on
 *    every mutator throws QueryError QUERY_FROZEN and the query may be
 *    rendered from several threads at once.
 *
 * Derivation (QueryReselector) never mutates a query; it produces a new one
 * sharing the root, the join registry and the filter clauses.
 *
 * Column expressions must reference tables of this query or, for a
 * sub-query, of an enclosing query (QueryError FOREIGN_TABLE_REFERENCE).
 */
class Query {
public:
    /**
     * @param name Label used in error messages; defaults to the root entity name
     * @throws QueryError UNKNOWN_ENTITY
     */
    [[nodiscard]] static std::shared_ptr<Query> create(
        std::shared_ptr<const IMetadataProvider> metadata,
        std::string_view root_entity,
        std::string name = {});

    /**
     * @brief Start a sub-query that may reference this query's tables
     */
    [[nodiscard]] std::shared_ptr<Query> subquery(std::string_view root_entity) const;

    // ---- Construction ------------------------------------------------------

    [[nodiscard]] const TableReference& root() const { return registry_->root(); }

    /**
     * @brief Navigate `parent.property`, reusing an existing identical join
     * @throws QueryError UNKNOWN_ASSOCIATION, INVALID_JOIN, QUERY_FROZEN
     */
    const TableReference& join(const TableReference& parent,
                               std::string_view property,
                               JoinType join_type = JoinType::INNER);

    Query& select(ExprPtr expression);
    Query& where(ExprPtr predicate);
    Query& group_by(ExprPtr expression);
    Query& having(ExprPtr predicate);
    Query& order_by(ExprPtr expression, OrderMode mode = OrderMode::ASC);

    /**
     * @throws QueryError INVALID_PAGING on negative values
     */
    Query& limit(int64_t limit, int64_t offset = 0);

    // ---- Inspection --------------------------------------------------------

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<ExprPtr>& selections() const { return select_; }
    [[nodiscard]] const std::vector<ExprPtr>& predicates() const { return where_; }
    [[nodiscard]] const std::vector<ExprPtr>& group_by_items() const { return group_by_; }
    [[nodiscard]] const std::vector<ExprPtr>& having_predicates() const { return having_; }
    [[nodiscard]] const std::vector<OrderItem>& orderings() const { return order_by_; }
    [[nodiscard]] const std::optional<Paging>& paging() const { return paging_; }
    [[nodiscard]] bool is_derived() const { return derived_; }

    [[nodiscard]] const JoinRegistry& registry() const { return *registry_; }
    [[nodiscard]] const std::shared_ptr<const IMetadataProvider>& metadata() const { return metadata_; }

    /**
     * @brief True if `table` belongs to this query or an enclosing one
     */
    [[nodiscard]] bool can_see(const TableReference& table) const;

    void freeze() const { registry_->freeze(); }
    [[nodiscard]] bool frozen() const { return registry_->frozen(); }

private:
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    // Reachable only through create(), subquery() and QueryReselector
    Query(ConstructionTag,
          std::shared_ptr<const IMetadataProvider> metadata,
          std::shared_ptr<JoinRegistry> registry,
          std::string name);
    Query(ConstructionTag, const Query& other) : Query(other) {}

private:
    friend class QueryReselector;

    Query(const Query&) = default;

    void ensure_mutable(std::string_view operation) const;
    void ensure_visible(const Expression& expression) const;

    std::shared_ptr<const IMetadataProvider> metadata_;
    std::shared_ptr<JoinRegistry> registry_;

    // Registries of enclosing queries, innermost first (sub-queries only)
    std::vector<std::shared_ptr<const JoinRegistry>> enclosing_;

    std::string name_;
    std::vector<ExprPtr> select_;
    std::vector<ExprPtr> where_;
    std::vector<ExprPtr> group_by_;
    std::vector<ExprPtr> having_;
    std::vector<OrderItem> order_by_;
    std::optional<Paging> paging_;
    bool derived_ = false;
};

} // namespace sqlpager
