#pragma once

#include "dialect/dialect.hpp"
#include "render/sql_builder.hpp"

#include <cstdint>
#include <memory>

namespace sqlpager {

/**
 * @brief Dialect strategy for paging a rendered statement
 *
 * Implementations append the body (text and parameters, unchanged) to `out`
 * and add their paging syntax around or after it. Limit and offset are always
 * bound as parameters, in the order their placeholders appear in the text.
 */
class IPaginationDialect {
public:
    virtual ~IPaginationDialect() = default;

    [[nodiscard]] virtual Dialect type() const = 0;

    virtual void paginate(SqlBuilder& out,
                          const RenderResult& body,
                          int64_t limit,
                          int64_t offset) const = 0;
};

// <body> limit ? offset ?
class DefaultPaginationDialect final : public IPaginationDialect {
public:
    [[nodiscard]] Dialect type() const override { return Dialect::DEFAULT; }
    void paginate(SqlBuilder& out, const RenderResult& body, int64_t limit, int64_t offset) const override;
};

// <body> limit ?, ?   (offset first)
class MySqlPaginationDialect final : public IPaginationDialect {
public:
    [[nodiscard]] Dialect type() const override { return Dialect::MYSQL; }
    void paginate(SqlBuilder& out, const RenderResult& body, int64_t limit, int64_t offset) const override;
};

// <body> offset ? rows fetch next ? rows only
class SqlServerPaginationDialect final : public IPaginationDialect {
public:
    [[nodiscard]] Dialect type() const override { return Dialect::SQLSERVER; }
    void paginate(SqlBuilder& out, const RenderResult& body, int64_t limit, int64_t offset) const override;
};

/**
 * @brief rownum wrapping
 *
 * offset == 0:
 *   select core__.* from ( <body> ) core__ where rownum <= ?
 * offset > 0:
 *   select * from ( select core__.*, rownum rn__ from ( <body> ) core__
 *   where rownum <= ? ) limited__ where rn__ > ?
 * with the first bound value limit + offset.
 */
class OraclePaginationDialect final : public IPaginationDialect {
public:
    [[nodiscard]] Dialect type() const override { return Dialect::ORACLE; }
    void paginate(SqlBuilder& out, const RenderResult& body, int64_t limit, int64_t offset) const override;
};

/**
 * @brief Shared, stateless strategy instance for `dialect`
 * @throws QueryError UNSUPPORTED_DIALECT for a value outside the enum
 */
[[nodiscard]] std::shared_ptr<const IPaginationDialect> make_pagination_dialect(Dialect dialect);

} // namespace sqlpager
