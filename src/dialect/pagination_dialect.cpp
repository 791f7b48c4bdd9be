#include "dialect/pagination_dialect.hpp"
#include "core/error.hpp"

#include <format>

namespace sqlpager {

void DefaultPaginationDialect::paginate(
    SqlBuilder& out, const RenderResult& body, int64_t limit, int64_t offset) const {
    out.append(body)
       .sql(" limit ").variable(limit)
       .sql(" offset ").variable(offset);
}

void MySqlPaginationDialect::paginate(
    SqlBuilder& out, const RenderResult& body, int64_t limit, int64_t offset) const {
    out.append(body)
       .sql(" limit ").variable(offset)
       .sql(", ").variable(limit);
}

void SqlServerPaginationDialect::paginate(
    SqlBuilder& out, const RenderResult& body, int64_t limit, int64_t offset) const {
    out.append(body)
       .sql(" offset ").variable(offset)
       .sql(" rows fetch next ").variable(limit)
       .sql(" rows only");
}

void OraclePaginationDialect::paginate(
    SqlBuilder& out, const RenderResult& body, int64_t limit, int64_t offset) const {
    if (offset == 0) {
        out.sql("select core__.* from ( ")
           .append(body)
           .sql(" ) core__ where rownum <= ").variable(limit);
        return;
    }
    out.sql("select * from ( select core__.*, rownum rn__ from ( ")
       .append(body)
       .sql(" ) core__ where rownum <= ").variable(limit + offset)
       .sql(" ) limited__ where rn__ > ").variable(offset);
}

std::shared_ptr<const IPaginationDialect> make_pagination_dialect(Dialect dialect) {
    static const auto default_dialect = std::make_shared<const DefaultPaginationDialect>();
    static const auto mysql_dialect = std::make_shared<const MySqlPaginationDialect>();
    static const auto sqlserver_dialect = std::make_shared<const SqlServerPaginationDialect>();
    static const auto oracle_dialect = std::make_shared<const OraclePaginationDialect>();

    switch (dialect) {
        case Dialect::DEFAULT: return default_dialect;
        case Dialect::MYSQL: return mysql_dialect;
        case Dialect::SQLSERVER: return sqlserver_dialect;
        case Dialect::ORACLE: return oracle_dialect;
    }
    throw QueryError(QueryErrorCode::UNSUPPORTED_DIALECT, "",
        std::format("no pagination strategy for dialect #{}", static_cast<int>(dialect)));
}

} // namespace sqlpager
