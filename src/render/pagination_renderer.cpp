#include "render/pagination_renderer.hpp"
#include "core/error.hpp"
#include "dialect/pagination_dialect.hpp"

#include <format>
#include <limits>

namespace sqlpager {

RenderResult render_pagination(Dialect dialect,
                               const RenderResult& body,
                               int64_t limit,
                               int64_t offset) {
    if (limit < 0 || offset < 0) {
        throw QueryError(QueryErrorCode::INVALID_PAGING, "",
            std::format("limit ({}) and offset ({}) must not be negative", limit, offset));
    }
    // Row-number wrapping binds limit + offset
    if (offset > std::numeric_limits<int64_t>::max() - limit) {
        throw QueryError(QueryErrorCode::INVALID_PAGING, "",
            std::format("limit ({}) plus offset ({}) is out of range", limit, offset));
    }

    const auto strategy = make_pagination_dialect(dialect);

    SqlBuilder out;
    strategy->paginate(out, body, limit, offset);
    return std::move(out).build();
}

} // namespace sqlpager
