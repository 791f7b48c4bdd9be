#pragma once

#include "dialect/dialect.hpp"
#include "render/sql_builder.hpp"

#include <cstdint>

namespace sqlpager {

/**
 * @brief Apply dialect paging to an unpaginated statement
 *
 * The body's parameters come first, then the paging parameters in the order
 * their placeholders appear, so '?' and params stay 1:1 after wrapping.
 *
 * @throws QueryError INVALID_PAGING on negative limit/offset,
 *         UNSUPPORTED_DIALECT for a dialect without a strategy
 */
[[nodiscard]] RenderResult render_pagination(Dialect dialect,
                                             const RenderResult& body,
                                             int64_t limit,
                                             int64_t offset);

} // namespace sqlpager
