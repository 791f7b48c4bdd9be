#pragma once

#include "core/types.hpp"
#include "render/sql_builder.hpp"

namespace sqlpager {

/**
 * @brief Runs rendered statements against a database
 *
 * The engine never opens a connection itself; PageFetcher holds a
 * shared_ptr<IQueryExecutor>. Failures are reported through
 * QueryResult::success / error_message, not exceptions.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @param statement SQL text; the i-th '?' binds statement.params[i]
     */
    [[nodiscard]] virtual QueryResult execute(const RenderResult& statement) = 0;
};

} // namespace sqlpager
