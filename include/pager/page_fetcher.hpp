#pragma once

#include "ast/query.hpp"
#include "core/error.hpp"
#include "db/iquery_executor.hpp"
#include "dialect/dialect.hpp"
#include "optimizer/join_eliminator.hpp"
#include "render/sql_builder.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlpager {

/**
 * @brief Everything needed to fetch one page, rendered but not executed
 */
struct PagePlan {
    std::string query_name;
    std::shared_ptr<const Query> count_query;
    RenderResult count_statement;   // pruned row-count query
    RenderResult data_statement;    // unpruned data query, paginated
    PruneResult pruning;
    Dialect dialect = Dialect::DEFAULT;
    int64_t page_index = 0;
    int64_t page_size = 0;
    int64_t limit = 0;
    int64_t offset = 0;
};

struct Page {
    std::vector<std::vector<SqlValue>> rows;
    std::vector<std::string> column_names;
    int64_t total_row_count = 0;
    int64_t total_page_count = 0;
    int64_t page_index = 0;
    int64_t page_size = 0;
};

/**
 * @brief Runs the count query and the paged data query for a caller's query
 *
 * Flow:
 *   1. QueryReselector::count_query derives the row-count query
 *   2. ClauseUsageAnalyzer + JoinEliminator prune the count query's joins
 *   3. The data query is rendered unpruned and paginated for the dialect
 *   4. The count statement runs; when the requested page lies past the last
 *      row the data statement is skipped
 *
 * The data query's own limit/offset, if any, is replaced by the page
 * arguments.
 */
class PageFetcher {
public:
    struct Config {
        Dialect dialect = Dialect::DEFAULT;
        bool join_elimination = true;
        int64_t max_page_size = 0;  // 0 = unbounded
    };

    /**
     * @throws std::invalid_argument if executor is null
     */
    explicit PageFetcher(std::shared_ptr<IQueryExecutor> executor);
    PageFetcher(std::shared_ptr<IQueryExecutor> executor, Config config);

    /**
     * @throws QueryError INVALID_PAGING on bad page arguments, plus every
     *         error of QueryReselector::count_query and rendering
     */
    [[nodiscard]] PagePlan plan(const Query& query, int64_t page_index, int64_t page_size) const;

    /**
     * @brief plan() and execute it
     *
     * Invalid input throws QueryError as plan() does. Executor failures come
     * back as ErrorCategory::EXECUTION_ERROR.
     */
    [[nodiscard]] Result<Page> fetch_page(const Query& query, int64_t page_index, int64_t page_size) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    void validate_page(const Query& query, int64_t page_index, int64_t page_size) const;

    std::shared_ptr<IQueryExecutor> executor_;
    Config config_;
    JoinEliminator eliminator_;
};

} // namespace sqlpager
