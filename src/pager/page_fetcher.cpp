#include "pager/page_fetcher.hpp"
#include "analyzer/clause_usage_analyzer.hpp"
#include "core/utils.hpp"
#include "render/pagination_renderer.hpp"
#include "render/sql_renderer.hpp"
#include "rewriter/query_reselector.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>

namespace sqlpager {

namespace {

std::optional<int64_t> read_row_count(const QueryResult& result) {
    if (result.rows.empty() || result.rows.front().empty()) return std::nullopt;
    const SqlValue& cell = result.rows.front().front();
    if (const auto* i = std::get_if<int64_t>(&cell)) return *i;
    if (const auto* d = std::get_if<double>(&cell)) {
        // 2^63 itself does not fit
        if (!std::isfinite(*d) || *d < 0.0 || *d >= 9223372036854775808.0) return std::nullopt;
        return static_cast<int64_t>(*d);
    }
    return std::nullopt;
}

} // namespace

PageFetcher::PageFetcher(std::shared_ptr<IQueryExecutor> executor)
    : PageFetcher(std::move(executor), Config{}) {}

PageFetcher::PageFetcher(std::shared_ptr<IQueryExecutor> executor, Config config)
    : executor_(std::move(executor)),
      config_(config),
      eliminator_(JoinEliminator::Config{config.join_elimination}) {
    if (!executor_) {
        throw std::invalid_argument("PageFetcher requires a query executor");
    }
}

void PageFetcher::validate_page(const Query& query, int64_t page_index, int64_t page_size) const {
    if (page_index < 0) {
        throw QueryError(QueryErrorCode::INVALID_PAGING, query.name(),
            std::format("page index must not be negative, got {}", page_index));
    }
    if (page_size <= 0) {
        throw QueryError(QueryErrorCode::INVALID_PAGING, query.name(),
            std::format("page size must be positive, got {}", page_size));
    }
    if (config_.max_page_size > 0 && page_size > config_.max_page_size) {
        throw QueryError(QueryErrorCode::INVALID_PAGING, query.name(),
            std::format("page size {} exceeds the maximum of {}", page_size, config_.max_page_size));
    }
    if (page_index > std::numeric_limits<int64_t>::max() / page_size ||
        page_index * page_size > std::numeric_limits<int64_t>::max() - page_size) {
        throw QueryError(QueryErrorCode::INVALID_PAGING, query.name(),
            std::format("page {} of size {} is out of range", page_index, page_size));
    }
}

PagePlan PageFetcher::plan(const Query& query, int64_t page_index, int64_t page_size) const {
    validate_page(query, page_index, page_size);

    PagePlan plan;
    plan.query_name = query.name();
    plan.dialect = config_.dialect;
    plan.page_index = page_index;
    plan.page_size = page_size;
    plan.limit = page_size;
    plan.offset = page_index * page_size;

    plan.count_query = QueryReselector::count_query(query);
    const ClauseUsage original_usage = ClauseUsageAnalyzer::analyze(query);
    plan.pruning = eliminator_.prune(*plan.count_query, original_usage);
    plan.count_statement = SqlRenderer::render_body(*plan.count_query, &plan.pruning);

    const RenderResult body = SqlRenderer::render_body(query);
    plan.data_statement = render_pagination(config_.dialect, body, plan.limit, plan.offset);

    if (utils::log::enabled(utils::log::Level::DEBUG)) {
        utils::log::debug(std::format("Page plan [{}]: page {} size {}, {} of {} join(s) eliminated",
            plan.query_name, page_index, page_size,
            plan.pruning.eliminated_count(), plan.pruning.decisions.size() - 1));
    }
    return plan;
}

Result<Page> PageFetcher::fetch_page(const Query& query, int64_t page_index, int64_t page_size) const {
    const PagePlan plan = this->plan(query, page_index, page_size);

    Page page;
    page.page_index = page_index;
    page.page_size = page_size;

    const QueryResult count_result = executor_->execute(plan.count_statement);
    if (!count_result.success) {
        utils::log::warn(std::format("Count query failed [{}]: {}", plan.query_name, count_result.error_message));
        return Result<Page>::error(ErrorCategory::EXECUTION_ERROR,
            std::format("count query '{}' failed: {}", plan.query_name, count_result.error_message));
    }

    const auto total = read_row_count(count_result);
    if (!total || *total < 0) {
        utils::log::warn(std::format("Count query returned no usable row count [{}]", plan.query_name));
        return Result<Page>::error(ErrorCategory::EXECUTION_ERROR,
            std::format("count query '{}' returned no usable row count", plan.query_name));
    }

    page.total_row_count = *total;
    page.total_page_count = (*total + page_size - 1) / page_size;

    if (*total == 0 || plan.offset >= *total) {
        utils::log::debug(std::format("Page {} of '{}' is past the last row ({} rows), data query skipped",
            page_index, plan.query_name, *total));
        return Result<Page>::ok(std::move(page));
    }

    QueryResult data_result = executor_->execute(plan.data_statement);
    if (!data_result.success) {
        utils::log::warn(std::format("Data query failed [{}]: {}", plan.query_name, data_result.error_message));
        return Result<Page>::error(ErrorCategory::EXECUTION_ERROR,
            std::format("data query '{}' failed: {}", plan.query_name, data_result.error_message));
    }

    page.rows = std::move(data_result.rows);
    page.column_names = std::move(data_result.column_names);

    utils::log::debug(std::format("Fetched page {} of '{}': {} row(s), {} total",
        page_index, plan.query_name, page.rows.size(), page.total_row_count));
    return Result<Page>::ok(std::move(page));
}

} // namespace sqlpager
