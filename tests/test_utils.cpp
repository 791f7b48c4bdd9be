#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <string>

using namespace sqlpager;

TEST_CASE("Log: parse_level accepts known names", "[utils][log]") {
    CHECK(utils::log::parse_level("debug") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level("INFO") == utils::log::Level::INFO);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("Error") == utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::parse_level("trace").has_value());
}

TEST_CASE("Log: minimum level filters messages", "[utils][log]") {
    const auto previous = utils::log::level();

    utils::log::set_level(utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::enabled(utils::log::Level::WARN));
    CHECK(utils::log::enabled(utils::log::Level::ERROR));

    utils::log::set_level(utils::log::Level::DEBUG);
    CHECK(utils::log::enabled(utils::log::Level::DEBUG));

    utils::log::set_level(previous);
}

TEST_CASE("SqlValue: value_to_string", "[types]") {
    CHECK(value_to_string(SqlValue{}) == "null");
    CHECK(value_to_string(SqlValue{true}) == "true");
    CHECK(value_to_string(SqlValue{int64_t{42}}) == "42");
    CHECK(value_to_string(SqlValue{2.5}) == "2.5");
    CHECK(value_to_string(SqlValue{std::string("abc")}) == "'abc'");
}

TEST_CASE("ClauseMask: filter and projection categories", "[types]") {
    const ClauseMask where = clause_mask::bit(ClauseKind::WHERE);
    const ClauseMask order = clause_mask::bit(ClauseKind::ORDER_BY);

    CHECK(clause_mask::test(where, clause_mask::kFilter));
    CHECK_FALSE(clause_mask::test(order, clause_mask::kFilter));
    CHECK(clause_mask::test(order, clause_mask::kProjection));
    CHECK(clause_mask::test(where | order, ClauseKind::ORDER_BY));
}

TEST_CASE("QueryError: message names code and query", "[error]") {
    const QueryError named(QueryErrorCode::GROUPED_QUERY_NOT_RESELECTABLE, "bookPage", "grouped");
    CHECK(std::string(named.what()) == "GroupedQueryNotReselectable (query 'bookPage'): grouped");
    CHECK(named.query_name() == "bookPage");

    const QueryError anonymous(QueryErrorCode::UNSUPPORTED_DIALECT, "", "unknown dialect 'db2'");
    CHECK(std::string(anonymous.what()) == "UnsupportedDialect: unknown dialect 'db2'");
}
