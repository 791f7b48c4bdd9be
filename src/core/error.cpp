#include "core/error.hpp"

#include <format>

namespace sqlpager {

std::string_view query_error_code_to_string(QueryErrorCode code) {
    switch (code) {
        case QueryErrorCode::RESELECT_NOT_ALLOWED: return "ReselectNotAllowed";
        case QueryErrorCode::AGGREGATE_SELECT_NOT_RESELECTABLE: return "AggregateSelectNotReselectable";
        case QueryErrorCode::GROUPED_QUERY_NOT_RESELECTABLE: return "GroupedQueryNotReselectable";
        case QueryErrorCode::UNSUPPORTED_DIALECT: return "UnsupportedDialect";
        case QueryErrorCode::QUERY_FROZEN: return "QueryFrozen";
        case QueryErrorCode::INVALID_JOIN: return "InvalidJoin";
        case QueryErrorCode::UNKNOWN_ASSOCIATION: return "UnknownAssociation";
        case QueryErrorCode::UNKNOWN_ENTITY: return "UnknownEntity";
        case QueryErrorCode::INVALID_PAGING: return "InvalidPaging";
        case QueryErrorCode::INVALID_METADATA: return "InvalidMetadata";
        case QueryErrorCode::FOREIGN_TABLE_REFERENCE: return "ForeignTableReference";
        default: return "Unknown";
    }
}

namespace {

std::string format_message(QueryErrorCode code, const std::string& query_name,
                           const std::string& message) {
    if (query_name.empty()) {
        return std::format("{}: {}", query_error_code_to_string(code), message);
    }
    return std::format("{} (query '{}'): {}",
        query_error_code_to_string(code), query_name, message);
}

} // anonymous namespace

QueryError::QueryError(QueryErrorCode code, std::string query_name, const std::string& message)
    : std::runtime_error(format_message(code, query_name, message)),
      code_(code),
      query_name_(std::move(query_name)) {}

} // namespace sqlpager
