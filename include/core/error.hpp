#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sqlpager {

/**
 * @brief Error categories for operations that return Result<T>
 */
enum class ErrorCategory {
    NONE,
    EXECUTION_ERROR
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Query validation errors (thrown)
// ============================================================================

enum class QueryErrorCode {
    RESELECT_NOT_ALLOWED,
    AGGREGATE_SELECT_NOT_RESELECTABLE,
    GROUPED_QUERY_NOT_RESELECTABLE,
    UNSUPPORTED_DIALECT,
    QUERY_FROZEN,
    INVALID_JOIN,
    UNKNOWN_ASSOCIATION,
    UNKNOWN_ENTITY,
    INVALID_PAGING,
    INVALID_METADATA,
    FOREIGN_TABLE_REFERENCE
};

[[nodiscard]] std::string_view query_error_code_to_string(QueryErrorCode code);

/**
 * @brief Caller-input validation failure
 *
 * Never transient: retrying the same call fails the same way.
 * query_name() names the offending query (empty when no query is involved,
 * e.g. dialect parsing or metadata registration).
 */
class QueryError : public std::runtime_error {
public:
    QueryError(QueryErrorCode code, std::string query_name, const std::string& message);

    [[nodiscard]] QueryErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& query_name() const noexcept { return query_name_; }

private:
    QueryErrorCode code_;
    std::string query_name_;
};

} // namespace sqlpager
