#pragma once

#include <string_view>

namespace sqlpager {

namespace keys {
    inline constexpr std::string_view DEFAULT = "default";
    inline constexpr std::string_view ANSI = "ansi";
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view H2 = "h2";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view SQLSERVER = "sqlserver";
    inline constexpr std::string_view MSSQL = "mssql";
    inline constexpr std::string_view ORACLE = "oracle";
}

/**
 * @brief Pagination syntax family of the target database
 *
 * DEFAULT:   limit ? offset ?
 * MYSQL:     limit ?, ?
 * SQLSERVER: offset ? rows fetch next ? rows only
 * ORACLE:    rownum wrapping
 */
enum class Dialect {
    DEFAULT,
    MYSQL,
    SQLSERVER,
    ORACLE,
};

[[nodiscard]] std::string_view dialect_to_string(Dialect dialect);

/**
 * @brief Parse a dialect name (case-insensitive, aliases accepted)
 * @throws QueryError UNSUPPORTED_DIALECT
 */
[[nodiscard]] Dialect parse_dialect(std::string_view name);

} // namespace sqlpager
