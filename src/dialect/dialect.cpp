#include "dialect/dialect.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>

namespace sqlpager {

std::string_view dialect_to_string(Dialect dialect) {
    switch (dialect) {
        case Dialect::DEFAULT: return keys::DEFAULT;
        case Dialect::MYSQL: return keys::MYSQL;
        case Dialect::SQLSERVER: return keys::SQLSERVER;
        case Dialect::ORACLE: return keys::ORACLE;
        default: return "unknown";
    }
}

Dialect parse_dialect(std::string_view name) {
    // string_view keys: no allocation on the happy path
    static const std::unordered_map<std::string_view, Dialect> lookup = {
        {keys::DEFAULT,    Dialect::DEFAULT},
        {keys::ANSI,       Dialect::DEFAULT},
        {keys::POSTGRES,   Dialect::DEFAULT},
        {keys::POSTGRESQL, Dialect::DEFAULT},
        {keys::H2,         Dialect::DEFAULT},
        {keys::MYSQL,      Dialect::MYSQL},
        {keys::MARIADB,    Dialect::MYSQL},
        {keys::SQLSERVER,  Dialect::SQLSERVER},
        {keys::MSSQL,      Dialect::SQLSERVER},
        {keys::ORACLE,     Dialect::ORACLE},
    };

    if (const auto it = lookup.find(name); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback
    for (const auto& [key, value] : lookup) {
        if (key.size() == name.size()) {
            const bool match = std::equal(key.begin(), key.end(), name.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    throw QueryError(QueryErrorCode::UNSUPPORTED_DIALECT, "",
        std::format("unknown dialect '{}'", name));
}

} // namespace sqlpager
