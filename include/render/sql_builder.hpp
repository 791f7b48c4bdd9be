#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlpager {

class TableReference;

/**
 * @brief Rendered statement: SQL text + positional parameters
 *
 * The i-th '?' in sql is bound to params[i].
 */
struct RenderResult {
    std::string sql;
    std::vector<SqlValue> params;

    bool operator==(const RenderResult&) const = default;
};

/**
 * @brief Per-render-call accumulator for SQL text, parameters and aliases
 *
 * Alias and parameter counters live here and nowhere else, so nothing leaks
 * between render calls. Not thread-safe; one builder per call.
 */
class SqlBuilder {
public:
    SqlBuilder() = default;

    SqlBuilder(const SqlBuilder&) = delete;
    SqlBuilder& operator=(const SqlBuilder&) = delete;

    SqlBuilder& sql(std::string_view text);

    // Appends '?' and binds `value` to it
    SqlBuilder& variable(SqlValue value);

    // Appends an already rendered fragment, keeping its parameter order
    SqlBuilder& append(const RenderResult& fragment);

    /**
     * @brief Give `table` the next alias (tb_1_, tb_2_, ...)
     */
    const std::string& assign_alias(const TableReference& table);

    /**
     * @throws QueryError FOREIGN_TABLE_REFERENCE if no alias was assigned
     */
    [[nodiscard]] const std::string& alias_of(const TableReference& table) const;

    [[nodiscard]] size_t param_count() const { return params_.size(); }

    [[nodiscard]] RenderResult build() &&;

private:
    std::string sql_;
    std::vector<SqlValue> params_;
    std::unordered_map<const TableReference*, std::string> aliases_;
    size_t next_alias_ = 1;
};

} // namespace sqlpager
