#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sqlpager {

// ============================================================================
// Basic Enums
// ============================================================================

enum class JoinType {
    INNER,
    LEFT_OUTER
};

enum class ClauseKind : uint8_t {
    SELECT,
    WHERE,
    GROUP_BY,
    HAVING,
    ORDER_BY
};

enum class OrderMode {
    ASC,
    DESC
};

// Clause kinds are tracked as a bitmask per table reference.
// Checking membership in a category is a single AND.
using ClauseMask = uint8_t;

namespace clause_mask {
    inline constexpr ClauseMask bit(ClauseKind k) noexcept {
        return static_cast<ClauseMask>(1u << static_cast<int>(k));
    }
    inline constexpr ClauseMask kNone = 0;
    inline constexpr ClauseMask kFilter =
        bit(ClauseKind::WHERE) | bit(ClauseKind::GROUP_BY) | bit(ClauseKind::HAVING);
    inline constexpr ClauseMask kProjection =
        bit(ClauseKind::SELECT) | bit(ClauseKind::ORDER_BY);
    inline constexpr ClauseMask kAll = kFilter | kProjection;
    [[nodiscard]] inline constexpr bool test(ClauseMask mask, ClauseMask category) noexcept {
        return (mask & category) != 0;
    }
    [[nodiscard]] inline constexpr bool test(ClauseMask mask, ClauseKind k) noexcept {
        return (mask & bit(k)) != 0;
    }
}

[[nodiscard]] inline std::string_view join_type_to_string(JoinType type) {
    switch (type) {
        case JoinType::INNER: return "INNER";
        case JoinType::LEFT_OUTER: return "LEFT_OUTER";
        default: return "UNKNOWN";
    }
}

[[nodiscard]] inline std::string_view clause_kind_to_string(ClauseKind kind) {
    switch (kind) {
        case ClauseKind::SELECT: return "SELECT";
        case ClauseKind::WHERE: return "WHERE";
        case ClauseKind::GROUP_BY: return "GROUP_BY";
        case ClauseKind::HAVING: return "HAVING";
        case ClauseKind::ORDER_BY: return "ORDER_BY";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Bound Parameter Values
// ============================================================================

/**
 * @brief Scalar value bound to a positional '?' placeholder
 *
 * std::monostate is SQL NULL.
 */
using SqlValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

[[nodiscard]] std::string value_to_string(const SqlValue& value);

// ============================================================================
// Execution Result
// ============================================================================

/**
 * @brief Rows returned by the execution collaborator
 */
struct QueryResult {
    bool success = false;
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<std::vector<SqlValue>> rows;
};

} // namespace sqlpager
