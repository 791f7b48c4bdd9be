#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sqlpager {

/**
 * @brief Mapped entity: logical name, table, primary key column
 */
struct EntityType {
    std::string name;
    std::string table;
    std::string id_column;

    EntityType() = default;
    EntityType(std::string n, std::string t, std::string id)
        : name(std::move(n)), table(std::move(t)), id_column(std::move(id)) {}
};

/**
 * @brief One equality of a join condition: parent.source = joined.target
 */
struct JoinColumn {
    std::string source;     // Column on the parent (owning) table
    std::string target;     // Column on the joined table
};

/**
 * @brief Resolved association between two entities
 *
 * Plain data supplied by the metadata layer. The elimination rules only
 * consume the three boolean facts; the rest is needed to render the join.
 */
struct AssociationDescriptor {
    std::string owner;                      // Owning entity name
    std::string property;                   // Property name on the owner
    std::string target;                     // Target entity name
    std::vector<JoinColumn> join_columns;

    bool is_collection = false;             // one-to-many / many-to-many
    bool is_nullable = true;                // owning foreign key may be null
    bool is_based_on_foreign_key = true;    // false for computed joins

    [[nodiscard]] bool is_reference() const { return !is_collection; }

    // "Owner.property", the dedup key component of a join
    [[nodiscard]] std::string path() const { return owner + "." + property; }
};

} // namespace sqlpager
