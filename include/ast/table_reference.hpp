#pragma once

#include "core/types.hpp"
#include "meta/entity_meta.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace sqlpager {

/**
 * @brief One SQL table occurrence in a query
 *
 * Either the root table or the result of joining a parent reference
 * through an association. Instances are owned by a JoinRegistry and are
 * identified by address; id() is the registration ordinal (root = 0).
 */
class TableReference {
public:
    TableReference(size_t id, EntityType entity);

    TableReference(size_t id,
                   const TableReference& parent,
                   AssociationDescriptor association,
                   EntityType target,
                   JoinType join_type);

    // Identity matters: never copied or moved once registered
    TableReference(const TableReference&) = delete;
    TableReference& operator=(const TableReference&) = delete;

    [[nodiscard]] size_t id() const { return id_; }
    [[nodiscard]] bool is_root() const { return parent_ == nullptr; }
    [[nodiscard]] const TableReference* parent() const { return parent_; }
    [[nodiscard]] JoinType join_type() const { return join_type_; }
    [[nodiscard]] const EntityType& entity() const { return entity_; }
    [[nodiscard]] size_t depth() const { return depth_; }

    /**
     * @return Association that produced this join, nullptr for the root
     */
    [[nodiscard]] const AssociationDescriptor* association() const {
        return association_ ? &*association_ : nullptr;
    }

    /**
     * @brief True if `ancestor` is on the parent chain of this reference
     */
    [[nodiscard]] bool is_descendant_of(const TableReference& ancestor) const;

    /**
     * @brief Navigation path for diagnostics, e.g. "Book.store?.country"
     *
     * Left outer joins are marked with '?'.
     */
    [[nodiscard]] std::string path() const;

private:
    size_t id_;
    const TableReference* parent_ = nullptr;
    std::optional<AssociationDescriptor> association_;
    EntityType entity_;
    JoinType join_type_ = JoinType::INNER;
    size_t depth_ = 0;
};

} // namespace sqlpager
