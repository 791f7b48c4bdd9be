#pragma once

#include "ast/table_reference.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlpager {

/**
 * @brief Deduplicating owner of a query's table references
 *
 * Invariant: no two references share the same
 * (parent, association path, join type) triple. join() returns the existing
 * reference for a known triple, so navigating `book.store` from both the
 * where and the order-by clause produces a single SQL join. A different join
 * type on the same path is a distinct reference.
 *
 * References are stored in registration order; a parent is always
 * registered before its children.
 *
 * Thread-safety: join() is construction-phase only. Once frozen the
 * registry is read-only and may be shared across threads.
 */
class JoinRegistry {
public:
    explicit JoinRegistry(EntityType root_entity, std::string owner_name = {});

    JoinRegistry(const JoinRegistry&) = delete;
    JoinRegistry& operator=(const JoinRegistry&) = delete;

    [[nodiscard]] const TableReference& root() const { return *references_.front(); }

    /**
     * @brief Find or create the reference for (parent, association, join_type)
     * @throws QueryError QUERY_FROZEN after freeze(), INVALID_JOIN when the
     *         parent belongs to another registry or the association is not
     *         declared on the parent's entity
     */
    const TableReference& join(const TableReference& parent,
                               const AssociationDescriptor& association,
                               EntityType target,
                               JoinType join_type);

    [[nodiscard]] bool owns(const TableReference& ref) const;

    // All references in registration order, root first
    [[nodiscard]] const std::vector<std::unique_ptr<TableReference>>& references() const {
        return references_;
    }

    [[nodiscard]] size_t size() const { return references_.size(); }

    // Direct children of `parent`, in registration order
    [[nodiscard]] std::vector<const TableReference*> children_of(const TableReference& parent) const;

    void freeze() const { frozen_.store(true, std::memory_order_release); }
    [[nodiscard]] bool frozen() const { return frozen_.load(std::memory_order_acquire); }

private:
    struct JoinKey {
        size_t parent_id;
        std::string association_path;
        JoinType join_type;

        bool operator==(const JoinKey&) const = default;
    };

    struct JoinKeyHash {
        size_t operator()(const JoinKey& key) const noexcept;
    };

    std::string owner_name_;
    std::vector<std::unique_ptr<TableReference>> references_;
    std::unordered_map<JoinKey, const TableReference*, JoinKeyHash> index_;
    mutable std::atomic<bool> frozen_{false};
};

} // namespace sqlpager
