#include "ast/join_registry.hpp"
#include "core/error.hpp"

#include <format>
#include <functional>

namespace sqlpager {

size_t JoinRegistry::JoinKeyHash::operator()(const JoinKey& key) const noexcept {
    size_t h = std::hash<size_t>{}(key.parent_id);
    h ^= std::hash<std::string>{}(key.association_path) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= static_cast<size_t>(key.join_type) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

JoinRegistry::JoinRegistry(EntityType root_entity, std::string owner_name)
    : owner_name_(std::move(owner_name)) {
    references_.push_back(std::make_unique<TableReference>(0, std::move(root_entity)));
}

const TableReference& JoinRegistry::join(const TableReference& parent,
                                         const AssociationDescriptor& association,
                                         EntityType target,
                                         JoinType join_type) {
    if (frozen()) {
        throw QueryError(QueryErrorCode::QUERY_FROZEN, owner_name_,
            std::format("cannot join '{}' after the query was frozen", association.path()));
    }
    if (!owns(parent)) {
        throw QueryError(QueryErrorCode::INVALID_JOIN, owner_name_,
            std::format("parent table '{}' does not belong to this query", parent.path()));
    }
    if (association.owner != parent.entity().name) {
        throw QueryError(QueryErrorCode::INVALID_JOIN, owner_name_,
            std::format("association '{}' cannot be joined from entity '{}'",
                association.path(), parent.entity().name));
    }

    JoinKey key{parent.id(), association.path(), join_type};
    if (const auto it = index_.find(key); it != index_.end()) {
        return *it->second;
    }

    auto ref = std::make_unique<TableReference>(
        references_.size(), parent, association, std::move(target), join_type);
    const TableReference* raw = ref.get();
    references_.push_back(std::move(ref));
    index_.emplace(std::move(key), raw);
    return *raw;
}

bool JoinRegistry::owns(const TableReference& ref) const {
    return ref.id() < references_.size() && references_[ref.id()].get() == &ref;
}

std::vector<const TableReference*> JoinRegistry::children_of(const TableReference& parent) const {
    std::vector<const TableReference*> result;
    for (const auto& ref : references_) {
        if (ref->parent() == &parent) {
            result.push_back(ref.get());
        }
    }
    return result;
}

} // namespace sqlpager
