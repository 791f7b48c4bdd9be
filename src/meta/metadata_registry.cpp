#include "meta/metadata_registry.hpp"
#include "core/error.hpp"

#include <format>

namespace sqlpager {

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw QueryError(QueryErrorCode::INVALID_METADATA, "", message);
}

} // anonymous namespace

void MetadataRegistry::add_entity(EntityType entity) {
    if (entity.name.empty()) fail("entity name is empty");
    if (entity.table.empty()) {
        fail(std::format("entity '{}' has no table", entity.name));
    }
    if (entity.id_column.empty()) {
        fail(std::format("entity '{}' has no id column", entity.name));
    }
    if (entities_.contains(entity.name)) {
        fail(std::format("entity '{}' is already registered", entity.name));
    }

    std::string key = entity.name;
    entities_.emplace(std::move(key), std::move(entity));
}

void MetadataRegistry::add_association(AssociationDescriptor association) {
    if (association.owner.empty() || association.property.empty()) {
        fail("association owner and property must be set");
    }

    const std::string key = association.path();
    if (!entities_.contains(association.owner)) {
        fail(std::format("association '{}': owner entity is not registered", key));
    }
    if (!entities_.contains(association.target)) {
        fail(std::format("association '{}': target entity '{}' is not registered",
            key, association.target));
    }
    if (association.join_columns.empty()) {
        fail(std::format("association '{}' has no join columns", key));
    }
    for (const auto& jc : association.join_columns) {
        if (jc.source.empty() || jc.target.empty()) {
            fail(std::format("association '{}' has an empty join column", key));
        }
    }
    if (associations_.contains(key)) {
        fail(std::format("association '{}' is already registered", key));
    }

    associations_.emplace(key, std::move(association));
}

const EntityType* MetadataRegistry::find_entity(std::string_view name) const {
    const auto it = entities_.find(std::string(name));
    return it != entities_.end() ? &it->second : nullptr;
}

const AssociationDescriptor* MetadataRegistry::find_association(
    std::string_view owner, std::string_view property) const {
    const auto it = associations_.find(std::format("{}.{}", owner, property));
    return it != associations_.end() ? &it->second : nullptr;
}

} // namespace sqlpager
