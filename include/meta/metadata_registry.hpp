#pragma once

#include "meta/entity_meta.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace sqlpager {

/**
 * @brief Read-only metadata lookup consumed by the query builder
 */
class IMetadataProvider {
public:
    virtual ~IMetadataProvider() = default;

    /**
     * @return Entity, or nullptr if unknown
     */
    [[nodiscard]] virtual const EntityType* find_entity(std::string_view name) const = 0;

    /**
     * @return Association keyed by (owner entity, property), or nullptr if unknown
     */
    [[nodiscard]] virtual const AssociationDescriptor* find_association(
        std::string_view owner, std::string_view property) const = 0;
};

/**
 * @brief In-memory metadata provider with eager validation
 *
 * Every descriptor is checked when it is added (QueryError INVALID_METADATA),
 * so lookups never return a half-formed association. Populate it once, then
 * share it read-only (std::shared_ptr<const MetadataRegistry>).
 *
 * Entities must be added before the associations that reference them.
 */
class MetadataRegistry : public IMetadataProvider {
public:
    MetadataRegistry() = default;

    void add_entity(EntityType entity);
    void add_association(AssociationDescriptor association);

    [[nodiscard]] const EntityType* find_entity(std::string_view name) const override;

    [[nodiscard]] const AssociationDescriptor* find_association(
        std::string_view owner, std::string_view property) const override;

    [[nodiscard]] size_t entity_count() const { return entities_.size(); }
    [[nodiscard]] size_t association_count() const { return associations_.size(); }

private:
    std::unordered_map<std::string, EntityType> entities_;
    std::unordered_map<std::string, AssociationDescriptor> associations_;   // key: owner.property
};

} // namespace sqlpager
