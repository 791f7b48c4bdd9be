#include "ast/table_reference.hpp"

namespace sqlpager {

TableReference::TableReference(size_t id, EntityType entity)
    : id_(id), entity_(std::move(entity)) {}

TableReference::TableReference(size_t id,
                               const TableReference& parent,
                               AssociationDescriptor association,
                               EntityType target,
                               JoinType join_type)
    : id_(id),
      parent_(&parent),
      association_(std::move(association)),
      entity_(std::move(target)),
      join_type_(join_type),
      depth_(parent.depth() + 1) {}

bool TableReference::is_descendant_of(const TableReference& ancestor) const {
    for (const TableReference* p = parent_; p != nullptr; p = p->parent()) {
        if (p == &ancestor) return true;
    }
    return false;
}

std::string TableReference::path() const {
    if (is_root()) return entity_.name;

    std::string result = parent_->path();
    result += '.';
    result += association_->property;
    if (join_type_ == JoinType::LEFT_OUTER) {
        result += '?';
    }
    return result;
}

} // namespace sqlpager
