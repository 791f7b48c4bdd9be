#include "optimizer/join_eliminator.hpp"
#include "ast/query.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlpager {

std::string_view elimination_verdict_to_string(EliminationVerdict verdict) {
    switch (verdict) {
        case EliminationVerdict::ROOT: return "root";
        case EliminationVerdict::ELIMINATED: return "eliminated";
        case EliminationVerdict::COLLECTION_ASSOCIATION: return "collection_association";
        case EliminationVerdict::FILTER_USAGE: return "filter_usage";
        case EliminationVerdict::COUNT_SELECT_USAGE: return "count_select_usage";
        case EliminationVerdict::INNER_JOIN_NOT_GUARANTEED: return "inner_join_not_guaranteed";
        case EliminationVerdict::ANCESTOR_RETAINED: return "ancestor_retained";
        case EliminationVerdict::DESCENDANT_RETAINED: return "descendant_retained";
        case EliminationVerdict::OPTIMIZATION_DISABLED: return "optimization_disabled";
        default: return "unknown";
    }
}

JoinEliminator::JoinEliminator() : JoinEliminator(Config{}) {}

JoinEliminator::JoinEliminator(Config config)
    : config_(std::move(config)) {}

PruneResult JoinEliminator::prune(const Query& derived, const ClauseUsage& original_usage) const {
    if (!config_.enabled || !derived.is_derived()) {
        return retain_all(derived, EliminationVerdict::OPTIMIZATION_DISABLED);
    }

    const ClauseUsage derived_usage = ClauseUsageAnalyzer::analyze(derived);
    const auto& refs = derived.registry().references();
    const size_t n = refs.size();

    // 1. Local eligibility. refs[i]->id() == i, parents precede children.
    std::vector<EliminationVerdict> local(n, EliminationVerdict::ROOT);
    for (size_t i = 1; i < n; ++i) {
        local[i] = local_verdict(*refs[i], original_usage, derived_usage);
    }
    const auto eliminable = [&local](size_t i) {
        return local[i] == EliminationVerdict::ELIMINATED;
    };

    // 2. Bottom-up: a kept descendant needs every alias on its path
    std::vector<bool> descendant_retained(n, false);
    for (size_t i = n; i-- > 1;) {
        if (!eliminable(i) || descendant_retained[i]) {
            descendant_retained[refs[i]->parent()->id()] = true;
        }
    }

    // 3. Top-down: a kept ancestor keeps the whole subtree below it
    std::vector<bool> path_eliminable(n, false);
    PruneResult result;
    result.decisions.reserve(n);
    result.retained.insert(refs[0].get());
    result.decisions.push_back({refs[0].get(), EliminationVerdict::ROOT});

    for (size_t i = 1; i < n; ++i) {
        const TableReference& ref = *refs[i];
        const TableReference& parent = *ref.parent();
        const bool parent_path_ok = parent.is_root() || path_eliminable[parent.id()];
        path_eliminable[i] = eliminable(i) && parent_path_ok;

        EliminationVerdict verdict = local[i];
        if (eliminable(i)) {
            if (!parent_path_ok) {
                verdict = EliminationVerdict::ANCESTOR_RETAINED;
            } else if (descendant_retained[i]) {
                verdict = EliminationVerdict::DESCENDANT_RETAINED;
            }
        }

        if (verdict != EliminationVerdict::ELIMINATED) {
            result.retained.insert(&ref);
        }
        result.decisions.push_back({&ref, verdict});

        if (utils::log::enabled(utils::log::Level::DEBUG)) {
            utils::log::debug(std::format("Join elimination [{}]: {} ({}) -> {}",
                derived.name(), ref.path(), join_type_to_string(ref.join_type()),
                elimination_verdict_to_string(verdict)));
        }
    }

    return result;
}

EliminationVerdict JoinEliminator::local_verdict(const TableReference& table,
                                                 const ClauseUsage& original_usage,
                                                 const ClauseUsage& derived_usage) {
    const AssociationDescriptor& association = *table.association();

    if (association.is_collection) {
        return EliminationVerdict::COLLECTION_ASSOCIATION;
    }
    if (original_usage.is_used_by_filter(table)) {
        return EliminationVerdict::FILTER_USAGE;
    }
    if (derived_usage.is_used(table)) {
        return EliminationVerdict::COUNT_SELECT_USAGE;
    }
    if (table.join_type() == JoinType::INNER &&
        (!association.is_based_on_foreign_key || association.is_nullable)) {
        return EliminationVerdict::INNER_JOIN_NOT_GUARANTEED;
    }
    return EliminationVerdict::ELIMINATED;
}

PruneResult JoinEliminator::retain_all(const Query& query, EliminationVerdict verdict) {
    PruneResult result;
    for (const auto& ref : query.registry().references()) {
        result.retained.insert(ref.get());
        result.decisions.push_back({ref.get(), ref->is_root() ? EliminationVerdict::ROOT : verdict});
    }
    return result;
}

} // namespace sqlpager
