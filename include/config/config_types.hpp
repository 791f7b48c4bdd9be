#pragma once

#include "dialect/dialect.hpp"
#include "meta/entity_meta.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlpager {

// ============================================================================
// Configuration Types (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";     // debug | info | warn | error
};

struct PagingConfig {
    std::string dialect_name = "default";
    Dialect dialect = Dialect::DEFAULT;     // Resolved from dialect_name on load
    bool join_elimination = true;
    int64_t max_page_size = 0;              // 0 = unbounded
};

struct EngineConfig {
    LoggingConfig logging;
    PagingConfig paging;
    std::vector<EntityType> entities;
    std::vector<AssociationDescriptor> associations;
};

} // namespace sqlpager
