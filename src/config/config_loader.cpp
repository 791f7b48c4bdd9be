#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sqlpager {

// Config keys used more than once
static constexpr std::string_view kLogging      = "logging";
static constexpr std::string_view kPaging       = "paging";
static constexpr std::string_view kEntities     = "entities";
static constexpr std::string_view kAssociations = "associations";
static constexpr std::string_view kJoinColumns  = "join_columns";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// [["STORE_ID", "ID"], ...]; a malformed pair yields empty names, caught by validation
std::vector<JoinColumn> toml_join_columns(const toml::table& tbl) {
    std::vector<JoinColumn> result;
    const auto* arr = tbl[kJoinColumns].as_array();
    if (!arr) return result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        JoinColumn column;
        const auto* pair = elem.as_array();
        if (pair && pair->size() == 2) {
            column.source = (*pair)[0].value_or(""s);
            column.target = (*pair)[1].value_or(""s);
        }
        result.push_back(std::move(column));
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extraction ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root[kLogging].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

PagingConfig ConfigLoader::extract_paging(const toml::table& root) {
    PagingConfig cfg;
    const auto* paging = root[kPaging].as_table();
    if (!paging) return cfg;
    const auto& p = *paging;

    cfg.dialect_name = p["dialect"].value_or("default"s);
    cfg.join_elimination = p["join_elimination"].value_or(true);
    cfg.max_page_size = p["max_page_size"].value_or(int64_t{0});
    return cfg;
}

std::vector<EntityType> ConfigLoader::extract_entities(const toml::table& root) {
    std::vector<EntityType> result;
    const auto* arr = root[kEntities].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* e = elem.as_table();
        if (!e) continue;

        result.emplace_back(
            (*e)["name"].value_or(""s),
            (*e)["table"].value_or(""s),
            (*e)["id_column"].value_or("ID"s));
    }
    return result;
}

std::vector<AssociationDescriptor> ConfigLoader::extract_associations(const toml::table& root) {
    std::vector<AssociationDescriptor> result;
    const auto* arr = root[kAssociations].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* a = elem.as_table();
        if (!a) continue;

        AssociationDescriptor assoc;
        assoc.owner = (*a)["owner"].value_or(""s);
        assoc.property = (*a)["property"].value_or(""s);
        assoc.target = (*a)["target"].value_or(""s);
        assoc.is_collection = (*a)["collection"].value_or(false);
        assoc.is_nullable = (*a)["nullable"].value_or(true);
        assoc.is_based_on_foreign_key = (*a)["foreign_key"].value_or(true);
        assoc.join_columns = toml_join_columns(*a);
        result.push_back(std::move(assoc));
    }
    return result;
}

EngineConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    EngineConfig config;
    config.logging = extract_logging(tbl);
    config.paging = extract_paging(tbl);
    config.entities = extract_entities(tbl);
    config.associations = extract_associations(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    config.paging.dialect = parse_dialect(config.paging.dialect_name);
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::shared_ptr<MetadataRegistry> ConfigLoader::build_metadata(const EngineConfig& config) {
    auto registry = std::make_shared<MetadataRegistry>();
    for (const auto& entity : config.entities) {
        registry->add_entity(entity);
    }
    for (const auto& association : config.associations) {
        registry->add_association(association);
    }
    utils::log::info(std::format("Metadata loaded: {} entities, {} associations",
        registry->entity_count(), registry->association_count()));
    return registry;
}

PageFetcher::Config ConfigLoader::fetcher_config(const EngineConfig& config) {
    PageFetcher::Config cfg;
    cfg.dialect = config.paging.dialect;
    cfg.join_elimination = config.paging.join_elimination;
    cfg.max_page_size = config.paging.max_page_size;
    return cfg;
}

void ConfigLoader::apply_logging(const EngineConfig& config) {
    const auto level = utils::log::parse_level(config.logging.level);
    if (!level) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level", config.logging.level));
        return;
    }
    utils::log::set_level(*level);
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'", config.logging.level));
    }

    try {
        (void)parse_dialect(config.paging.dialect_name);
    } catch (const QueryError&) {
        errors.push_back(std::format(
            "paging.dialect '{}' is not supported (default, mysql, sqlserver, oracle)",
            config.paging.dialect_name));
    }

    if (config.paging.max_page_size < 0) {
        errors.push_back(std::format(
            "paging.max_page_size must be >= 0, got {}", config.paging.max_page_size));
    }

    std::unordered_set<std::string> entity_names;
    for (size_t i = 0; i < config.entities.size(); ++i) {
        const auto& e = config.entities[i];
        if (e.name.empty()) {
            errors.push_back(std::format("entities[{}].name must not be empty", i));
        } else if (!entity_names.insert(e.name).second) {
            errors.push_back(std::format("entities[{}].name '{}' is declared twice", i, e.name));
        }
        if (e.table.empty()) {
            errors.push_back(std::format("entities[{}].table must not be empty", i));
        }
        if (e.id_column.empty()) {
            errors.push_back(std::format("entities[{}].id_column must not be empty", i));
        }
    }

    for (size_t i = 0; i < config.associations.size(); ++i) {
        const auto& a = config.associations[i];
        if (a.owner.empty()) {
            errors.push_back(std::format("associations[{}].owner must not be empty", i));
        } else if (!entity_names.contains(a.owner)) {
            errors.push_back(std::format("associations[{}].owner '{}' is not a declared entity", i, a.owner));
        }
        if (a.property.empty()) {
            errors.push_back(std::format("associations[{}].property must not be empty", i));
        }
        if (a.target.empty()) {
            errors.push_back(std::format("associations[{}].target must not be empty", i));
        } else if (!entity_names.contains(a.target)) {
            errors.push_back(std::format("associations[{}].target '{}' is not a declared entity", i, a.target));
        }
        if (a.join_columns.empty()) {
            errors.push_back(std::format("associations[{}].join_columns must not be empty", i));
        }
        for (size_t j = 0; j < a.join_columns.size(); ++j) {
            if (a.join_columns[j].source.empty() || a.join_columns[j].target.empty()) {
                errors.push_back(std::format(
                    "associations[{}].join_columns[{}] must be a pair of non-empty column names", i, j));
            }
        }
    }

    return errors;
}

} // namespace sqlpager
