#pragma once

#include "config/config_types.hpp"
#include "meta/metadata_registry.hpp"
#include "pager/page_fetcher.hpp"

#include <toml++/toml.hpp>

#include <memory>
#include <string>
#include <vector>

namespace sqlpager {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Build the metadata registry declared by [[entities]] / [[associations]]
     * @throws QueryError INVALID_METADATA (e.g. duplicate association)
     */
    [[nodiscard]] static std::shared_ptr<MetadataRegistry> build_metadata(const EngineConfig& config);

    [[nodiscard]] static PageFetcher::Config fetcher_config(const EngineConfig& config);

    // Sets the process-wide log level from [logging]
    static void apply_logging(const EngineConfig& config);

    /**
     * @brief All validation errors, each naming the offending key
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

private:
    static EngineConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static PagingConfig extract_paging(const toml::table& root);
    static std::vector<EntityType> extract_entities(const toml::table& root);
    static std::vector<AssociationDescriptor> extract_associations(const toml::table& root);

    static LoadResult validate_and_return(EngineConfig config);
};

} // namespace sqlpager
