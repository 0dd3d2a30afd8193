#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace polystore {

/**
 * @brief Extract typed EngineConfig from TOML
 *
 * Supports `${VAR}` environment expansion in every string value and
 * `include = ["base.toml"]` directives (file loads only; the including
 * file wins on conflicting scalars, arrays of tables are concatenated).
 */
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

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Collect every validation error instead of stopping at the first
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

    /**
     * @brief Connection string for a relational provider, built from parts
     * when no explicit connection_string is configured
     *
     * PostgreSQL gets libpq keyword form with connect_timeout in seconds,
     * MySQL gets the mysql:// URI form understood by MysqlConnectionFactory.
     */
    [[nodiscard]] static std::string build_connection_string(const ProviderConfig& cfg);

private:
    static EngineConfig extract_all_sections(const toml::table& root);
    static EngineSettings extract_engine(const toml::table& root);
    static std::vector<ProviderConfig> extract_providers(const toml::table& root);
    static CacheConfig extract_cache(const toml::table& root);
    static RealtimeConfig extract_realtime(const toml::table& root);
    static ApiConfig extract_api(const toml::table& root);
    static MigrationsConfig extract_migrations(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);

    static LoadResult validate_and_return(EngineConfig config);
};

} // namespace polystore
