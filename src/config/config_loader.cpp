#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace polystore {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables.
 * Unset variables expand to the empty string.
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
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

/**
 * @brief Deep-merge two tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (const auto* arr = inc_node.as_array()) {
        for (const auto& item : *arr) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            }
        }
    }
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel_path : paths) {
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        resolve_includes(included, fs::path(abs_path).parent_path().string(),
                         visited, depth + 1);

        // included is the base, the including file is the overlay
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path().string(), visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

std::chrono::milliseconds toml_millis(const toml::table& tbl, std::string_view key,
                                      std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(tbl[key].value_or(static_cast<int64_t>(fallback.count())));
}

/// libpq keyword values with spaces or quotes must be single-quoted
std::string pg_keyword_value(const std::string& value) {
    if (!value.empty() && value.find_first_of(" '\\") == std::string::npos) {
        return value;
    }
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

} // anonymous namespace

// ============================================================================
// Section extraction
// ============================================================================

EngineSettings ConfigLoader::extract_engine(const toml::table& root) {
    EngineSettings cfg;
    if (const auto* e = root["engine"].as_table()) {
        cfg.default_provider = (*e)["default_provider"].value_or(""s);
        cfg.schema_file = (*e)["schema_file"].value_or(""s);
    }
    return cfg;
}

std::vector<ProviderConfig> ConfigLoader::extract_providers(const toml::table& root) {
    std::vector<ProviderConfig> result;
    const auto* arr = root["providers"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* p = elem.as_table();
        if (!p) continue;

        ProviderConfig cfg;
        cfg.kind = parse_provider_kind((*p)["type"].value_or("postgresql"s));
        cfg.name = (*p)["name"].value_or(std::string(provider_kind_to_string(cfg.kind)));
        cfg.host = (*p)["host"].value_or(cfg.host);
        cfg.port = static_cast<uint16_t>((*p)["port"].value_or(0));
        cfg.database = (*p)["database"].value_or(""s);
        cfg.user = (*p)["user"].value_or(""s);
        cfg.password = (*p)["password"].value_or(""s);
        cfg.connection_string = (*p)["connection_string"].value_or(""s);
        cfg.min_connections = static_cast<size_t>((*p)["min_connections"].value_or(1));
        cfg.max_connections = static_cast<size_t>((*p)["max_connections"].value_or(10));
        cfg.connection_timeout = toml_millis(*p, "connection_timeout_ms", cfg.connection_timeout);
        cfg.idle_timeout = toml_millis(*p, "idle_timeout_ms", cfg.idle_timeout);
        cfg.query_timeout = toml_millis(*p, "query_timeout_ms", cfg.query_timeout);
        cfg.pool_acquire_timeout = toml_millis(*p, "pool_acquire_timeout_ms",
                                               cfg.pool_acquire_timeout);
        cfg.tls = (*p)["tls"].value_or(false);
        cfg.driver = utils::to_lower((*p)["driver"].value_or(cfg.driver));

        result.emplace_back(std::move(cfg));
    }
    return result;
}

CacheConfig ConfigLoader::extract_cache(const toml::table& root) {
    CacheConfig cfg;
    if (const auto* c = root["cache"].as_table()) {
        cfg.enabled = (*c)["enabled"].value_or(cfg.enabled);
        cfg.ttl = toml_millis(*c, "ttl_ms", cfg.ttl);
        cfg.max_entries = static_cast<size_t>(
            (*c)["max_entries"].value_or(static_cast<int64_t>(cfg.max_entries)));
        cfg.num_shards = static_cast<size_t>(
            (*c)["num_shards"].value_or(static_cast<int64_t>(cfg.num_shards)));
        cfg.invalidate_on_write = (*c)["invalidate_on_write"].value_or(cfg.invalidate_on_write);
    }
    return cfg;
}

RealtimeConfig ConfigLoader::extract_realtime(const toml::table& root) {
    RealtimeConfig cfg;
    if (const auto* r = root["realtime"].as_table()) {
        cfg.enabled = (*r)["enabled"].value_or(cfg.enabled);
        cfg.host = (*r)["host"].value_or(cfg.host);
        cfg.port = static_cast<uint16_t>((*r)["port"].value_or(static_cast<int>(cfg.port)));
        cfg.max_queue = static_cast<size_t>((*r)["max_queue"].value_or(0));
        cfg.max_connections = static_cast<size_t>(
            (*r)["max_connections"].value_or(static_cast<int64_t>(cfg.max_connections)));
    }
    return cfg;
}

ApiConfig ConfigLoader::extract_api(const toml::table& root) {
    ApiConfig cfg;
    if (const auto* a = root["api"].as_table()) {
        cfg.base_path = (*a)["base_path"].value_or(cfg.base_path);
        cfg.rest_enabled = (*a)["rest"].value_or(cfg.rest_enabled);
        cfg.graphql_enabled = (*a)["graphql"].value_or(cfg.graphql_enabled);
        cfg.default_limit = (*a)["default_limit"].value_or(cfg.default_limit);
        cfg.max_limit = (*a)["max_limit"].value_or(cfg.max_limit);
    }
    return cfg;
}

MigrationsConfig ConfigLoader::extract_migrations(const toml::table& root) {
    MigrationsConfig cfg;
    if (const auto* m = root["migrations"].as_table()) {
        cfg.ledger = utils::to_lower((*m)["ledger"].value_or(cfg.ledger));
        cfg.table = (*m)["table"].value_or(cfg.table);
        cfg.provider = (*m)["provider"].value_or(""s);
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        cfg.level = (*l)["level"].value_or(cfg.level);
    }
    return cfg;
}

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    if (const auto* s = root["server"].as_table()) {
        cfg.enabled = (*s)["enabled"].value_or(cfg.enabled);
        cfg.host = (*s)["host"].value_or(cfg.host);
        cfg.port = static_cast<uint16_t>((*s)["port"].value_or(static_cast<int>(cfg.port)));
        cfg.thread_pool_size = static_cast<size_t>(
            (*s)["threads"].value_or(static_cast<int64_t>(cfg.thread_pool_size)));
    }
    return cfg;
}

EngineConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    EngineConfig config;
    config.engine = extract_engine(tbl);
    config.providers = extract_providers(tbl);
    config.cache = extract_cache(tbl);
    config.realtime = extract_realtime(tbl);
    config.api = extract_api(tbl);
    config.migrations = extract_migrations(tbl);
    config.logging = extract_logging(tbl);
    config.server = extract_server(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
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

std::string ConfigLoader::build_connection_string(const ProviderConfig& cfg) {
    if (!cfg.connection_string.empty()) {
        return cfg.connection_string;
    }

    const auto timeout_s = std::max<int64_t>(1,
        std::chrono::duration_cast<std::chrono::seconds>(cfg.connection_timeout).count());

    if (cfg.kind == ProviderKind::MYSQL) {
        std::string uri = "mysql://";
        if (!cfg.user.empty()) {
            uri += cfg.user;
            if (!cfg.password.empty()) uri += ":" + cfg.password;
            uri += "@";
        }
        uri += std::format("{}:{}/{}?connect_timeout={}", cfg.host,
            cfg.port ? cfg.port : 3306, cfg.database, timeout_s);
        if (cfg.tls) uri += "&ssl=true";
        return uri;
    }

    // PostgreSQL server, also used by the jsonb document driver
    std::string conn = std::format("host={} port={} connect_timeout={}",
        pg_keyword_value(cfg.host), cfg.port ? cfg.port : 5432, timeout_s);
    if (!cfg.database.empty()) conn += " dbname=" + pg_keyword_value(cfg.database);
    if (!cfg.user.empty()) conn += " user=" + pg_keyword_value(cfg.user);
    if (!cfg.password.empty()) conn += " password=" + pg_keyword_value(cfg.password);
    conn += cfg.tls ? " sslmode=require" : " sslmode=prefer";
    return conn;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    if (config.server.enabled && !utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    if (config.providers.empty()) {
        errors.push_back("at least one [[providers]] entry is required");
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < config.providers.size(); ++i) {
        const auto& p = config.providers[i];
        if (p.name.empty()) {
            errors.push_back(std::format("providers[{}].name must not be empty", i));
        } else if (!names.insert(p.name).second) {
            errors.push_back(std::format("providers[{}].name '{}' is duplicated", i, p.name));
        }
        if (p.min_connections > p.max_connections) {
            errors.push_back(std::format(
                "providers[{}].min_connections ({}) > max_connections ({})",
                i, p.min_connections, p.max_connections));
        }
        if (p.max_connections == 0) {
            errors.push_back(std::format("providers[{}].max_connections must be > 0", i));
        }
        if (provider_family(p.kind) == ProviderFamily::DOCUMENT &&
            p.driver != "memory" && p.driver != "jsonb") {
            errors.push_back(std::format(
                "providers[{}].driver must be 'memory' or 'jsonb', got '{}'", i, p.driver));
        }
    }

    if (!config.engine.default_provider.empty() &&
        !names.contains(config.engine.default_provider)) {
        errors.push_back(std::format("engine.default_provider '{}' is not a configured provider",
            config.engine.default_provider));
    }

    if (config.cache.enabled) {
        if (config.cache.ttl.count() <= 0) {
            errors.push_back("cache.ttl_ms must be > 0");
        }
        if (config.cache.num_shards == 0) {
            errors.push_back("cache.num_shards must be > 0");
        }
    }

    if (config.realtime.enabled && !utils::in_range<1, 65535>(config.realtime.port)) {
        errors.push_back(std::format("realtime.port must be 1-65535, got {}",
            config.realtime.port));
    }

    if (config.api.default_limit < 1 || config.api.default_limit > config.api.max_limit) {
        errors.push_back(std::format("api.default_limit must be 1-{}, got {}",
            config.api.max_limit, config.api.default_limit));
    }

    if (config.migrations.ledger != "store" && config.migrations.ledger != "memory") {
        errors.push_back(std::format("migrations.ledger must be 'store' or 'memory', got '{}'",
            config.migrations.ledger));
    }
    if (!config.migrations.provider.empty() && !names.contains(config.migrations.provider)) {
        errors.push_back(std::format("migrations.provider '{}' is not a configured provider",
            config.migrations.provider));
    }

    return errors;
}

} // namespace polystore
