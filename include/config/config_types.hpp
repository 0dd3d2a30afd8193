#pragma once

#include "core/provider_type.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace polystore {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;
    bool enabled = true;

    ServerConfig()
        : host("0.0.0.0"),
          port(3000),
          thread_pool_size(4) {}
};

/**
 * @brief Connection configuration for one provider
 *
 * Either connection_string or the host/port/database/user/password parts
 * describe the target; a non-empty connection_string wins.
 */
struct ProviderConfig {
    std::string name;                     // routing key, defaults to the kind string
    ProviderKind kind = ProviderKind::POSTGRESQL;
    std::string host;
    uint16_t port = 0;                    // 0 = provider default
    std::string database;
    std::string user;
    std::string password;
    std::string connection_string;
    size_t min_connections;
    size_t max_connections;
    std::chrono::milliseconds connection_timeout;
    std::chrono::milliseconds idle_timeout;
    std::chrono::milliseconds query_timeout;
    std::chrono::milliseconds pool_acquire_timeout;
    bool tls = false;
    std::string driver;                   // document family: "memory" or "jsonb"

    ProviderConfig()
        : host("localhost"),
          min_connections(1),
          max_connections(10),
          connection_timeout(5000),
          idle_timeout(300000),
          query_timeout(0),
          pool_acquire_timeout(5000),
          driver("memory") {}
};

struct CacheConfig {
    bool enabled = true;
    std::chrono::milliseconds ttl{300000};
    size_t max_entries = 10000;
    size_t num_shards = 16;
    bool invalidate_on_write = false;
};

struct RealtimeConfig {
    bool enabled = true;
    std::string host = "0.0.0.0";
    uint16_t port = 3001;
    size_t max_queue = 0;                 // per-subscriber queue limit, 0 = unbounded
    size_t max_connections = 1000;
};

struct ApiConfig {
    std::string base_path = "/api";
    bool rest_enabled = true;
    bool graphql_enabled = true;
    int default_limit = 10;
    int max_limit = 1000;
};

struct MigrationsConfig {
    std::string ledger = "store";         // "store" or "memory"
    std::string table = "_migrations";
    std::string provider;                 // target provider, empty = default provider
};

struct LoggingConfig {
    std::string level = "info";
};

struct EngineSettings {
    std::string default_provider;         // empty = first available
    std::string schema_file;              // JSON entity list exposed at startup
};

/**
 * @brief Complete parsed configuration
 */
struct EngineConfig {
    EngineSettings engine;
    std::vector<ProviderConfig> providers;
    CacheConfig cache;
    RealtimeConfig realtime;
    ApiConfig api;
    MigrationsConfig migrations;
    LoggingConfig logging;
    ServerConfig server;
};

} // namespace polystore
