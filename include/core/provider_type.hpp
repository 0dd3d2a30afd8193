#pragma once

#include <algorithm>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace polystore {

namespace keys {
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view DOCUMENT = "document";
    inline constexpr std::string_view MONGODB = "mongodb";
    inline constexpr std::string_view WIDE_COLUMN = "wide_column";
    inline constexpr std::string_view DYNAMODB = "dynamodb";
    inline constexpr std::string_view MANAGED_DOCUMENT = "managed_document";
    inline constexpr std::string_view COSMOSDB = "cosmosdb";
    inline constexpr std::string_view GRAPH_DOCUMENT = "graph_document";
    inline constexpr std::string_view FIRESTORE = "firestore";
}

/**
 * @brief Concrete backing store technology selected by configuration
 */
enum class ProviderKind {
    POSTGRESQL,         // relational-a
    MYSQL,              // relational-b
    DOCUMENT,
    WIDE_COLUMN,
    MANAGED_DOCUMENT,
    GRAPH_DOCUMENT,
};

/// Query model a provider speaks
enum class ProviderFamily {
    RELATIONAL,
    DOCUMENT,
};

/**
 * @brief Static capability flags per provider kind
 */
struct ProviderCapabilities {
    bool transactions = false;
    bool returning = false;          // native RETURNING clause
    bool joins = false;
    bool positional_placeholders = false;  // '?' instead of '$n'
};

[[nodiscard]] inline std::string_view provider_kind_to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::POSTGRESQL: return keys::POSTGRESQL;
        case ProviderKind::MYSQL: return keys::MYSQL;
        case ProviderKind::DOCUMENT: return keys::DOCUMENT;
        case ProviderKind::WIDE_COLUMN: return keys::WIDE_COLUMN;
        case ProviderKind::MANAGED_DOCUMENT: return keys::MANAGED_DOCUMENT;
        case ProviderKind::GRAPH_DOCUMENT: return keys::GRAPH_DOCUMENT;
        default: return "unknown";
    }
}

[[nodiscard]] inline ProviderFamily provider_family(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::POSTGRESQL:
        case ProviderKind::MYSQL:
            return ProviderFamily::RELATIONAL;
        default:
            return ProviderFamily::DOCUMENT;
    }
}

[[nodiscard]] inline ProviderCapabilities provider_capabilities(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::POSTGRESQL:
            return {.transactions = true, .returning = true, .joins = true,
                    .positional_placeholders = false};
        case ProviderKind::MYSQL:
            return {.transactions = true, .returning = false, .joins = true,
                    .positional_placeholders = true};
        default:
            return {};
    }
}

[[nodiscard]] inline ProviderKind parse_provider_kind(std::string_view kind_str) {
    static const std::unordered_map<std::string_view, ProviderKind> lookup = {
        {keys::POSTGRESQL,       ProviderKind::POSTGRESQL},
        {keys::POSTGRES,         ProviderKind::POSTGRESQL},
        {keys::PG,               ProviderKind::POSTGRESQL},
        {keys::MYSQL,            ProviderKind::MYSQL},
        {keys::MARIADB,          ProviderKind::MYSQL},
        {keys::DOCUMENT,         ProviderKind::DOCUMENT},
        {keys::MONGODB,          ProviderKind::DOCUMENT},
        {keys::WIDE_COLUMN,      ProviderKind::WIDE_COLUMN},
        {keys::DYNAMODB,         ProviderKind::WIDE_COLUMN},
        {keys::MANAGED_DOCUMENT, ProviderKind::MANAGED_DOCUMENT},
        {keys::COSMOSDB,         ProviderKind::MANAGED_DOCUMENT},
        {keys::GRAPH_DOCUMENT,   ProviderKind::GRAPH_DOCUMENT},
        {keys::FIRESTORE,        ProviderKind::GRAPH_DOCUMENT},
    };

    if (const auto it = lookup.find(kind_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only taken when the exact lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == kind_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), kind_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    throw std::runtime_error(std::format("Unknown provider type: {}", kind_str));
}

} // namespace polystore
