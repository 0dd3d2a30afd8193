#pragma once

#include "core/types.hpp"
#include "query/query_descriptor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace polystore {

/**
 * @brief Read-through TTL cache for opted-in SELECT results
 *
 * Key = provider name + the descriptor's deterministic JSON form, so equal
 * reads against the same provider share an entry. Entries expire lazily on
 * lookup; each shard is LRU-bounded. Writes do not purge entries unless the
 * caller invalidates explicitly.
 */
class QueryCache {
public:
    struct Config {
        bool enabled = true;
        size_t max_entries = 10000;
        size_t num_shards = 16;
        std::chrono::milliseconds ttl{300000};
    };

    explicit QueryCache(const Config& config);

    [[nodiscard]] static std::string make_key(const std::string& provider,
                                              const QueryDescriptor& desc);

    /// Lookup cached result. Returns nullopt on miss or expiry.
    [[nodiscard]] std::optional<QueryOutput> get(const std::string& provider,
                                                 const QueryDescriptor& desc);

    void put(const std::string& provider, const QueryDescriptor& desc, const QueryOutput& output);

    /// Invalidate all entries of a provider
    void invalidate(const std::string& provider);

    /// Invalidate entries that read from a collection (directly or via join)
    void invalidate_collection(const std::string& provider, const std::string& collection);

    void clear();

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }
    [[nodiscard]] std::chrono::milliseconds ttl() const { return config_.ttl; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t invalidations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        std::string provider;                   // For provider-level invalidation
        std::vector<std::string> collections;   // For collection-level invalidation
        QueryOutput output;
        std::chrono::steady_clock::time_point expires_at;
        uint64_t generation = 0;                // Provider generation at insert time
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<QueryOutput> get(const std::string& key);
        void put(const std::string& key, const std::string& provider,
                 std::vector<std::string> collections, QueryOutput output,
                 std::chrono::steady_clock::time_point expires_at);
        void invalidate(const std::string& provider);
        size_t invalidate_collection(const std::string& provider, const std::string& collection);
        void clear();
        size_t size() const;

        std::atomic<uint64_t> evictions{0};

    private:
        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;
        std::unordered_map<std::string, uint64_t> generations_;
    };

    size_t select_shard(const std::string& key) const;

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> invalidations_{0};
};

} // namespace polystore
