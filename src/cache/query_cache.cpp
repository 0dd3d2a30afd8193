#include "cache/query_cache.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace polystore {

// ============================================================================
// QueryCache
// ============================================================================

QueryCache::QueryCache(const Config& config)
    : config_(config) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

std::string QueryCache::make_key(const std::string& provider, const QueryDescriptor& desc) {
    return std::format("{}|{}", provider, desc.to_json().dump());
}

size_t QueryCache::select_shard(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

std::optional<QueryOutput> QueryCache::get(const std::string& provider,
                                           const QueryDescriptor& desc) {
    const auto key = make_key(provider, desc);
    auto& shard = *shards_[select_shard(key)];
    auto result = shard.get(key);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        result->from_cache = true;
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void QueryCache::put(const std::string& provider, const QueryDescriptor& desc,
                     const QueryOutput& output) {
    std::vector<std::string> collections{desc.collection};
    for (const auto& join : desc.joins) collections.push_back(join.table);

    const auto key = make_key(provider, desc);
    const auto expires = std::chrono::steady_clock::now() + config_.ttl;
    auto& shard = *shards_[select_shard(key)];
    shard.put(key, provider, std::move(collections), output, expires);
}

void QueryCache::invalidate(const std::string& provider) {
    for (auto& shard : shards_) {
        shard->invalidate(provider);
    }
    invalidations_.fetch_add(1, std::memory_order_relaxed);
}

void QueryCache::invalidate_collection(const std::string& provider, const std::string& collection) {
    for (auto& shard : shards_) {
        shard->invalidate_collection(provider, collection);
    }
    invalidations_.fetch_add(1, std::memory_order_relaxed);
}

void QueryCache::clear() {
    for (auto& shard : shards_) {
        shard->clear();
    }
}

QueryCache::Stats QueryCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .invalidations = invalidations_.load(std::memory_order_relaxed),
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<QueryOutput> QueryCache::Shard::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    auto& entry = *it->second;

    // Stale if the provider was invalidated after insertion
    auto gen_it = generations_.find(entry.provider);
    if (gen_it != generations_.end() && entry.generation < gen_it->second) {
        lru_list_.erase(it->second);
        map_.erase(it);
        return std::nullopt;
    }

    if (std::chrono::steady_clock::now() >= entry.expires_at) {
        lru_list_.erase(it->second);
        map_.erase(it);
        return std::nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return entry.output;
}

void QueryCache::Shard::put(
    const std::string& key, const std::string& provider,
    std::vector<std::string> collections, QueryOutput output,
    std::chrono::steady_clock::time_point expires_at) {
    std::lock_guard lock(mutex_);

    uint64_t gen = 0;
    if (const auto gen_it = generations_.find(provider); gen_it != generations_.end()) {
        gen = gen_it->second;
    }

    // Last write wins
    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->collections = std::move(collections);
        it->second->output = std::move(output);
        it->second->expires_at = expires_at;
        it->second->generation = gen;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        auto& back = lru_list_.back();
        map_.erase(back.key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, provider, std::move(collections),
                                       std::move(output), expires_at, gen});
    map_[key] = lru_list_.begin();
}

void QueryCache::Shard::invalidate(const std::string& provider) {
    std::lock_guard lock(mutex_);
    // O(1) generation bump; stale entries are evicted lazily on get()
    generations_[provider]++;
}

size_t QueryCache::Shard::invalidate_collection(const std::string& provider,
                                                const std::string& collection) {
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = lru_list_.begin(); it != lru_list_.end(); ) {
        const bool hit = it->provider == provider &&
            std::find(it->collections.begin(), it->collections.end(), collection) !=
                it->collections.end();
        if (hit) {
            map_.erase(it->key);
            it = lru_list_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void QueryCache::Shard::clear() {
    std::lock_guard lock(mutex_);
    map_.clear();
    lru_list_.clear();
    generations_.clear();
}

size_t QueryCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace polystore
