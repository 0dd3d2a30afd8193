#pragma once

#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace polystore {

/**
 * @brief Provider-agnostic connection pool
 *
 * - Bounded: max_connections enforced via counting_semaphore (C++20)
 * - Lazy: connections created on demand up to max, min pre-warmed
 * - Health checking: connections idle longer than idle_timeout are probed
 *   before being handed out
 * - Lifetime: connections older than max_lifetime are recycled
 * - RAII: PooledConnection returns itself on destruction
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(
        std::string provider_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return provider_name_; }

    [[nodiscard]] const PoolConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    std::unique_ptr<IDbConnection> create_connection();

    /// Close a connection that will not go back to the idle list
    void retire(std::unique_ptr<IDbConnection> conn);

    /// Called by PooledConnection when a loan ends
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    std::string provider_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, Clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, Clock::time_point> last_used_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<uint64_t> acquire_time_sum_us_{0};
    std::atomic<uint64_t> acquire_time_count_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace polystore
