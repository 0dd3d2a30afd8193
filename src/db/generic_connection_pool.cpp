#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace polystore {

GenericConnectionPool::GenericConnectionPool(
    std::string provider_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : provider_name_(std::move(provider_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Pool '{}': failed to pre-warm connection {}",
                provider_name_, i + 1));
            break;
        }
        const auto now = Clock::now();
        std::lock_guard lock(mutex_);
        created_at_[conn.get()] = now;
        last_used_[conn.get()] = now;
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("Pool '{}' initialized: {} connections (min={}, max={})",
        provider_name_, total_connections_.load(), config_.min_connections,
        config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    const utils::Timer timer;

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // shutdown may have been set while we waited on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point birth{};
    Clock::time_point last_used{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            birth = created_at_[conn.get()];
            last_used = last_used_[conn.get()];
        }
    }

    const auto now = Clock::now();
    if (conn) {
        const bool expired = config_.max_lifetime.count() > 0 &&
                             now - birth > config_.max_lifetime;
        if (expired) {
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            retire(std::move(conn));
        } else if (now - last_used > config_.idle_timeout &&
                   !conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            retire(std::move(conn));
        }
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        std::lock_guard lock(mutex_);
        created_at_[conn.get()] = now;
        last_used_[conn.get()] = now;
    }

    acquire_time_sum_us_.fetch_add(
        static_cast<uint64_t>(timer.elapsed_us().count()), std::memory_order_relaxed);
    acquire_time_count_.fetch_add(1, std::memory_order_relaxed);

    return std::make_unique<PooledConnection>(std::move(conn),
        [this](std::unique_ptr<IDbConnection> c, bool reusable) {
            this->return_connection(std::move(c), reusable);
        });
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections > stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.acquire_time_sum_us = acquire_time_sum_us_.load(std::memory_order_relaxed);
    stats.acquire_time_count = acquire_time_count_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        if (conn) {
            created_at_.erase(conn.get());
            last_used_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();

    utils::log::info(std::format("Pool '{}' drained", provider_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) {
        if (config_.query_timeout_ms > 0) {
            conn->set_query_timeout(config_.query_timeout_ms);
        }
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    }
    return conn;
}

void GenericConnectionPool::retire(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!reusable || shutdown_.load(std::memory_order_acquire)) {
        retire(std::move(conn));
    } else {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = Clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace polystore
