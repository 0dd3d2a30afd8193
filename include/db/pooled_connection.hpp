#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace polystore {

/**
 * @brief RAII loan of a pooled database connection
 *
 * Operations borrow the connection; the pool keeps ownership and gets it
 * back on destruction. A loan marked broken is closed by the pool instead
 * of being put back on the idle list. Move-only.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /// Do not recycle this connection when the loan ends
    void mark_broken() { broken_ = true; }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace polystore
