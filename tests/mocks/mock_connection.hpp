#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace polystore::testing {

struct RecordedStatement {
    std::string sql;
    std::vector<SqlParam> params;
};

/**
 * @brief Scripted database shared by every MockConnection a factory creates
 *
 * Records each statement and answers through `responder`; the default
 * answer is an empty successful result.
 */
class MockDatabase {
public:
    using Responder = std::function<DbResultSet(const RecordedStatement&)>;

    DbResultSet answer(const std::string& sql, const std::vector<SqlParam>& params) {
        RecordedStatement stmt{sql, params};
        Responder responder;
        {
            std::lock_guard lock(mutex_);
            log_.push_back(stmt);
            responder = responder_;
        }
        if (responder) return responder(stmt);
        DbResultSet rs;
        rs.success = true;
        return rs;
    }

    void set_responder(Responder responder) {
        std::lock_guard lock(mutex_);
        responder_ = std::move(responder);
    }

    [[nodiscard]] std::vector<RecordedStatement> statements() const {
        std::lock_guard lock(mutex_);
        return log_;
    }

    [[nodiscard]] size_t statement_count() const {
        std::lock_guard lock(mutex_);
        return log_.size();
    }

    void clear() {
        std::lock_guard lock(mutex_);
        log_.clear();
    }

    std::atomic<bool> healthy{true};

private:
    mutable std::mutex mutex_;
    std::vector<RecordedStatement> log_;
    Responder responder_;
};

class MockConnection : public IDbConnection {
public:
    explicit MockConnection(std::shared_ptr<MockDatabase> db) : db_(std::move(db)) {}

    DbResultSet execute(const std::string& sql) override { return db_->answer(sql, {}); }

    DbResultSet execute_params(const std::string& sql, const std::vector<SqlParam>& params) override {
        return db_->answer(sql, params);
    }

    bool is_healthy(const std::string&) override { return db_->healthy.load(); }
    bool is_connected() const override { return connected_; }
    bool set_query_timeout(uint32_t) override { return true; }
    void close() override { connected_ = false; }

private:
    std::shared_ptr<MockDatabase> db_;
    bool connected_ = true;
};

class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>())
        : db_(std::move(db)) {}

    std::unique_ptr<IDbConnection> create(const std::string&) override {
        created_.fetch_add(1, std::memory_order_relaxed);
        if (!should_succeed) return nullptr;
        return std::make_unique<MockConnection>(db_);
    }

    std::string last_error() const override {
        return should_succeed ? std::string{} : "mock refused the connection";
    }

    [[nodiscard]] const std::shared_ptr<MockDatabase>& database() const { return db_; }
    [[nodiscard]] uint64_t created() const { return created_.load(); }

    bool should_succeed = true;

private:
    std::shared_ptr<MockDatabase> db_;
    std::atomic<uint64_t> created_{0};
};

/// Result set with text columns, as a relational driver hands them back
inline DbResultSet rows_result(std::vector<std::string> columns,
                               std::vector<std::vector<std::optional<std::string>>> rows) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;
    rs.column_names = std::move(columns);
    rs.rows = std::move(rows);
    rs.affected_rows = rs.rows.size();
    return rs;
}

} // namespace polystore::testing
