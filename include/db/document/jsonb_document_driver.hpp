#pragma once

#include "db/document/idocument_driver.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace polystore {

/**
 * @brief Document collections stored as PostgreSQL JSONB tables
 *
 * Each collection is a table (id TEXT PRIMARY KEY, doc JSONB NOT NULL).
 * Each filter key becomes `doc #> $path::text[] = $v::jsonb` (whole-value
 * equality, the same rule the in-memory driver applies; dotted keys nest),
 * updates merge with `doc || $1::jsonb`, sorting uses `doc #> path`.
 * Pipelines fold a leading $match into SQL and run the rest in-process.
 */
class JsonbDocumentDriver : public IDocumentDriver {
public:
    JsonbDocumentDriver(std::shared_ptr<IConnectionPool> pool,
                        std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds{5000});

    std::string driver_name() const override { return "jsonb"; }

    Status ping() override;
    Status ensure_collection(const std::string& collection) override;
    Result<DocumentResult> run(const DocumentOperation& op) override;
    void close() override;

    /// One equality term per key, appending its parameters; "TRUE" for no keys
    [[nodiscard]] static std::string filter_clause(const JsonValue& filter,
                                                   std::vector<SqlParam>& params);

    /// "doc #> '{a,b}'" for a validated dotted field
    [[nodiscard]] static std::string path_expression(const std::string& field);

private:
    Result<DbResultSet> query(const std::string& sql, const std::vector<SqlParam>& params);

    static Result<std::vector<JsonValue>> documents(const DbResultSet& rs);

    std::shared_ptr<IConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_;
    std::atomic<bool> closed_{false};
};

} // namespace polystore
