#pragma once

#include "cache/query_cache.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "db/iexecutor.hpp"
#include "query/query_descriptor.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace polystore {

/**
 * @brief Immutable fluent builder over a QueryDescriptor
 *
 * Every method is const and returns a new builder, so a partially built
 * query can be shared and extended by concurrent callers. Invalid input is
 * recorded and reported by execute(), keeping chains unbroken.
 *
 *   engine.query("main").select({"id", "name"}).from("users")
 *         .where("active", true).order_by("name").limit(10).execute();
 */
class QueryBuilder {
public:
    /// Builder without a provider; execute() fails with NO_CONNECTION
    QueryBuilder() = default;

    explicit QueryBuilder(std::shared_ptr<IExecutor> executor,
                          std::shared_ptr<QueryCache> cache = nullptr);

    /// Builder bound to a provider that is not available
    [[nodiscard]] static QueryBuilder unavailable(std::string reason);

    // ---- reads ----
    [[nodiscard]] QueryBuilder select(std::vector<std::string> columns = {}) const;
    [[nodiscard]] QueryBuilder from(std::string table) const;
    [[nodiscard]] QueryBuilder join(std::string table, std::string left, std::string right) const;
    [[nodiscard]] QueryBuilder left_join(std::string table, std::string left, std::string right) const;
    [[nodiscard]] QueryBuilder order_by(std::string column, std::string direction = "ASC") const;
    [[nodiscard]] QueryBuilder group_by(std::vector<std::string> columns) const;
    [[nodiscard]] QueryBuilder having(const JsonValue& predicates) const;
    [[nodiscard]] QueryBuilder limit(int64_t n) const;
    [[nodiscard]] QueryBuilder offset(int64_t n) const;
    [[nodiscard]] QueryBuilder aggregate(JsonValue pipeline) const;

    // ---- predicates (merged; a repeated key replaces the earlier value) ----
    [[nodiscard]] QueryBuilder where(const JsonValue& predicates) const;
    [[nodiscard]] QueryBuilder where(std::string key, JsonValue value) const;

    // ---- writes ----
    [[nodiscard]] QueryBuilder insert(JsonValue data) const;
    [[nodiscard]] QueryBuilder into(std::string table) const;
    [[nodiscard]] QueryBuilder insert_into(std::string table, JsonValue data) const;
    [[nodiscard]] QueryBuilder update(JsonValue data) const;
    [[nodiscard]] QueryBuilder table(std::string name) const;
    [[nodiscard]] QueryBuilder remove() const;
    [[nodiscard]] QueryBuilder returning(std::vector<std::string> columns = {"*"}) const;

    // ---- modifiers ----
    [[nodiscard]] QueryBuilder first() const;
    [[nodiscard]] QueryBuilder cached(bool enabled = true) const;

    [[nodiscard]] const QueryDescriptor& descriptor() const { return desc_; }

    /**
     * @brief Run through the bound executor, consulting the cache for
     * opted-in reads
     */
    [[nodiscard]] Result<QueryOutput> execute() const;

    /// execute() on a separate thread
    [[nodiscard]] std::future<Result<QueryOutput>> execute_async() const;

private:
    QueryBuilder with_error(ErrorCategory category, std::string message) const;

    std::shared_ptr<IExecutor> executor_;
    std::shared_ptr<QueryCache> cache_;
    std::string unavailable_reason_;
    QueryDescriptor desc_;
};

} // namespace polystore
