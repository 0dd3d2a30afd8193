#include <catch2/catch_test_macros.hpp>
#include "cache/query_cache.hpp"
#include "query/query_builder.hpp"
#include "mocks/mock_executor.hpp"

#include <thread>

using namespace polystore;
using polystore::testing::MockExecutor;

namespace {

std::shared_ptr<MockExecutor> executor_with_rows(size_t n) {
    auto exec = std::make_shared<MockExecutor>("main");
    for (size_t i = 0; i < n; ++i) {
        JsonValue row = JsonValue::object();
        row.set("id", static_cast<long long>(i + 1));
        exec->rows.push_back(std::move(row));
    }
    return exec;
}

std::shared_ptr<QueryCache> make_cache(std::chrono::milliseconds ttl) {
    QueryCache::Config cfg;
    cfg.ttl = ttl;
    cfg.num_shards = 4;
    return std::make_shared<QueryCache>(cfg);
}

} // namespace

TEST_CASE("QueryBuilder: every call returns a new builder", "[builder]") {
    const auto base = QueryBuilder().select().from("users");
    const auto admins = base.where("role", "admin");
    const auto guests = base.where("role", "guest").limit(5);

    CHECK(base.descriptor().predicates.empty());
    REQUIRE(admins.descriptor().predicates.size() == 1);
    CHECK(admins.descriptor().predicates[0].second.get<std::string>() == "admin");
    CHECK_FALSE(admins.descriptor().limit.has_value());
    CHECK(guests.descriptor().predicates[0].second.get<std::string>() == "guest");
    CHECK(guests.descriptor().limit == 5);
}

TEST_CASE("QueryBuilder: where merges and replaces repeated keys", "[builder]") {
    JsonValue more = JsonValue::object();
    more.set("role", "owner");
    more.set("org", 3);
    const auto q = QueryBuilder().select().from("users").where("role", "admin").where(more);

    const auto& preds = q.descriptor().predicates;
    REQUIRE(preds.size() == 2);
    CHECK(preds[0].first == "role");
    CHECK(preds[0].second.get<std::string>() == "owner");
    CHECK(preds[1].first == "org");
}

TEST_CASE("QueryBuilder: builder errors surface at execute", "[builder]") {
    auto exec = executor_with_rows(1);

    SECTION("empty predicate key") {
        auto result = QueryBuilder(exec).select().from("users").where("", 1).execute();
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    SECTION("bad order direction") {
        auto result = QueryBuilder(exec).select().from("users").order_by("name", "sideways").execute();
        CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    SECTION("operation kind never set") {
        auto result = QueryBuilder(exec).from("users").execute();
        CHECK(result.error_category() == ErrorCategory::UNSUPPORTED_OPERATION);
    }

    CHECK(exec->execute_count() == 0);
}

TEST_CASE("QueryBuilder: unavailable provider yields NoConnection", "[builder]") {
    auto result = QueryBuilder::unavailable("provider 'ghost' is not available")
        .select().from("users").execute();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::NO_CONNECTION);
    CHECK(result.error_message().find("ghost") != std::string::npos);

    CHECK(QueryBuilder().select().from("users").execute().error_category() ==
          ErrorCategory::NO_CONNECTION);
}

TEST_CASE("QueryBuilder: first() yields at most one record", "[builder]") {
    auto exec = executor_with_rows(3);

    auto many = QueryBuilder(exec).select().from("users").execute();
    REQUIRE(many.is_ok());
    CHECK(many.value().rows.size() == 3);

    auto one = QueryBuilder(exec).select().from("users").first().execute();
    REQUIRE(one.is_ok());
    CHECK(one.value().rows.size() <= 1);
    CHECK(one.value().record()["id"].get<int>() == 1);
    CHECK(one.value().to_json().is_object());

    auto none = QueryBuilder(executor_with_rows(0)).select().from("users").first().execute();
    REQUIRE(none.is_ok());
    CHECK(none.value().record().is_null());
    CHECK(none.value().to_json().is_null());
}

TEST_CASE("QueryBuilder: execute_async delivers the same result", "[builder]") {
    auto exec = executor_with_rows(2);
    auto future = QueryBuilder(exec).select().from("users").execute_async();
    auto result = future.get();
    REQUIRE(result.is_ok());
    CHECK(result.value().rows.size() == 2);
    CHECK(exec->execute_count() == 1);
}

// ============================================================================
// Read-through cache
// ============================================================================

TEST_CASE("QueryBuilder: cached read hits within TTL and misses after", "[builder][cache]") {
    auto exec = executor_with_rows(2);
    auto cache = make_cache(std::chrono::milliseconds{100});
    const auto read = QueryBuilder(exec, cache).select().from("users").cached();

    auto first = read.execute();
    REQUIRE(first.is_ok());
    CHECK_FALSE(first.value().from_cache);

    auto second = read.execute();
    REQUIRE(second.is_ok());
    CHECK(second.value().from_cache);
    CHECK(second.value().rows.size() == 2);
    CHECK(exec->execute_count() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds{150});

    auto third = read.execute();
    REQUIRE(third.is_ok());
    CHECK_FALSE(third.value().from_cache);
    CHECK(exec->execute_count() == 2);
}

TEST_CASE("QueryBuilder: reads without cached() bypass the cache", "[builder][cache]") {
    auto exec = executor_with_rows(1);
    auto cache = make_cache(std::chrono::milliseconds{60000});
    const auto read = QueryBuilder(exec, cache).select().from("users");

    (void)read.execute();
    (void)read.execute();
    CHECK(exec->execute_count() == 2);
    CHECK(cache->get_stats().current_entries == 0);
}

TEST_CASE("QueryBuilder: writes are never served from the cache", "[builder][cache]") {
    auto exec = executor_with_rows(1);
    auto cache = make_cache(std::chrono::milliseconds{60000});
    JsonValue data = JsonValue::object();
    data.set("name", "Ada");
    const auto write = QueryBuilder(exec, cache).insert_into("users", data).cached();

    (void)write.execute();
    (void)write.execute();
    CHECK(exec->execute_count() == 2);
}

TEST_CASE("QueryBuilder: failed reads are not cached", "[builder][cache]") {
    auto exec = executor_with_rows(1);
    exec->fail_execute = true;
    auto cache = make_cache(std::chrono::milliseconds{60000});
    const auto read = QueryBuilder(exec, cache).select().from("users").cached();

    auto result = read.execute();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::DRIVER_ERROR);
    CHECK(result.error_message().starts_with("main select failed"));

    exec->fail_execute = false;
    REQUIRE(read.execute().is_ok());
    CHECK(exec->execute_count() == 2);
}
