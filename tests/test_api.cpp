#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include "api/graphql_generator.hpp"
#include "api/rest_generator.hpp"
#include "db/connection_registry.hpp"
#include "db/document/document_executor.hpp"
#include "db/document/memory_document_driver.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/relational_executor.hpp"
#include "realtime/change_notifier.hpp"
#include "schema/schema_manager.hpp"
#include "mocks/mock_connection.hpp"

using namespace polystore;
using namespace polystore::testing;

namespace {

SchemaDescriptor users_schema() {
    SchemaDescriptor s;
    s.name = "users";
    s.fields.push_back({.name = "id", .type = SemanticType::UUID, .nullable = false, .primary_key = true});
    s.fields.push_back({.name = "name", .type = SemanticType::STRING, .nullable = false});
    s.fields.push_back({.name = "age", .type = SemanticType::INTEGER});
    return s;
}

/// Document provider "docs" behind a live registry, schema catalog and notifier
struct ApiHarness {
    BackendRegistry backends;
    ConnectionRegistry registry{backends};
    SchemaManager schemas{registry};
    ChangeNotifier notifier;
    std::shared_ptr<MemoryDocumentDriver> driver = std::make_shared<MemoryDocumentDriver>();

    ApiHarness() {
        registry.attach(std::make_shared<DocumentExecutor>("docs", ProviderKind::DOCUMENT, driver));
    }

    [[nodiscard]] ApiContext context() {
        return ApiContext{registry, schemas, notifier, nullptr, ApiConfig{}, false};
    }
};

/// Relational provider "main" over a scripted database
struct RelationalHarness {
    std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>();
    BackendRegistry backends;
    ConnectionRegistry registry{backends};
    SchemaManager schemas{registry};
    ChangeNotifier notifier;
    std::shared_ptr<RelationalExecutor> executor;

    explicit RelationalHarness(ProviderKind kind) {
        PoolConfig cfg;
        cfg.min_connections = 0;
        cfg.max_connections = 2;
        auto pool = std::make_shared<GenericConnectionPool>(
            "main", cfg, std::make_shared<MockConnectionFactory>(db));
        executor = std::make_shared<RelationalExecutor>("main", kind, pool,
                                                        std::chrono::milliseconds{100});
        registry.attach(executor);
    }

    [[nodiscard]] ApiContext context() {
        return ApiContext{registry, schemas, notifier, nullptr, ApiConfig{}, false};
    }
};

constexpr const char* kAdaId = "3f2b8c1e-4d5a-4b6c-8e9f-0a1b2c3d4e5f";
constexpr const char* kGhostId = "00000000-0000-4000-8000-000000000000";

DbResultSet user_rows(std::vector<std::vector<std::optional<std::string>>> rows) {
    auto rs = rows_result({"id", "name", "age"}, std::move(rows));
    rs.column_types = {
        {GenericColumnType::UUID, 2950, "uuid"},
        {GenericColumnType::VARCHAR, 1043, "varchar"},
        {GenericColumnType::INTEGER, 23, "int4"},
    };
    return rs;
}

DbResultSet no_user_rows() {
    auto rs = user_rows({});
    rs.affected_rows = 0;
    return rs;
}

size_t drain(Subscription& sub) {
    size_t n = 0;
    while (sub.try_next()) ++n;
    return n;
}

const RestRoute& route(const std::vector<RestRoute>& routes, const std::string& method,
                       bool member) {
    for (const auto& r : routes) {
        if (r.method == method && r.path.ends_with("/:id") == member) return r;
    }
    FAIL("route not generated");
    return routes.front();
}

ApiRequest body(const std::string& json) {
    ApiRequest req;
    req.body = json;
    return req;
}

ApiRequest with_id(const std::string& id, const std::string& json = "") {
    ApiRequest req;
    req.id = id;
    req.body = json;
    return req;
}

} // namespace

// ============================================================================
// REST
// ============================================================================

TEST_CASE("RestGenerator: five routes per entity under the base path", "[api][rest]") {
    ApiHarness h;
    RestGenerator rest(h.context());
    auto routes = rest.generate("docs", users_schema());
    REQUIRE(routes.is_ok());
    REQUIRE(routes.value().size() == 5);

    CHECK(route(routes.value(), "GET", false).path == "/api/users");
    CHECK(route(routes.value(), "GET", true).path == "/api/users/:id");
    CHECK(route(routes.value(), "DELETE", true).path == "/api/users/:id");

    // generating registers the schema once
    CHECK(h.schemas.find_schema("docs", "users").has_value());
}

TEST_CASE("RestGenerator: create publishes and get finds the record", "[api][rest]") {
    ApiHarness h;
    auto created_feed = h.notifier.subscribe("users:created").value();
    auto routes = RestGenerator(h.context()).generate("docs", users_schema()).value();

    auto created = route(routes, "POST", false).handler(body(R"({"name":"Ada","age":36})"));
    REQUIRE(created.status == http::kCreated);
    const auto record = created.body["data"];
    const auto id = record["id"].get<std::string>();
    CHECK_FALSE(id.empty());
    CHECK(record["name"].get<std::string>() == "Ada");

    auto event = created_feed->try_next();
    REQUIRE(event.has_value());
    CHECK((*event)["id"].get<std::string>() == id);
    CHECK_FALSE(created_feed->try_next().has_value());

    auto fetched = route(routes, "GET", true).handler(with_id(id));
    CHECK(fetched.status == http::kOk);
    CHECK(fetched.body["data"]["age"].get<int>() == 36);

    auto missing = route(routes, "GET", true).handler(with_id("no-such-user"));
    CHECK(missing.status == http::kNotFound);
    CHECK(missing.body["error"]["category"].get<std::string>() ==
          error_category_to_string(ErrorCategory::NOT_FOUND));
}

TEST_CASE("RestGenerator: invalid writes are rejected before the store", "[api][rest]") {
    ApiHarness h;
    auto feed = h.notifier.subscribe("users:created").value();
    auto routes = RestGenerator(h.context()).generate("docs", users_schema()).value();
    const auto& create = route(routes, "POST", false);

    CHECK(create.handler(body("{broken")).status == http::kBadRequest);
    CHECK(create.handler(body("[]")).status == http::kBadRequest);
    CHECK(create.handler(body(R"({"age":3})")).status == http::kBadRequest);
    CHECK(create.handler(body(R"({"name":"Bo","age":"old"})")).status == http::kBadRequest);
    CHECK(create.handler(body(R"({"name":"Bo","email":"b@x"})")).status == http::kBadRequest);

    CHECK(h.driver->collection_size("users") == 0);
    CHECK_FALSE(feed->try_next().has_value());
}

TEST_CASE("RestGenerator: list pages and filters", "[api][rest]") {
    ApiHarness h;
    auto routes = RestGenerator(h.context()).generate("docs", users_schema()).value();
    const auto& create = route(routes, "POST", false);
    const auto& list = route(routes, "GET", false);

    for (const auto* row : {R"({"name":"a","age":20})", R"({"name":"b","age":30})",
                            R"({"name":"c","age":30})"}) {
        REQUIRE(create.handler(body(row)).status == http::kCreated);
    }

    ApiRequest page_one;
    page_one.query = {{"limit", "2"}};
    auto first = list.handler(page_one);
    REQUIRE(first.status == http::kOk);
    CHECK(first.body["data"].size() == 2);
    CHECK(first.body["pagination"]["total"].get<int>() == 3);
    CHECK(first.body["pagination"]["limit"].get<int>() == 2);

    ApiRequest page_two;
    page_two.query = {{"limit", "2"}, {"page", "2"}};
    CHECK(list.handler(page_two).body["data"].size() == 1);

    ApiRequest filtered;
    filtered.query = {{"age", "30"}};
    auto thirty = list.handler(filtered);
    REQUIRE(thirty.status == http::kOk);
    CHECK(thirty.body["data"].size() == 2);
    CHECK(thirty.body["pagination"]["total"].get<int>() == 2);

    ApiRequest bad;
    bad.query = {{"page", "0"}};
    CHECK(list.handler(bad).status == http::kBadRequest);
    bad.query = {{"limit", "5000"}};
    CHECK(list.handler(bad).status == http::kBadRequest);
    bad.query = {{"age", "thirty"}};
    CHECK(list.handler(bad).status == http::kBadRequest);
    bad.query = {{"nickname", "x"}};
    CHECK(list.handler(bad).status == http::kBadRequest);
}

TEST_CASE("RestGenerator: update and delete publish lifecycle events", "[api][rest]") {
    ApiHarness h;
    auto updates = h.notifier.subscribe("users:updated").value();
    auto deletes = h.notifier.subscribe("users:deleted").value();
    auto routes = RestGenerator(h.context()).generate("docs", users_schema()).value();

    const auto id = route(routes, "POST", false).handler(body(R"({"name":"Ada"})"))
        .body["data"]["id"].get<std::string>();

    auto updated = route(routes, "PUT", true).handler(with_id(id, R"({"age":37})"));
    REQUIRE(updated.status == http::kOk);
    CHECK(updated.body["data"]["age"].get<int>() == 37);
    CHECK(updated.body["data"]["name"].get<std::string>() == "Ada");
    REQUIRE(updates->try_next().has_value());

    CHECK(route(routes, "PUT", true).handler(with_id("ghost", R"({"age":1})")).status == http::kNotFound);
    CHECK_FALSE(updates->try_next().has_value());

    auto removed = route(routes, "DELETE", true).handler(with_id(id));
    CHECK(removed.status == http::kNoContent);
    CHECK_FALSE(removed.has_body());
    auto event = deletes->try_next();
    REQUIRE(event.has_value());
    CHECK((*event)["id"].get<std::string>() == id);

    CHECK(route(routes, "DELETE", true).handler(with_id(id)).status == http::kNotFound);
    CHECK_FALSE(deletes->try_next().has_value());
}

TEST_CASE("RestGenerator: unavailable provider maps to 503", "[api][rest]") {
    ApiHarness h;
    auto routes = RestGenerator(h.context()).generate("docs", users_schema()).value();
    (void)h.registry.close();

    auto response = route(routes, "GET", false).handler(ApiRequest{});
    CHECK(response.status == http::kServiceUnavailable);
}

TEST_CASE("RestGenerator: out-of-range numbers are rejected", "[api][rest]") {
    ApiHarness h;
    auto routes = RestGenerator(h.context()).generate("docs", users_schema()).value();

    CHECK(route(routes, "POST", false).handler(body(R"({"name":"Ada","age":1e300})")).status ==
          http::kBadRequest);
    CHECK(route(routes, "POST", false).handler(body(R"({"name":"Ada","age":1.5})")).status ==
          http::kBadRequest);
    CHECK(h.driver->collection_size("users") == 0);

    ApiRequest far;
    far.query = {{"page", "9223372036854775807"}, {"limit", "10"}};
    auto response = route(routes, "GET", false).handler(far);
    CHECK(response.status == http::kBadRequest);
    CHECK(response.body["error"]["category"].get<std::string>() ==
          error_category_to_string(ErrorCategory::VALIDATION_ERROR));

    // (page - 1) * limit still fits
    far.query = {{"page", "9223372036854775807"}, {"limit", "1"}};
    auto last = route(routes, "GET", false).handler(far);
    CHECK(last.status == http::kOk);
    CHECK(last.body["data"].size() == 0);
}

TEST_CASE("RestGenerator: uuid keys are checked before the store", "[api][rest]") {
    ApiHarness h;
    auto routes = RestGenerator(h.context()).generate("docs", users_schema()).value();

    ApiRequest filtered;
    filtered.query = {{"id", "not-a-uuid"}};
    CHECK(route(routes, "GET", false).handler(filtered).status == http::kBadRequest);

    filtered.query = {{"id", kGhostId}};
    CHECK(route(routes, "GET", false).handler(filtered).status == http::kOk);

    CHECK(route(routes, "POST", false).handler(body(R"({"id":"abc","name":"Ada"})")).status ==
          http::kBadRequest);
    CHECK(h.driver->collection_size("users") == 0);
}

// ============================================================================
// REST over relational providers
// ============================================================================

TEST_CASE("RestGenerator: PostgreSQL insert returns the stored row", "[api][rest][relational]") {
    RelationalHarness h(ProviderKind::POSTGRESQL);
    h.db->set_responder([](const RecordedStatement& stmt) {
        if (stmt.sql.starts_with("INSERT")) return user_rows({{kAdaId, "Ada", "36"}});
        if (stmt.sql.starts_with("SELECT") && !stmt.params.empty() && stmt.params[0] == kAdaId) {
            return user_rows({{kAdaId, "Ada", "36"}});
        }
        return no_user_rows();
    });
    auto created_feed = h.notifier.subscribe("users:created").value();
    auto routes = RestGenerator(h.context()).generate("main", users_schema()).value();

    auto created = route(routes, "POST", false).handler(body(R"({"name":"Ada","age":36})"));
    REQUIRE(created.status == http::kCreated);
    CHECK(created.body["data"]["id"].get<std::string>() == kAdaId);
    CHECK(created.body["data"]["age"].get<int>() == 36);

    auto stmts = h.db->statements();
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0].sql.starts_with("INSERT INTO users "));
    CHECK(stmts[0].sql.ends_with(" RETURNING *"));

    auto event = created_feed->try_next();
    REQUIRE(event.has_value());
    CHECK((*event)["id"].get<std::string>() == kAdaId);
    CHECK(drain(*created_feed) == 0);

    CHECK(route(routes, "GET", true).handler(with_id(kAdaId)).status == http::kOk);
    auto missing = route(routes, "GET", true).handler(with_id(kGhostId));
    CHECK(missing.status == http::kNotFound);
    CHECK(missing.body["error"]["category"].get<std::string>() ==
          error_category_to_string(ErrorCategory::NOT_FOUND));
}

TEST_CASE("RestGenerator: malformed ids on a uuid key are not found", "[api][rest][relational]") {
    RelationalHarness h(ProviderKind::POSTGRESQL);
    auto routes = RestGenerator(h.context()).generate("main", users_schema()).value();
    auto deletes = h.notifier.subscribe("users:deleted").value();

    CHECK(route(routes, "GET", true).handler(with_id("no-such-user")).status == http::kNotFound);
    CHECK(route(routes, "PUT", true).handler(with_id("no-such-user", R"({"age":1})")).status ==
          http::kNotFound);
    CHECK(route(routes, "DELETE", true).handler(with_id("no-such-user")).status == http::kNotFound);
    CHECK(h.db->statement_count() == 0);
    CHECK(drain(*deletes) == 0);

    ApiRequest filtered;
    filtered.query = {{"id", "no-such-user"}};
    CHECK(route(routes, "GET", false).handler(filtered).status == http::kBadRequest);
    CHECK(h.db->statement_count() == 0);
}

TEST_CASE("RestGenerator: PostgreSQL update and delete publish once", "[api][rest][relational]") {
    RelationalHarness h(ProviderKind::POSTGRESQL);
    h.db->set_responder([](const RecordedStatement& stmt) {
        const bool ada = std::find(stmt.params.begin(), stmt.params.end(),
                                   SqlParam{kAdaId}) != stmt.params.end();
        if (!ada) return no_user_rows();
        if (stmt.sql.starts_with("UPDATE")) return user_rows({{kAdaId, "Ada", "37"}});
        return user_rows({{kAdaId, "Ada", "36"}});
    });
    auto updates = h.notifier.subscribe("users:updated").value();
    auto deletes = h.notifier.subscribe("users:deleted").value();
    auto routes = RestGenerator(h.context()).generate("main", users_schema()).value();

    auto updated = route(routes, "PUT", true).handler(with_id(kAdaId, R"({"age":37})"));
    REQUIRE(updated.status == http::kOk);
    CHECK(updated.body["data"]["age"].get<int>() == 37);
    CHECK(drain(*updates) == 1);

    CHECK(route(routes, "PUT", true).handler(with_id(kGhostId, R"({"age":1})")).status ==
          http::kNotFound);
    CHECK(drain(*updates) == 0);

    CHECK(route(routes, "DELETE", true).handler(with_id(kAdaId)).status == http::kNoContent);
    auto event = deletes->try_next();
    REQUIRE(event.has_value());
    CHECK((*event)["id"].get<std::string>() == kAdaId);
    CHECK(drain(*deletes) == 0);

    CHECK(route(routes, "DELETE", true).handler(with_id(kGhostId)).status == http::kNotFound);
    CHECK(drain(*deletes) == 0);
}

TEST_CASE("RestGenerator: PostgreSQL list sends paging and counts", "[api][rest][relational]") {
    RelationalHarness h(ProviderKind::POSTGRESQL);
    h.db->set_responder([](const RecordedStatement& stmt) {
        if (stmt.sql.starts_with("SELECT COUNT(*)")) return rows_result({"total"}, {{"3"}});
        return user_rows({{kAdaId, "Ada", "30"}});
    });
    auto routes = RestGenerator(h.context()).generate("main", users_schema()).value();

    ApiRequest req;
    req.query = {{"age", "30"}, {"page", "3"}, {"limit", "1"}};
    auto listed = route(routes, "GET", false).handler(req);
    REQUIRE(listed.status == http::kOk);
    CHECK(listed.body["data"].size() == 1);
    CHECK(listed.body["pagination"]["total"].get<int>() == 3);

    const auto stmts = h.db->statements();
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0].sql.find("LIMIT 1 OFFSET 2") != std::string::npos);
    REQUIRE_FALSE(stmts[0].params.empty());
    CHECK(stmts[0].params[0] == "30");
    CHECK(stmts[1].sql.starts_with("SELECT COUNT(*) AS total FROM users"));
}

TEST_CASE("RestGenerator: MySQL writes read the row back and publish once", "[api][rest][relational][mysql]") {
    RelationalHarness h(ProviderKind::MYSQL);
    REQUIRE(h.executor->ensure_schema(users_schema()).is_ok());
    h.db->clear();
    h.db->set_responder([](const RecordedStatement& stmt) {
        if (stmt.sql.starts_with("SELECT")) {
            if (stmt.params.empty() || stmt.params[0] == kGhostId) return no_user_rows();
            return user_rows({{stmt.params[0], "Ada", "36"}});
        }
        DbResultSet rs;
        rs.success = true;
        const bool ghost = !stmt.params.empty() && stmt.params.back() == kGhostId;
        rs.affected_rows = ghost ? 0 : 1;
        return rs;
    });
    auto created_feed = h.notifier.subscribe("users:created").value();
    auto deletes = h.notifier.subscribe("users:deleted").value();
    auto routes = RestGenerator(h.context()).generate("main", users_schema()).value();

    auto created = route(routes, "POST", false).handler(body(R"({"name":"Ada","age":36})"));
    REQUIRE(created.status == http::kCreated);
    const auto id = created.body["data"]["id"].get<std::string>();
    CHECK(id.size() == 36);
    CHECK(created.body["data"]["name"].get<std::string>() == "Ada");
    CHECK(drain(*created_feed) == 1);

    const auto stmts = h.db->statements();
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0].sql.starts_with("INSERT INTO users"));
    CHECK(stmts[1].sql == "SELECT * FROM users WHERE id = ?");
    CHECK(stmts[1].params[0] == id);

    CHECK(route(routes, "GET", true).handler(with_id(kGhostId)).status == http::kNotFound);
    CHECK(route(routes, "PUT", true).handler(with_id(id, R"({"age":37})")).status == http::kOk);

    CHECK(route(routes, "DELETE", true).handler(with_id(kGhostId)).status == http::kNotFound);
    CHECK(drain(*deletes) == 0);
    CHECK(route(routes, "DELETE", true).handler(with_id(id)).status == http::kNoContent);
    CHECK(drain(*deletes) == 1);
    CHECK(h.db->statements().back().sql == "COMMIT");
}

// ============================================================================
// GraphQL
// ============================================================================

TEST_CASE("GraphQLGenerator: field names and SDL", "[api][graphql]") {
    const auto names = GraphQLGenerator::names_for(users_schema());
    CHECK(names.type_name == "User");
    CHECK(names.list_field == "users");
    CHECK(names.get_field == "user");
    CHECK(names.create_field == "createUser");
    REQUIRE(names.subscriptions.size() == 3);
    CHECK(names.subscriptions[0] == std::pair<std::string, std::string>{"userCreated", "users:created"});

    const auto sdl = GraphQLGenerator::sdl_for(users_schema());
    CHECK(sdl.find("type User {\n  id: ID!\n  name: String!\n  age: Int\n}") != std::string::npos);
    CHECK(sdl.find("input UserInput {\n  name: String\n  age: Int\n}") != std::string::npos);
    CHECK(sdl.find("deleteUser(id: ID!): Boolean!") != std::string::npos);
}

TEST_CASE("GraphQLGenerator: mutations and queries share the entity service", "[api][graphql]") {
    ApiHarness h;
    GraphQLHandler handler(h.notifier);
    REQUIRE(GraphQLGenerator(h.context()).generate("docs", users_schema(), handler).is_ok());
    auto feed = h.notifier.subscribe("users:created").value();

    auto created = handler.execute(R"(mutation { createUser(input: {name: "Ada", age: 36}) { id name } })");
    REQUIRE_FALSE(created.contains("errors"));
    const auto record = created["data"]["createUser"];
    CHECK(record["name"].get<std::string>() == "Ada");
    CHECK_FALSE(record.contains("age"));
    REQUIRE(feed->try_next().has_value());

    JsonValue variables = JsonValue::object();
    variables.set("id", record["id"]);
    auto fetched = handler.execute("query Get($id: ID!) { user(id: $id) { name age } }", variables);
    CHECK(fetched["data"]["user"]["age"].get<int>() == 36);

    auto listed = handler.execute("{ users(limit: 5) { name } }");
    REQUIRE(listed["data"]["users"].is_array());
    CHECK(listed["data"]["users"].size() == 1);

    auto missing = handler.execute(R"({ user(id: "nobody") { name } })");
    REQUIRE(missing.contains("errors"));
    CHECK(missing["errors"][0]["extensions"]["category"].get<std::string>() ==
          error_category_to_string(ErrorCategory::NOT_FOUND));
}

TEST_CASE("GraphQLHandler: subscriptions resolve to lifecycle channels", "[api][graphql]") {
    ApiHarness h;
    GraphQLHandler handler(h.notifier);
    REQUIRE(GraphQLGenerator(h.context()).generate("docs", users_schema(), handler).is_ok());

    CHECK(handler.channel_for("userDeleted") == "users:deleted");
    auto sub = handler.subscribe("subscription { userCreated { id } }");
    REQUIRE(sub.is_ok());
    CHECK(sub.value()->channel() == "users:created");

    CHECK(handler.subscribe("subscription { userRenamed { id } }").is_error());
    CHECK(handler.subscribe("{ users { id } }").is_error());

    auto over_http = handler.execute("subscription { userCreated { id } }");
    CHECK(over_http.contains("errors"));
}

TEST_CASE("GraphQLHandler: unknown fields and disabled mutations", "[api][graphql]") {
    ApiHarness h;
    GraphQLConfig config;
    config.mutations_enabled = false;
    GraphQLHandler handler(h.notifier, config);
    REQUIRE(GraphQLGenerator(h.context()).generate("docs", users_schema(), handler).is_ok());

    auto unknown = handler.execute("{ widgets { id } }");
    REQUIRE(unknown.contains("errors"));
    CHECK_FALSE(unknown.contains("data"));

    auto blocked = handler.execute(R"(mutation { createUser(input: {name: "x"}) { id } })");
    CHECK(blocked.contains("errors"));
    CHECK(h.driver->collection_size("users") == 0);

    CHECK(handler.execute("{ users { id ").contains("errors"));
}

TEST_CASE("GraphQLHandler: deeply nested argument values fail cleanly", "[api][graphql]") {
    ApiHarness h;
    GraphQLHandler handler(h.notifier);
    REQUIRE(GraphQLGenerator(h.context()).generate("docs", users_schema(), handler).is_ok());

    const size_t levels = 100000;
    const auto nested = "mutation { createUser(input: " + std::string(levels, '[') +
                         std::string(levels, ']') + ") { id } }";
    auto lists = handler.execute(nested);
    REQUIRE(lists.contains("errors"));
    CHECK(lists["errors"][0]["message"].get<std::string>().find("nesting") != std::string::npos);

    std::string objects = "{ users(name: ";
    for (size_t i = 0; i < levels; ++i) objects += "{a: ";
    objects += "1" + std::string(levels, '}') + ") { id } }";
    CHECK(handler.execute(objects).contains("errors"));

    // Shallow literals still parse
    auto shallow = handler.execute(R"(mutation { createUser(input: {name: "Ada"}) { id } })");
    CHECK_FALSE(shallow.contains("errors"));
    CHECK(h.driver->collection_size("users") == 1);
}

TEST_CASE("GraphQLGenerator: page and limit must be exact integers", "[api][graphql]") {
    ApiHarness h;
    GraphQLHandler handler(h.notifier);
    REQUIRE(GraphQLGenerator(h.context()).generate("docs", users_schema(), handler).is_ok());

    for (const auto* query : {"{ users(page: 1e300) { id } }", "{ users(limit: 1e300) { id } }",
                              "{ users(page: 1.5) { id } }",
                              "{ users(page: 9223372036854775807, limit: 10) { id } }"}) {
        auto result = handler.execute(query);
        REQUIRE(result.contains("errors"));
        CHECK(result["errors"][0]["extensions"]["category"].get<std::string>() ==
              error_category_to_string(ErrorCategory::VALIDATION_ERROR));
    }
    CHECK_FALSE(handler.execute("{ users(page: 2, limit: 5) { id } }").contains("errors"));
}
