#include <catch2/catch_test_macros.hpp>
#include "db/document/jsonb_document_driver.hpp"
#include "db/document/memory_document_driver.hpp"
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_connection.hpp"

using namespace polystore;
using namespace polystore::testing;

namespace {

struct JsonbFixture {
    std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>();
    std::shared_ptr<GenericConnectionPool> pool;
    std::shared_ptr<JsonbDocumentDriver> driver;

    JsonbFixture() {
        PoolConfig cfg;
        cfg.min_connections = 0;
        cfg.max_connections = 2;
        pool = std::make_shared<GenericConnectionPool>(
            "docs", cfg, std::make_shared<MockConnectionFactory>(db));
        driver = std::make_shared<JsonbDocumentDriver>(pool, std::chrono::milliseconds{100});
    }
};

JsonValue doc(std::initializer_list<std::pair<const char*, JsonValue>> fields) {
    JsonValue out = JsonValue::object();
    for (const auto& [k, v] : fields) out.set(k, v);
    return out;
}

/// Rows of a single `doc` column, as libpq hands back JSONB text
DbResultSet doc_rows(std::initializer_list<JsonValue> docs) {
    std::vector<std::vector<std::optional<std::string>>> rows;
    for (const auto& d : docs) rows.push_back({d.dump()});
    return rows_result({"doc"}, std::move(rows));
}

DocumentOperation operation(DocumentAction action, JsonValue query = JsonValue::object()) {
    DocumentOperation op;
    op.collection = "people";
    op.action = action;
    op.query = std::move(query);
    return op;
}

} // namespace

TEST_CASE("JsonbDocumentDriver: filter terms compare whole values per path", "[document][jsonb]") {
    std::vector<SqlParam> params;
    const auto clause = JsonbDocumentDriver::filter_clause(
        doc({{"address.city", "Oslo"}, {"team", "core"}}), params);

    CHECK(clause == "(doc #> $1::text[]) = $2::jsonb AND (doc #> $3::text[]) = $4::jsonb");
    REQUIRE(params.size() == 4);
    CHECK(params[0] == "{address,city}");
    CHECK(params[1] == "\"Oslo\"");
    CHECK(params[2] == "{team}");
    CHECK(params[3] == "\"core\"");

    std::vector<SqlParam> none;
    CHECK(JsonbDocumentDriver::filter_clause(JsonValue::object(), none) == "TRUE");
    CHECK(none.empty());

    std::vector<SqlParam> nulls;
    CHECK(JsonbDocumentDriver::filter_clause(doc({{"nickname", JsonValue{}}}), nulls) ==
          "((doc #> $1::text[]) IS NULL OR (doc #> $1::text[]) = 'null'::jsonb)");
    CHECK(nulls.size() == 1);
}

TEST_CASE("JsonbDocumentDriver: find with sort, limit and projection", "[document][jsonb]") {
    JsonbFixture f;
    f.db->set_responder([](const RecordedStatement&) {
        return doc_rows({doc({{"id", "a"}, {"name", "Ada"}, {"team", "core"}})});
    });

    auto op = operation(DocumentAction::FIND, doc({{"team", "core"}}));
    op.options.sort.push_back({"name", true});
    op.options.limit = 10;
    op.options.skip = 5;
    op.options.projection = {"name"};

    auto result = f.driver->run(op);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().documents.size() == 1);
    const auto& found = result.value().documents[0];
    CHECK(found["name"].get<std::string>() == "Ada");
    CHECK_FALSE(found.contains("team"));
    CHECK(result.value().affected == 1);

    const auto stmts = f.db->statements();
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0].sql == "SELECT doc FROM people WHERE (doc #> $1::text[]) = $2::jsonb "
                          "ORDER BY doc #> '{name}' DESC LIMIT 10 OFFSET 5");
    CHECK(stmts[0].params == std::vector<SqlParam>{"{team}", "\"core\""});
}

TEST_CASE("JsonbDocumentDriver: update_one binds the merge payload first", "[document][jsonb]") {
    JsonbFixture f;
    f.db->set_responder([](const RecordedStatement&) {
        auto rs = doc_rows({doc({{"id", "a"}, {"name", "Ada"}, {"team", "web"}})});
        rs.affected_rows = 1;
        return rs;
    });

    auto op = operation(DocumentAction::UPDATE_ONE, doc({{"id", "a"}}));
    op.data = doc({{"team", "web"}});

    auto result = f.driver->run(op);
    REQUIRE(result.is_ok());
    CHECK(result.value().affected == 1);
    CHECK(result.value().documents[0]["team"].get<std::string>() == "web");

    const auto stmts = f.db->statements();
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0].sql == "UPDATE people SET doc = doc || $1::jsonb WHERE id = "
                          "(SELECT id FROM people WHERE (doc #> $2::text[]) = $3::jsonb "
                          "ORDER BY id LIMIT 1) RETURNING doc");
    REQUIRE(stmts[0].params.size() == 3);
    CHECK(stmts[0].params[0] == R"({"team":"web"})");
    CHECK(stmts[0].params[1] == "{id}");
    CHECK(stmts[0].params[2] == "\"a\"");
}

TEST_CASE("JsonbDocumentDriver: delete_one removes a single matching row", "[document][jsonb]") {
    JsonbFixture f;
    f.db->set_responder([](const RecordedStatement&) {
        auto rs = doc_rows({doc({{"id", "a"}})});
        rs.affected_rows = 1;
        return rs;
    });

    auto result = f.driver->run(operation(DocumentAction::DELETE_ONE, doc({{"id", "a"}})));
    REQUIRE(result.is_ok());
    CHECK(result.value().affected == 1);

    const auto stmts = f.db->statements();
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0].sql == "DELETE FROM people WHERE id = "
                          "(SELECT id FROM people WHERE (doc #> $1::text[]) = $2::jsonb "
                          "ORDER BY id LIMIT 1) RETURNING doc");
    CHECK(stmts[0].params == std::vector<SqlParam>{"{id}", "\"a\""});
}

TEST_CASE("JsonbDocumentDriver: insert generates ids and pairs placeholders", "[document][jsonb]") {
    JsonbFixture f;
    f.db->set_responder([](const RecordedStatement& stmt) {
        auto rs = rows_result({"doc"}, {{stmt.params[1]}, {stmt.params[3]}});
        rs.affected_rows = 2;
        return rs;
    });

    auto op = operation(DocumentAction::INSERT_MANY);
    op.data = JsonValue::array();
    op.data.push_back(doc({{"id", "fixed"}, {"name", "Ada"}}));
    op.data.push_back(doc({{"name", "Bea"}}));

    auto result = f.driver->run(op);
    REQUIRE(result.is_ok());
    CHECK(result.value().affected == 2);

    const auto stmts = f.db->statements();
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0].sql == "INSERT INTO people (id, doc) VALUES ($1, $2::jsonb), ($3, $4::jsonb) "
                          "RETURNING doc");
    CHECK(stmts[0].params[0] == "fixed");
    REQUIRE(stmts[0].params[2].has_value());
    CHECK(stmts[0].params[2]->size() == 36);
    CHECK(result.value().documents[1]["id"].get<std::string>() == *stmts[0].params[2]);
}

TEST_CASE("JsonbDocumentDriver: missing table reads as empty, writes still fail", "[document][jsonb]") {
    JsonbFixture f;
    f.db->set_responder([](const RecordedStatement&) {
        DbResultSet rs;
        rs.error_code = "42P01";
        rs.error_message = "relation \"people\" does not exist";
        return rs;
    });

    auto read = f.driver->run(operation(DocumentAction::FIND, doc({{"team", "core"}})));
    REQUIRE(read.is_ok());
    CHECK(read.value().documents.empty());
    CHECK(read.value().affected == 0);

    auto write = f.driver->run(operation(DocumentAction::DELETE_MANY));
    REQUIRE(write.is_error());
    CHECK(write.error_category() == ErrorCategory::DRIVER_ERROR);
    CHECK(write.error_message().find("42P01") != std::string::npos);
}

TEST_CASE("JsonbDocumentDriver: invalid collections never reach the database", "[document][jsonb]") {
    JsonbFixture f;
    auto op = operation(DocumentAction::FIND);
    op.collection = "people; DROP TABLE x";
    CHECK(f.driver->run(op).error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(f.driver->ensure_collection("a.b").error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(f.db->statement_count() == 0);

    REQUIRE(f.driver->ensure_collection("people").is_ok());
    CHECK(f.db->statements().back().sql ==
          "CREATE TABLE IF NOT EXISTS people (id TEXT PRIMARY KEY, doc JSONB NOT NULL)");
}

TEST_CASE("Document drivers agree on whole-value equality", "[document][jsonb]") {
    // {"tags":["a"]} does not match a document whose tags are ["a","b"]
    const auto stored = doc({{"id", "x"}, {"tags", JsonValue::array().push_back("a").push_back("b")}});
    JsonValue filter = JsonValue::object();
    filter.set("tags", JsonValue::array().push_back("a"));

    MemoryDocumentDriver memory;
    DocumentOperation insert;
    insert.collection = "people";
    insert.action = DocumentAction::INSERT_ONE;
    insert.data = stored;
    REQUIRE(memory.run(insert).is_ok());
    auto in_memory = memory.run(operation(DocumentAction::FIND, filter));
    REQUIRE(in_memory.is_ok());
    CHECK(in_memory.value().documents.empty());

    // The JSONB driver compares with '=' on the addressed value, never '@>'
    std::vector<SqlParam> params;
    const auto clause = JsonbDocumentDriver::filter_clause(filter, params);
    CHECK(clause.find("@>") == std::string::npos);
    CHECK(clause == "(doc #> $1::text[]) = $2::jsonb");
    CHECK(params[1] == R"(["a"])");
}
