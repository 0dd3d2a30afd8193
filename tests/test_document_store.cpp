#include <catch2/catch_test_macros.hpp>
#include "db/backend_registry.hpp"
#include "db/document/document_compiler.hpp"
#include "db/document/document_executor.hpp"
#include "db/document/document_pipeline.hpp"
#include "db/document/memory_document_driver.hpp"
#include "query/query_builder.hpp"

using namespace polystore;

namespace {

JsonValue doc(std::initializer_list<std::pair<const char*, JsonValue>> fields) {
    JsonValue out = JsonValue::object();
    for (const auto& [k, v] : fields) out.set(k, v);
    return out;
}

struct Store {
    std::shared_ptr<MemoryDocumentDriver> driver = std::make_shared<MemoryDocumentDriver>();
    std::shared_ptr<DocumentExecutor> executor =
        std::make_shared<DocumentExecutor>("docs", ProviderKind::DOCUMENT, driver);

    [[nodiscard]] QueryBuilder query() const { return QueryBuilder(executor); }

    void seed() {
        JsonValue rows = JsonValue::array();
        rows.push_back(doc({{"id", 1}, {"name", "Ada"}, {"team", "core"}, {"score", 90}}));
        rows.push_back(doc({{"id", 2}, {"name", "Bea"}, {"team", "core"}, {"score", 70}}));
        rows.push_back(doc({{"id", 3}, {"name", "Cy"}, {"team", "web"}, {"score", 80}}));
        auto inserted = query().insert_into("people", rows).execute();
        REQUIRE(inserted.is_ok());
        REQUIRE(inserted.value().affected_rows == 3);
    }
};

} // namespace

// ============================================================================
// Compiler
// ============================================================================

TEST_CASE("DocumentCompiler: descriptor kinds map to document actions", "[document][compiler]") {
    auto compile = [](const QueryBuilder& q) { return DocumentCompiler::compile(q.descriptor()); };

    auto find = compile(QueryBuilder().select({"name"}).from("people").where("team", "core")
        .order_by("name", "DESC").limit(2).offset(1));
    REQUIRE(find.is_ok());
    CHECK(find.value().action == DocumentAction::FIND);
    CHECK(find.value().query["team"].get<std::string>() == "core");
    CHECK(find.value().options.projection == std::vector<std::string>{"name"});
    CHECK(find.value().options.limit == 2);
    CHECK(find.value().options.skip == 1);
    REQUIRE(find.value().options.sort.size() == 1);
    CHECK(find.value().options.sort[0].descending);

    CHECK(compile(QueryBuilder().select().from("people").first()).value().action ==
          DocumentAction::FIND_ONE);

    JsonValue many = JsonValue::array();
    many.push_back(doc({{"a", 1}}));
    CHECK(compile(QueryBuilder().insert_into("people", many)).value().action ==
          DocumentAction::INSERT_MANY);
    CHECK(compile(QueryBuilder().insert_into("people", doc({{"a", 1}}))).value().action ==
          DocumentAction::INSERT_ONE);
    CHECK(compile(QueryBuilder().update(doc({{"a", 2}})).table("people").where("id", 1))
        .value().action == DocumentAction::UPDATE_MANY);
    CHECK(compile(QueryBuilder().remove().from("people").where("id", 1).first())
        .value().action == DocumentAction::DELETE_ONE);
    CHECK(compile(QueryBuilder().from("people").aggregate(JsonValue::array())).value().action ==
          DocumentAction::AGGREGATE);
}

TEST_CASE("DocumentCompiler: relational-only shapes are rejected", "[document][compiler]") {
    auto category = [](const QueryBuilder& q) {
        return DocumentCompiler::compile(q.descriptor()).error_category();
    };

    CHECK(category(QueryBuilder().select().from("a").join("b", "a.id", "b.a_id")) ==
          ErrorCategory::UNSUPPORTED_OPERATION);
    CHECK(category(QueryBuilder().select().from("a").group_by({"team"})) ==
          ErrorCategory::UNSUPPORTED_OPERATION);
    CHECK(category(QueryBuilder().select({"COUNT(*)"}).from("a")) ==
          ErrorCategory::UNSUPPORTED_OPERATION);
    CHECK(category(QueryBuilder().select().from("a; drop")) == ErrorCategory::VALIDATION_ERROR);
    CHECK(category(QueryBuilder().remove().from("a")) == ErrorCategory::VALIDATION_ERROR);
    CHECK(category(QueryBuilder().from("a")) == ErrorCategory::UNSUPPORTED_OPERATION);
}

// ============================================================================
// Pipeline
// ============================================================================

TEST_CASE("DocumentPipeline: dotted lookup and null matching", "[document][pipeline]") {
    const auto d = JsonValue::parse(R"({"address":{"city":"Oslo"},"tag":null})");
    CHECK(DocumentPipeline::lookup(d, "address.city").get<std::string>() == "Oslo");
    CHECK(DocumentPipeline::lookup(d, "address.zip").is_null());

    CHECK(DocumentPipeline::matches(d, doc({{"address.city", "Oslo"}})));
    CHECK(DocumentPipeline::matches(d, doc({{"missing", JsonValue{}}})));
    CHECK_FALSE(DocumentPipeline::matches(d, doc({{"address.city", "Rome"}})));
}

TEST_CASE("DocumentPipeline: match, group, sort", "[document][pipeline]") {
    std::vector<JsonValue> docs = {
        doc({{"team", "core"}, {"score", 90}}),
        doc({{"team", "core"}, {"score", 70}}),
        doc({{"team", "web"}, {"score", 80}}),
    };
    const auto pipeline = JsonValue::parse(R"([
        {"$group": {"_id": "$team", "total": {"$sum": "$score"},
                    "n": {"$count": {}}, "best": {"$max": "$score"}}},
        {"$sort": {"total": -1}}
    ])");

    auto out = DocumentPipeline::run(docs, pipeline);
    REQUIRE(out.is_ok());
    REQUIRE(out.value().size() == 2);
    CHECK(out.value()[0]["_id"].get<std::string>() == "core");
    CHECK(out.value()[0]["total"].get<int>() == 160);
    CHECK(out.value()[0]["n"].get<int>() == 2);
    CHECK(out.value()[0]["best"].get<int>() == 90);
    CHECK(out.value()[1]["_id"].get<std::string>() == "web");
}

TEST_CASE("DocumentPipeline: count and rejected stages", "[document][pipeline]") {
    std::vector<JsonValue> docs = {doc({{"a", 1}}), doc({{"a", 2}}), doc({{"a", 2}})};

    auto counted = DocumentPipeline::run(docs,
        JsonValue::parse(R"([{"$match": {"a": 2}}, {"$count": "total"}])"));
    REQUIRE(counted.is_ok());
    REQUIRE(counted.value().size() == 1);
    CHECK(counted.value()[0]["total"].get<int>() == 2);

    CHECK(DocumentPipeline::run(docs, JsonValue::parse(R"([{"$lookup": {}}])")).is_error());
    CHECK(DocumentPipeline::run(docs, JsonValue::parse(R"([{"$limit": -1}])")).is_error());
    CHECK(DocumentPipeline::run(docs, JsonValue::parse(R"({"$match": {}})")).is_error());
}

// ============================================================================
// Executor over the memory driver
// ============================================================================

TEST_CASE("DocumentExecutor: find with filter, sort, skip and limit", "[document]") {
    Store store;
    store.seed();

    auto result = store.query().select({"name"}).from("people").where("team", "core")
        .order_by("score").execute();
    REQUIRE(result.is_ok());
    REQUIRE(result.value().rows.size() == 2);
    CHECK(result.value().rows[0]["name"].get<std::string>() == "Bea");
    CHECK_FALSE(result.value().rows[0].contains("score"));

    auto page = store.query().select().from("people").order_by("id").limit(1).offset(1).execute();
    REQUIRE(page.is_ok());
    REQUIRE(page.value().rows.size() == 1);
    CHECK(page.value().rows[0]["id"].get<int>() == 2);
}

TEST_CASE("DocumentExecutor: findOne returns a single record or null", "[document]") {
    Store store;
    store.seed();

    auto one = store.query().select().from("people").where("id", 3).first().execute();
    REQUIRE(one.is_ok());
    CHECK(one.value().to_json()["name"].get<std::string>() == "Cy");

    auto none = store.query().select().from("people").where("id", 42).first().execute();
    REQUIRE(none.is_ok());
    CHECK(none.value().to_json().is_null());
}

TEST_CASE("DocumentExecutor: generated ids and duplicate rejection", "[document]") {
    Store store;

    auto inserted = store.query().insert_into("people", doc({{"name", "Dee"}})).returning().execute();
    REQUIRE(inserted.is_ok());
    REQUIRE(inserted.value().rows.size() == 1);
    const auto id = inserted.value().rows[0]["id"].get<std::string>();
    CHECK(id.size() == 36);

    auto dup = store.query().insert_into("people", doc({{"id", id}, {"name", "Dee"}})).execute();
    REQUIRE(dup.is_error());
    CHECK(dup.error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(dup.error_message().starts_with("docs insertOne failed: duplicate id"));
    CHECK(store.driver->collection_size("people") == 1);
}

TEST_CASE("DocumentExecutor: writes return documents only when asked", "[document]") {
    Store store;
    store.seed();

    auto silent = store.query().update(doc({{"team", "ops"}})).table("people").where("id", 1).execute();
    REQUIRE(silent.is_ok());
    CHECK(silent.value().affected_rows == 1);
    CHECK(silent.value().rows.empty());

    auto updated = store.query().update(doc({{"score", 95}})).table("people")
        .where("team", "core").returning({"id", "score"}).execute();
    REQUIRE(updated.is_ok());
    REQUIRE(updated.value().rows.size() == 1);
    CHECK(updated.value().rows[0]["id"].get<int>() == 2);
    CHECK_FALSE(updated.value().rows[0].contains("name"));

    auto removed = store.query().remove().from("people").where("team", "ops").returning().execute();
    REQUIRE(removed.is_ok());
    REQUIRE(removed.value().rows.size() == 1);
    CHECK(removed.value().rows[0]["name"].get<std::string>() == "Ada");
    CHECK(store.driver->collection_size("people") == 2);
}

TEST_CASE("DocumentExecutor: aggregate pipeline through the builder", "[document]") {
    Store store;
    store.seed();

    auto result = store.query().from("people").aggregate(JsonValue::parse(R"([
        {"$match": {"team": "core"}},
        {"$group": {"_id": "$team", "avg": {"$avg": "$score"}}}
    ])")).execute();
    REQUIRE(result.is_ok());
    REQUIRE(result.value().rows.size() == 1);
    CHECK(result.value().rows[0]["avg"].get<double>() == 80.0);
}

TEST_CASE("DocumentExecutor: schema, ping and close", "[document]") {
    Store store;
    SchemaDescriptor s;
    s.name = "notes";
    s.fields.push_back({.name = "title"});

    auto applied = store.executor->ensure_schema(s);
    REQUIRE(applied.is_ok());
    CHECK(applied.value().created);
    CHECK(applied.value().statements.empty());
    CHECK(store.executor->ensure_schema(s).is_ok());

    CHECK(store.executor->ping().is_ok());
    REQUIRE(store.executor->close().is_ok());
    CHECK(store.executor->close().is_ok());
    CHECK(store.executor->ping().error_category() == ErrorCategory::NO_CONNECTION);
    CHECK(store.query().select().from("notes").execute().error_category() ==
          ErrorCategory::NO_CONNECTION);
}

TEST_CASE("DocumentBackend: registered for every document kind", "[document][backend]") {
    const auto& registry = BackendRegistry::instance();
    for (const auto kind : {ProviderKind::DOCUMENT, ProviderKind::WIDE_COLUMN,
                            ProviderKind::MANAGED_DOCUMENT, ProviderKind::GRAPH_DOCUMENT}) {
        REQUIRE(registry.has_backend(kind));
        auto backend = registry.create(kind);
        CHECK(backend->family() == ProviderFamily::DOCUMENT);
    }

    ProviderConfig cfg;
    cfg.name = "graph";
    cfg.kind = ProviderKind::GRAPH_DOCUMENT;
    auto executor = registry.create(cfg.kind)->connect(cfg);
    REQUIRE(executor.is_ok());
    CHECK(executor.value()->name() == "graph");
    CHECK(executor.value()->family() == ProviderFamily::DOCUMENT);

    cfg.driver = "cassandra";
    auto refused = registry.create(cfg.kind)->connect(cfg);
    REQUIRE(refused.is_error());
    CHECK(refused.error_category() == ErrorCategory::CONNECTION_ERROR);
}
