#include <catch2/catch_test_macros.hpp>
#include "query/sql_compiler.hpp"
#include "query/query_builder.hpp"

#include <algorithm>
#include <cctype>

using namespace polystore;

namespace {

size_t count_pg_placeholders(const std::string& sql) {
    size_t n = 0;
    for (size_t i = 0; i + 1 < sql.size(); ++i) {
        if (sql[i] == '$' && std::isdigit(static_cast<unsigned char>(sql[i + 1]))) ++n;
    }
    return n;
}

JsonValue obj(std::initializer_list<std::pair<const char*, JsonValue>> fields) {
    JsonValue out = JsonValue::object();
    for (const auto& [k, v] : fields) out.set(k, v);
    return out;
}

} // namespace

TEST_CASE("SqlCompiler: select with where, order, limit and offset", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    const auto desc = QueryBuilder().select({"id", "name"}).from("users")
        .where("active", true).where("role", "admin")
        .order_by("name", "DESC").limit(10).offset(20).descriptor();

    auto stmt = pg.compile(desc);
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql ==
          "SELECT id, name FROM users WHERE active = $1 AND role = $2 ORDER BY name DESC LIMIT 10 OFFSET 20");
    REQUIRE(stmt.value().params.size() == 2);
    CHECK(stmt.value().params[0] == "true");
    CHECK(stmt.value().params[1] == "admin");
}

TEST_CASE("SqlCompiler: MySQL uses positional placeholders and 1/0 booleans", "[compiler]") {
    const SqlCompiler my(SqlDialect::MYSQL);
    const auto desc = QueryBuilder().select().from("users").where("active", false).descriptor();

    auto stmt = my.compile(desc);
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql == "SELECT * FROM users WHERE active = ?");
    CHECK(stmt.value().params[0] == "0");
}

TEST_CASE("SqlCompiler: null predicate renders IS NULL without a parameter", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    auto stmt = pg.compile(QueryBuilder().select().from("users")
        .where("deleted_at", JsonValue{}).where("org", 7).descriptor());
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql == "SELECT * FROM users WHERE deleted_at IS NULL AND org = $1");
    REQUIRE(stmt.value().params.size() == 1);
    CHECK(stmt.value().params[0] == "7");
}

TEST_CASE("SqlCompiler: insert renders columns, placeholders and RETURNING", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    auto stmt = pg.compile(QueryBuilder()
        .insert(obj({{"email", "ada@example.com"}, {"name", "Ada"}}))
        .into("users").returning().descriptor());
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql == "INSERT INTO users (email, name) VALUES ($1, $2) RETURNING *");
    CHECK(stmt.value().params.size() == 2);
}

TEST_CASE("SqlCompiler: MySQL drops RETURNING from the statement", "[compiler]") {
    const SqlCompiler my(SqlDialect::MYSQL);
    auto stmt = my.compile(QueryBuilder().insert_into("users", obj({{"name", "Ada"}}))
        .returning().descriptor());
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql == "INSERT INTO users (name) VALUES (?)");
}

TEST_CASE("SqlCompiler: bulk insert numbers every row", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    JsonValue rows = JsonValue::array();
    rows.push_back(obj({{"name", "a"}}));
    rows.push_back(obj({{"name", "b"}}));
    auto stmt = pg.compile(QueryBuilder().insert_into("users", rows).descriptor());
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql == "INSERT INTO users (name) VALUES ($1), ($2)");
}

TEST_CASE("SqlCompiler: update continues placeholder numbering into WHERE", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    auto stmt = pg.compile(QueryBuilder()
        .update(obj({{"email", "x@example.com"}, {"name", "Bea"}}))
        .table("users").where("id", 42).where("org", "acme").descriptor());
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql == "UPDATE users SET email = $1, name = $2 WHERE id = $3 AND org = $4");

    // placeholder count equals the number of bound values
    CHECK(count_pg_placeholders(stmt.value().sql) == stmt.value().params.size());
    CHECK(stmt.value().params[2] == "42");
    CHECK(stmt.value().params[3] == "acme");
}

TEST_CASE("SqlCompiler: placeholder count matches parameters across shapes", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    const std::vector<QueryDescriptor> shapes = {
        QueryBuilder().select().from("t").where("a", 1).where("b", "x").descriptor(),
        QueryBuilder().select({"COUNT(*) AS total"}).from("t").group_by({"a"})
            .having(obj({{"COUNT(*)", 3}})).descriptor(),
        QueryBuilder().insert_into("t", obj({{"a", 1}, {"b", 2}, {"c", 3}})).descriptor(),
        QueryBuilder().update(obj({{"a", 1}})).table("t").where("b", 2).where("c", 3).descriptor(),
        QueryBuilder().remove().from("t").where("id", 9).descriptor(),
    };
    for (const auto& desc : shapes) {
        auto stmt = pg.compile(desc);
        REQUIRE(stmt.is_ok());
        CHECK(count_pg_placeholders(stmt.value().sql) == stmt.value().params.size());
    }
}

TEST_CASE("SqlCompiler: joins and group by", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    auto stmt = pg.compile(QueryBuilder().select({"users.name", "COUNT(orders.id) AS orders"})
        .from("users").left_join("orders", "users.id", "orders.user_id")
        .group_by({"users.name"}).descriptor());
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql ==
          "SELECT users.name, COUNT(orders.id) AS orders FROM users "
          "LEFT JOIN orders ON users.id = orders.user_id GROUP BY users.name");
}

TEST_CASE("SqlCompiler: first() renders LIMIT 1", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    auto stmt = pg.compile(QueryBuilder().select().from("users").limit(50).first().descriptor());
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value().sql == "SELECT * FROM users LIMIT 1");
}

TEST_CASE("SqlCompiler: rejections", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);

    SECTION("unset operation kind") {
        QueryDescriptor desc;
        desc.collection = "users";
        auto stmt = pg.compile(desc);
        REQUIRE(stmt.is_error());
        CHECK(stmt.error_category() == ErrorCategory::UNSUPPORTED_OPERATION);
    }

    SECTION("injected identifiers") {
        for (const auto& desc : {
                 QueryBuilder().select().from("users; DROP TABLE users").descriptor(),
                 QueryBuilder().select({"name FROM secrets --"}).from("users").descriptor(),
                 QueryBuilder().select().from("users").order_by("name; --").descriptor(),
                 QueryBuilder().select().from("users").where("a OR 1=1", 1).descriptor()}) {
            auto stmt = pg.compile(desc);
            REQUIRE(stmt.is_error());
            CHECK(stmt.error_category() == ErrorCategory::VALIDATION_ERROR);
        }
    }

    SECTION("unbounded writes") {
        auto upd = pg.compile(QueryBuilder().update(obj({{"a", 1}})).table("t").descriptor());
        CHECK(upd.error_category() == ErrorCategory::VALIDATION_ERROR);
        auto del = pg.compile(QueryBuilder().remove().from("t").descriptor());
        CHECK(del.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    SECTION("empty payload") {
        auto ins = pg.compile(QueryBuilder().insert_into("t", JsonValue::object()).descriptor());
        CHECK(ins.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    SECTION("aggregate pipeline") {
        auto agg = pg.compile(QueryBuilder().from("t").aggregate(JsonValue::array()).descriptor());
        CHECK(agg.error_category() == ErrorCategory::UNSUPPORTED_OPERATION);
    }
}

TEST_CASE("SqlCompiler: parameter rendering", "[compiler]") {
    const SqlCompiler pg(SqlDialect::POSTGRESQL);
    CHECK(pg.to_param(JsonValue(5)) == "5");
    CHECK(pg.to_param(JsonValue(2.5)) == "2.5");
    CHECK(pg.to_param(JsonValue("text")) == "text");
    CHECK_FALSE(pg.to_param(JsonValue{}).has_value());
    CHECK(pg.to_param(obj({{"k", 1}})) == "{\"k\":1}");

    // Whole numbers past 2^53 are never narrowed to a 64-bit integer
    CHECK(pg.to_param(JsonValue(9007199254740992.0)) == "9007199254740992");
    const auto huge = pg.to_param(JsonValue(1e300));
    REQUIRE(huge.has_value());
    CHECK(huge->find_first_of("eE") != std::string::npos);
    CHECK(huge->front() != '-');
}
