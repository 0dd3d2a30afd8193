#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace polystore {

enum class JoinType { INNER, LEFT };

struct JoinClause {
    JoinType type = JoinType::INNER;
    std::string table;
    std::string left;       // "users.id"
    std::string right;      // "orders.user_id"
};

struct OrderClause {
    std::string column;
    bool descending = false;
};

/// Equality conjunction in insertion order; a key appears at most once
using PredicateList = std::vector<std::pair<std::string, JsonValue>>;

/**
 * @brief Provider-agnostic description of one operation
 *
 * Built by QueryBuilder, compiled by SqlCompiler or DocumentCompiler.
 * `pipeline` is only meaningful for document providers (aggregate).
 */
struct QueryDescriptor {
    OperationKind kind = OperationKind::NONE;
    std::string collection;
    std::vector<std::string> columns;       // empty = all
    PredicateList predicates;
    std::vector<JoinClause> joins;
    std::vector<OrderClause> order;
    std::vector<std::string> group_by;
    PredicateList having;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    JsonValue data;                         // object, or array of objects for bulk insert
    std::vector<std::string> returning;
    JsonValue pipeline;                     // aggregate stages, null when unused
    bool single = false;
    bool cache = false;

    /// First builder error, reported at execute()
    std::optional<std::pair<ErrorCategory, std::string>> error;

    /**
     * @brief Deterministic JSON form, used for cache keys and logging
     *
     * Equal descriptors always serialize to the same text.
     */
    [[nodiscard]] JsonValue to_json() const {
        JsonValue out = JsonValue::object();
        out.set("kind", std::string(operation_kind_to_string(kind)));
        out.set("collection", collection);

        JsonValue cols = JsonValue::array();
        for (const auto& c : columns) cols.push_back(c);
        out.set("columns", std::move(cols));

        auto predicates_json = [](const PredicateList& list) {
            JsonValue arr = JsonValue::array();
            for (const auto& [key, value] : list) {
                JsonValue pair = JsonValue::array();
                pair.push_back(key);
                pair.push_back(value);
                arr.push_back(std::move(pair));
            }
            return arr;
        };
        out.set("where", predicates_json(predicates));
        out.set("having", predicates_json(having));

        JsonValue joins_json = JsonValue::array();
        for (const auto& j : joins) {
            JsonValue jj = JsonValue::array();
            jj.push_back(j.type == JoinType::LEFT ? "left" : "inner");
            jj.push_back(j.table);
            jj.push_back(j.left);
            jj.push_back(j.right);
            joins_json.push_back(std::move(jj));
        }
        out.set("joins", std::move(joins_json));

        JsonValue order_json = JsonValue::array();
        for (const auto& o : order) {
            order_json.push_back(o.column + (o.descending ? " DESC" : " ASC"));
        }
        out.set("order", std::move(order_json));

        JsonValue group = JsonValue::array();
        for (const auto& g : group_by) group.push_back(g);
        out.set("group", std::move(group));

        out.set("limit", limit ? JsonValue(static_cast<long long>(*limit)) : JsonValue{});
        out.set("offset", offset ? JsonValue(static_cast<long long>(*offset)) : JsonValue{});
        out.set("data", data);
        out.set("pipeline", pipeline);
        out.set("single", single);
        return out;
    }
};

} // namespace polystore
