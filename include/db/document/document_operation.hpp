#pragma once

#include "core/json.hpp"
#include "query/query_descriptor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polystore {

/// Operation a document driver performs
enum class DocumentAction {
    FIND,
    FIND_ONE,
    INSERT_ONE,
    INSERT_MANY,
    UPDATE_ONE,
    UPDATE_MANY,
    DELETE_ONE,
    DELETE_MANY,
    AGGREGATE,
};

[[nodiscard]] inline std::string_view document_action_to_string(DocumentAction action) {
    switch (action) {
        case DocumentAction::FIND: return "find";
        case DocumentAction::FIND_ONE: return "findOne";
        case DocumentAction::INSERT_ONE: return "insertOne";
        case DocumentAction::INSERT_MANY: return "insertMany";
        case DocumentAction::UPDATE_ONE: return "updateOne";
        case DocumentAction::UPDATE_MANY: return "updateMany";
        case DocumentAction::DELETE_ONE: return "deleteOne";
        case DocumentAction::DELETE_MANY: return "deleteMany";
        case DocumentAction::AGGREGATE: return "aggregate";
        default: return "unknown";
    }
}

struct DocumentOptions {
    std::vector<OrderClause> sort;
    std::optional<int64_t> skip;
    std::optional<int64_t> limit;
    std::vector<std::string> projection;    // empty = whole document
};

/**
 * @brief Document-family rendition of a QueryDescriptor
 *
 * `query` is an equality filter object; `data` is the inserted document(s)
 * or the field set merged into matching documents.
 */
struct DocumentOperation {
    std::string collection;
    DocumentAction action = DocumentAction::FIND;
    JsonValue query = JsonValue::object();
    JsonValue data;
    DocumentOptions options;
    JsonValue pipeline;

    [[nodiscard]] JsonValue to_json() const {
        JsonValue out = JsonValue::object();
        out.set("collection", collection);
        out.set("action", std::string(document_action_to_string(action)));
        out.set("query", query);
        out.set("data", data);
        out.set("pipeline", pipeline);
        return out;
    }
};

/// Outcome reported by a driver
struct DocumentResult {
    std::vector<JsonValue> documents;   // matched, inserted, post-update or deleted documents
    uint64_t affected = 0;
};

} // namespace polystore
