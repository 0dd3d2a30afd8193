#pragma once

#include "core/json.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace polystore {

// ============================================================================
// Operation kinds
// ============================================================================

enum class OperationKind {
    NONE,
    SELECT,
    INSERT,
    UPDATE,
    DELETE
};

[[nodiscard]] inline std::string_view operation_kind_to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::SELECT: return "select";
        case OperationKind::INSERT: return "insert";
        case OperationKind::UPDATE: return "update";
        case OperationKind::DELETE: return "delete";
        default: return "none";
    }
}

[[nodiscard]] inline bool is_write(OperationKind kind) {
    return kind == OperationKind::INSERT || kind == OperationKind::UPDATE ||
           kind == OperationKind::DELETE;
}

// ============================================================================
// Query output
// ============================================================================

/**
 * @brief Provider-independent result of executing one Query Descriptor
 *
 * Rows are JSON objects regardless of provider. When the descriptor carried
 * the single-row flag, at most one row is present and record() yields it
 * (or null when nothing matched).
 */
struct QueryOutput {
    std::vector<JsonValue> rows;
    uint64_t affected_rows = 0;
    bool single = false;
    bool from_cache = false;
    std::chrono::microseconds execution_time{0};

    [[nodiscard]] JsonValue record() const {
        return rows.empty() ? JsonValue{} : rows.front();
    }

    /// Null or object for single-row reads, array otherwise
    [[nodiscard]] JsonValue to_json() const {
        if (single) return record();
        JsonValue arr = JsonValue::array();
        for (const auto& row : rows) arr.push_back(row);
        return arr;
    }
};

} // namespace polystore
