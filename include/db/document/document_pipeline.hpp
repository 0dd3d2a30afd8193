#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "db/document/document_operation.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace polystore {

/**
 * @brief In-process evaluation of document filters, options and pipelines
 *
 * Shared by the drivers so filter, sort and aggregate semantics are the
 * same whether documents live in memory or come back from a JSONB table.
 *
 * Supported stages: $match, $sort, $skip, $limit, $project, $count and
 * $group with $sum, $count, $avg, $min and $max accumulators.
 */
class DocumentPipeline {
public:
    /// Value at a dotted path ("address.city"); null when absent
    [[nodiscard]] static JsonValue lookup(const JsonValue& doc, std::string_view path);

    /// Equality match of every filter key; a null filter value also matches absence
    [[nodiscard]] static bool matches(const JsonValue& doc, const JsonValue& filter);

    /// Total order: null < numbers < strings < objects < arrays < booleans
    [[nodiscard]] static int compare(const JsonValue& a, const JsonValue& b);

    static void sort(std::vector<JsonValue>& docs, const std::vector<OrderClause>& order);

    [[nodiscard]] static JsonValue project(const JsonValue& doc,
                                           const std::vector<std::string>& fields);

    /// sort, then skip, then limit, then projection
    [[nodiscard]] static std::vector<JsonValue> apply_options(std::vector<JsonValue> docs,
                                                              const DocumentOptions& options);

    [[nodiscard]] static Result<std::vector<JsonValue>> run(std::vector<JsonValue> docs,
                                                            const JsonValue& pipeline);

    /// Leading $match stage of a pipeline, or an empty filter
    [[nodiscard]] static JsonValue leading_match(const JsonValue& pipeline);

private:
    static Result<std::vector<JsonValue>> group(const std::vector<JsonValue>& docs,
                                                const JsonValue& spec);
    static Result<std::vector<JsonValue>> project_stage(const std::vector<JsonValue>& docs,
                                                        const JsonValue& spec);
};

} // namespace polystore
