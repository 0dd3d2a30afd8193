#pragma once

#include "api/api_types.hpp"
#include "core/error.hpp"
#include "core/json.hpp"
#include "query/query_builder.hpp"
#include "realtime/change_notifier.hpp"
#include "schema/schema_descriptor.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace polystore {

struct ListPage {
    std::vector<JsonValue> items;
    int64_t page = 1;
    int64_t limit = 10;
    int64_t total = 0;

    /// {"data":[...],"pagination":{"page":1,"limit":10,"total":42}}
    [[nodiscard]] JsonValue to_json() const;
};

/**
 * @brief CRUD over one entity, shared by the REST and GraphQL surfaces
 *
 * Writes are checked against the registered Schema Descriptor first and
 * each successful write publishes exactly once to
 * "<entity>:<created|updated|deleted>".
 */
class EntityService {
public:
    EntityService(ApiContext context, std::string provider, SchemaDescriptor schema);

    [[nodiscard]] const std::string& entity() const { return schema_.name; }
    [[nodiscard]] const std::string& provider() const { return provider_; }
    [[nodiscard]] const std::string& id_field() const { return id_field_; }
    [[nodiscard]] const SchemaDescriptor& schema() const { return schema_; }

    /// VALIDATION_ERROR for page < 1, limit outside 1..max_limit or unknown filters
    [[nodiscard]] Result<ListPage> list(int64_t page, int64_t limit, const JsonValue& filters) const;

    /// NOT_FOUND when no record has the id
    [[nodiscard]] Result<JsonValue> get(const std::string& id) const;

    [[nodiscard]] Result<JsonValue> create(const JsonValue& data) const;

    [[nodiscard]] Result<JsonValue> update(const std::string& id, const JsonValue& data) const;

    [[nodiscard]] Status remove(const std::string& id) const;

    /**
     * @brief Convert text (path segment, query string) to the field's JSON type
     *
     * Integers, floats and booleans are parsed; anything else stays text.
     * VALIDATION_ERROR for an unknown field or unparsable number.
     */
    [[nodiscard]] Result<JsonValue> coerce(const std::string& field, const std::string& text) const;

    /// Turn string-valued filters into typed predicates
    [[nodiscard]] Result<JsonValue> coerce_filters(const std::map<std::string, std::string>& params) const;

private:
    [[nodiscard]] Result<QueryBuilder> query() const;
    [[nodiscard]] Result<JsonValue> id_value(const std::string& id) const;
    [[nodiscard]] Result<int64_t> count(const QueryBuilder& builder, const JsonValue& filters) const;

    void after_write(LifecycleEvent event, const JsonValue& payload) const;

    ApiContext context_;
    std::string provider_;
    SchemaDescriptor schema_;
    std::string id_field_;
};

} // namespace polystore
