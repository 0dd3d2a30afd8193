#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "realtime/change_notifier.hpp"

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace polystore {

struct GraphQLConfig {
    bool enabled = true;
    std::string endpoint = "/graphql";
    uint32_t max_query_depth = 5;
    bool mutations_enabled = true;
};

enum class GraphQLOperationType { QUERY, MUTATION, SUBSCRIPTION };

// Parsed GraphQL field selection
struct GraphQLField {
    std::string name;
    std::string alias;                      // response key; defaults to name
    JsonValue arguments = JsonValue::object();
    std::vector<GraphQLField> sub_fields;   // Nested selections

    [[nodiscard]] const std::string& response_key() const { return alias.empty() ? name : alias; }
};

// Parsed GraphQL operation
struct GraphQLOperation {
    GraphQLOperationType type = GraphQLOperationType::QUERY;
    std::string name;
    std::vector<GraphQLField> fields;       // root fields
};

using GraphQLResolver = std::function<Result<JsonValue>(const JsonValue& args)>;

/**
 * @brief Executes GraphQL documents against generated resolvers
 *
 * Handles single-operation documents such as
 *   query { users(page: 1, limit: 10) { id name } }
 *   mutation { createUser(input: {name: "Ada"}) { id } }
 *   subscription { userCreated { id } }
 * Arguments may reference variables ($name). Responses follow the
 * GraphQL shape: {"data":{...}} and/or {"errors":[{message, path,
 * extensions:{category}}]}.
 */
class GraphQLHandler {
public:
    explicit GraphQLHandler(ChangeNotifier& notifier, const GraphQLConfig& config = {});

    void add_query(const std::string& field, GraphQLResolver resolver);
    void add_mutation(const std::string& field, GraphQLResolver resolver);
    void add_subscription(const std::string& field, std::string channel);
    void add_sdl(std::string sdl);

    // Parse a GraphQL document into its single operation
    [[nodiscard]] Result<GraphQLOperation> parse(const std::string& document,
                                                 const JsonValue& variables = {}) const;

    // Execute a query/mutation and return the JSON response
    [[nodiscard]] JsonValue execute(const std::string& document,
                                    const JsonValue& variables = {}) const;

    /// Subscription documents resolve to a handle on the mapped channel
    [[nodiscard]] Result<std::shared_ptr<Subscription>> subscribe(const std::string& document,
                                                                  const JsonValue& variables = {}) const;

    /// Channel mapped to a subscription field, empty when unknown
    [[nodiscard]] std::string channel_for(const std::string& field) const;

    /// Concatenated SDL of every generated entity
    [[nodiscard]] std::string sdl() const;

    [[nodiscard]] const GraphQLConfig& config() const { return config_; }

    // Keep only the selected keys (recursively) of a resolved value
    [[nodiscard]] static JsonValue project(const JsonValue& value,
                                           const std::vector<GraphQLField>& selection);

    [[nodiscard]] static JsonValue error_response(ErrorCategory category, const std::string& message);

private:
    ChangeNotifier& notifier_;
    GraphQLConfig config_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, GraphQLResolver> queries_;
    std::map<std::string, GraphQLResolver> mutations_;
    std::map<std::string, std::string> subscriptions_;
    std::vector<std::string> sdl_;
};

} // namespace polystore
