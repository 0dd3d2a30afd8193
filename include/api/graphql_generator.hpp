#pragma once

#include "api/api_types.hpp"
#include "api/entity_service.hpp"
#include "api/graphql_handler.hpp"
#include "core/error.hpp"
#include "schema/schema_descriptor.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace polystore {

/// Root field names generated for one entity
struct GraphQLEntity {
    std::string type_name;          // User
    std::string list_field;         // users
    std::string get_field;          // user
    std::string create_field;       // createUser
    std::string update_field;       // updateUser
    std::string delete_field;       // deleteUser
    std::vector<std::pair<std::string, std::string>> subscriptions;  // userCreated -> users:created
    std::string sdl;
};

/**
 * @brief Derives GraphQL resolvers and SDL from a Schema Descriptor
 *
 * Query.<entity>s / Query.<entity>, Mutation.create/update/delete<Entity>,
 * Subscription.<entity>Created/Updated/Deleted mapped to the lifecycle
 * channels.
 */
class GraphQLGenerator {
public:
    explicit GraphQLGenerator(ApiContext context) : context_(std::move(context)) {}

    /// Registers the schema when unknown and installs resolvers into the handler
    [[nodiscard]] Result<GraphQLEntity> generate(const std::string& provider,
                                                 const SchemaDescriptor& schema,
                                                 GraphQLHandler& handler) const;

    [[nodiscard]] static GraphQLEntity names_for(const SchemaDescriptor& schema);

    [[nodiscard]] static std::string sdl_for(const SchemaDescriptor& schema);

private:
    ApiContext context_;
};

} // namespace polystore
