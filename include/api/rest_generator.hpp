#pragma once

#include "api/api_types.hpp"
#include "api/entity_service.hpp"
#include "core/error.hpp"
#include "schema/schema_descriptor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace polystore {

struct RestRoute {
    std::string method;     // GET, POST, PUT, DELETE
    std::string path;       // "/api/users" or "/api/users/:id"
    RestHandler handler;
};

/**
 * @brief Derives list/get/create/update/delete handlers from a Schema Descriptor
 *
 *   GET    {base}/{entity}?page&limit&<filters>  -> 200 {data, pagination}
 *   GET    {base}/{entity}/:id                   -> 200 {data} | 404
 *   POST   {base}/{entity}                       -> 201 {data}
 *   PUT    {base}/{entity}/:id                   -> 200 {data} | 404
 *   DELETE {base}/{entity}/:id                   -> 204 | 404
 */
class RestGenerator {
public:
    explicit RestGenerator(ApiContext context) : context_(std::move(context)) {}

    /// Registers the schema with the Schema Manager when it is not yet known
    [[nodiscard]] Result<std::vector<RestRoute>> generate(const std::string& provider,
                                                          const SchemaDescriptor& schema) const;

    /// Handlers over an existing service, without catalog side effects
    [[nodiscard]] std::vector<RestRoute> routes_for(std::shared_ptr<const EntityService> service) const;

    [[nodiscard]] static RestHandler list_handler(std::shared_ptr<const EntityService> service,
                                                  const ApiConfig& config);
    [[nodiscard]] static RestHandler get_handler(std::shared_ptr<const EntityService> service);
    [[nodiscard]] static RestHandler create_handler(std::shared_ptr<const EntityService> service);
    [[nodiscard]] static RestHandler update_handler(std::shared_ptr<const EntityService> service);
    [[nodiscard]] static RestHandler delete_handler(std::shared_ptr<const EntityService> service);

private:
    ApiContext context_;
};

} // namespace polystore
