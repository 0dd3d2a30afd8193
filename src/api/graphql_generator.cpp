#include "api/graphql_generator.hpp"
#include "core/utils.hpp"
#include "schema/schema_manager.hpp"

#include <cctype>
#include <format>

namespace polystore {

namespace {

/// users -> user; names without a trailing s stay as they are
std::string singular(const std::string& name) {
    if (name.size() > 1 && name.back() == 's' && !name.ends_with("ss")) {
        return name.substr(0, name.size() - 1);
    }
    return name;
}

/// order_items -> OrderItem
std::string pascal_case(const std::string& name) {
    std::string out;
    for (const auto& part : utils::split(name, '_')) {
        out += utils::capitalize(part);
    }
    return out;
}

std::string camel_case(const std::string& name) {
    auto out = pascal_case(name);
    if (!out.empty()) out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    return out;
}

std::string graphql_type(const FieldDescriptor& field) {
    if (field.primary_key) return "ID";
    switch (field.type) {
        case SemanticType::INTEGER:
        case SemanticType::BIGINT: return "Int";
        case SemanticType::FLOAT:
        case SemanticType::DOUBLE: return "Float";
        case SemanticType::BOOLEAN: return "Boolean";
        case SemanticType::UUID: return "ID";
        case SemanticType::JSON: return "JSON";
        default: return "String";
    }
}

bool is_generated(const FieldDescriptor& field) {
    return field.has_default() || field.auto_increment ||
           (field.primary_key && field.type == SemanticType::UUID);
}

/// Argument value as the text the entity service coerces
std::string id_text(const JsonValue& args) {
    const auto id = args["id"];
    return id.is_null() ? std::string{} : id.to_text();
}

} // namespace

GraphQLEntity GraphQLGenerator::names_for(const SchemaDescriptor& schema) {
    const auto one = camel_case(singular(schema.name));
    auto many = camel_case(schema.name);
    if (many == one) many += "s";

    GraphQLEntity names;
    names.type_name = pascal_case(singular(schema.name));
    names.list_field = many;
    names.get_field = one;
    names.create_field = "create" + names.type_name;
    names.update_field = "update" + names.type_name;
    names.delete_field = "delete" + names.type_name;
    for (const auto event : {LifecycleEvent::CREATED, LifecycleEvent::UPDATED, LifecycleEvent::DELETED}) {
        names.subscriptions.emplace_back(
            one + utils::capitalize(std::string(lifecycle_event_to_string(event))),
            lifecycle_channel(schema.name, event));
    }
    return names;
}

std::string GraphQLGenerator::sdl_for(const SchemaDescriptor& schema) {
    const auto names = names_for(schema);
    std::string type_fields;
    std::string input_fields;
    std::string filter_args;

    for (const auto& field : schema.fields) {
        const auto type = graphql_type(field);
        type_fields += std::format("  {}: {}{}\n", field.name, type, field.nullable ? "" : "!");
        if (!(field.primary_key && is_generated(field))) {
            input_fields += std::format("  {}: {}\n", field.name, type);
        }
        filter_args += std::format(", {}: {}", field.name, type);
    }

    std::string sdl;
    sdl += std::format("type {} {{\n{}}}\n\n", names.type_name, type_fields);
    sdl += std::format("input {}Input {{\n{}}}\n\n", names.type_name, input_fields);
    sdl += std::format("extend type Query {{\n"
                       "  {}(page: Int, limit: Int{}): [{}!]!\n"
                       "  {}(id: ID!): {}\n"
                       "}}\n\n",
        names.list_field, filter_args, names.type_name, names.get_field, names.type_name);
    sdl += std::format("extend type Mutation {{\n"
                       "  {}(input: {}Input!): {}!\n"
                       "  {}(id: ID!, input: {}Input!): {}!\n"
                       "  {}(id: ID!): Boolean!\n"
                       "}}\n\n",
        names.create_field, names.type_name, names.type_name,
        names.update_field, names.type_name, names.type_name,
        names.delete_field);
    sdl += "extend type Subscription {\n";
    for (const auto& subscription : names.subscriptions) {
        sdl += std::format("  {}: {}!\n", subscription.first, names.type_name);
    }
    sdl += "}\n";
    return sdl;
}

Result<GraphQLEntity> GraphQLGenerator::generate(const std::string& provider,
                                                 const SchemaDescriptor& schema,
                                                 GraphQLHandler& handler) const {
    using R = Result<GraphQLEntity>;

    if (!context_.schemas.find_schema(provider, schema.name)) {
        const auto registered = context_.schemas.register_schema(provider, schema);
        if (registered.is_error()) return R::propagate(registered);
    }

    auto service = std::make_shared<const EntityService>(context_, provider, schema);
    auto entity = names_for(schema);
    entity.sdl = sdl_for(schema);
    const int64_t default_limit = context_.config.default_limit;

    handler.add_query(entity.list_field, [service, default_limit](const JsonValue& args) {
        using LR = Result<JsonValue>;
        JsonValue filters = JsonValue::object();
        int64_t page = 1;
        int64_t limit = default_limit;
        for (const auto& [key, value] : args.items()) {
            if (key == http::kPageParam || key == http::kLimitParam) {
                const auto number = value.as_integer();
                if (!number) {
                    return LR::error(ErrorCategory::VALIDATION_ERROR,
                        std::format("{} must be an integer", key));
                }
                (key == http::kPageParam ? page : limit) = *number;
            } else {
                filters.set(key, value);
            }
        }
        const auto listed = service->list(page, limit, filters);
        if (listed.is_error()) return LR::propagate(listed);

        JsonValue items = JsonValue::array();
        for (const auto& item : listed.value().items) items.push_back(item);
        return LR::ok(std::move(items));
    });

    handler.add_query(entity.get_field, [service](const JsonValue& args) {
        return service->get(id_text(args));
    });

    handler.add_mutation(entity.create_field, [service](const JsonValue& args) {
        const auto input = args["input"];
        if (!input.is_object()) {
            return Result<JsonValue>::error(ErrorCategory::VALIDATION_ERROR, "input must be an object");
        }
        return service->create(input);
    });

    handler.add_mutation(entity.update_field, [service](const JsonValue& args) {
        const auto input = args["input"];
        if (!input.is_object()) {
            return Result<JsonValue>::error(ErrorCategory::VALIDATION_ERROR, "input must be an object");
        }
        return service->update(id_text(args), input);
    });

    handler.add_mutation(entity.delete_field, [service](const JsonValue& args) {
        const auto removed = service->remove(id_text(args));
        if (removed.is_error()) return Result<JsonValue>::propagate(removed);
        return Result<JsonValue>::ok(JsonValue(true));
    });

    for (const auto& [field, channel] : entity.subscriptions) {
        handler.add_subscription(field, channel);
    }
    handler.add_sdl(entity.sdl);

    utils::log::info(std::format("Generated GraphQL resolvers for '{}' on '{}' ({}, {})",
        schema.name, provider, entity.list_field, entity.get_field));
    return R::ok(std::move(entity));
}

} // namespace polystore
