#include "schema/schema_manager.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace polystore {

namespace {

bool value_matches_type(const JsonValue& value, SemanticType type) {
    switch (type) {
        case SemanticType::INTEGER:
        case SemanticType::BIGINT:
            return value.is_number_integer();
        case SemanticType::FLOAT:
        case SemanticType::DOUBLE:
            return value.is_number();
        case SemanticType::UUID:
            return value.is_string() && utils::is_uuid(value.get<std::string>());
        case SemanticType::BOOLEAN:
            return value.is_boolean();
        case SemanticType::JSON:
            return true;
        default:
            return value.is_string();
    }
}

/// Filled in by the store when absent
bool is_generated(const FieldDescriptor& field) {
    return field.has_default() || field.auto_increment ||
           (field.primary_key && field.type == SemanticType::UUID);
}

} // namespace

SchemaManager::SchemaManager(ConnectionRegistry& registry, const SchemaManagementConfig& config)
    : registry_(registry), config_(config) {}

Result<SchemaApplyResult> SchemaManager::create_schema(const std::string& provider,
                                                       const SchemaDescriptor& schema) {
    using R = Result<SchemaApplyResult>;

    const auto valid = schema.validate();
    if (valid.is_error()) return R::propagate(valid);

    auto executor = registry_.executor(provider);
    if (executor.is_error()) return R::propagate(executor);

    auto applied = executor.value()->ensure_schema(schema);

    SchemaSnapshot snapshot;
    snapshot.provider = provider;
    snapshot.table = schema.name;
    if (applied.is_ok()) {
        snapshot.statements = applied.value().statements;
        snapshot.status = std::string{schema_status::kApplied};
    } else {
        snapshot.status = std::string{schema_status::kFailed};
        snapshot.message = applied.error_message();
    }
    record(std::move(snapshot));

    if (applied.is_error()) {
        utils::log::error(std::format("Schema '{}' on '{}' failed: {}",
            schema.name, provider, applied.error_message()));
        return applied;
    }

    {
        std::unique_lock lock(mutex_);
        catalog_[{provider, schema.name}] = schema;
    }
    utils::log::info(std::format("Schema '{}' ensured on '{}' ({} statements)",
        schema.name, provider, applied.value().statements.size()));
    return applied;
}

Status SchemaManager::register_schema(const std::string& provider, const SchemaDescriptor& schema) {
    const auto valid = schema.validate();
    if (valid.is_error()) return valid;
    std::unique_lock lock(mutex_);
    catalog_[{provider, schema.name}] = schema;
    return Status::ok();
}

std::optional<SchemaDescriptor> SchemaManager::find_schema(const std::string& provider,
                                                           const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto it = catalog_.find({provider, name});
    if (it == catalog_.end()) return std::nullopt;
    return it->second;
}

std::vector<SchemaDescriptor> SchemaManager::schemas(const std::string& provider) const {
    std::shared_lock lock(mutex_);
    std::vector<SchemaDescriptor> out;
    for (const auto& [key, schema] : catalog_) {
        if (key.first == provider) out.push_back(schema);
    }
    return out;
}

Status SchemaManager::validate_record(const std::string& provider, const std::string& name,
                                      const JsonValue& record, bool partial) const {
    auto fail = [](std::string msg) {
        return Status::error(ErrorCategory::VALIDATION_ERROR, std::move(msg));
    };

    const auto schema = find_schema(provider, name);
    if (!schema) {
        return Status::error(ErrorCategory::NOT_FOUND,
            std::format("schema '{}' is not registered for provider '{}'", name, provider));
    }
    if (!record.is_object()) {
        return fail(std::format("'{}' record must be a JSON object", name));
    }
    if (record.empty()) {
        return fail(std::format("'{}' record has no fields", name));
    }

    for (const auto& [key, value] : record.items()) {
        const auto* field = schema->find_field(key);
        if (!field) {
            return fail(std::format("unknown field '{}' for '{}'", key, name));
        }
        if (value.is_null()) {
            if (!field->nullable) return fail(std::format("field '{}' must not be null", key));
            continue;
        }
        if (!value_matches_type(value, field->type)) {
            return fail(std::format("field '{}' expects a {} value", key,
                semantic_type_to_string(field->type)));
        }
    }

    if (!partial) {
        for (const auto& field : schema->fields) {
            if (field.nullable || is_generated(field)) continue;
            if (!record.contains(field.name)) {
                return fail(std::format("missing required field '{}' for '{}'", field.name, name));
            }
        }
    }
    return Status::ok();
}

void SchemaManager::record(SchemaSnapshot snapshot) {
    std::unique_lock lock(mutex_);
    history_.emplace_back(std::move(snapshot));

    // Bounded history
    while (history_.size() > config_.max_history_entries) {
        history_.pop_front();
    }
}

std::vector<SchemaSnapshot> SchemaManager::get_history(const std::string& provider,
    const std::string& table, size_t limit) const {
    std::shared_lock lock(mutex_);
    std::vector<SchemaSnapshot> result;
    result.reserve(std::min(limit, history_.size()));

    // Newest first
    for (auto it = history_.rbegin(); it != history_.rend() && result.size() < limit; ++it) {
        if (!provider.empty() && it->provider != provider) continue;
        if (!table.empty() && it->table != table) continue;
        result.push_back(*it);
    }
    return result;
}

size_t SchemaManager::history_size() const {
    std::shared_lock lock(mutex_);
    return history_.size();
}

} // namespace polystore
