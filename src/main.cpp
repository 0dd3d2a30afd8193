#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "engine/data_engine.hpp"
#include "engine/signal_watcher.hpp"
#include "schema/schema_descriptor.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>

using namespace polystore;

// Set by the signal handler; a SignalWatcher does the actual stopping
volatile std::sig_atomic_t g_stop_signal = 0;

void signal_handler(int signal) {
    g_stop_signal = signal;
}

// =========================================================================
// Entity list: [{"provider": "main", "schema": {...}}, ...]
// =========================================================================

static Status expose_entities(DataEngine& engine, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Status::error(ErrorCategory::VALIDATION_ERROR,
            std::format("cannot open schema file {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    JsonValue entries;
    try {
        entries = JsonValue::parse(buffer.str());
    } catch (const JsonValue::parse_error& e) {
        return Status::error(ErrorCategory::VALIDATION_ERROR,
            std::format("schema file {} is not valid JSON: {}", path, e.what()));
    }
    if (!entries.is_array()) {
        return Status::error(ErrorCategory::VALIDATION_ERROR,
            std::format("schema file {} must contain a JSON array", path));
    }

    for (const auto& entry : entries.elements()) {
        const auto provider = entry.value<std::string>("provider", "");
        const auto schema = SchemaDescriptor::from_json(
            entry["schema"].is_object() ? entry["schema"] : entry);
        if (schema.is_error()) return Status::propagate(schema);

        const auto applied = engine.create_schema(provider, schema.value());
        if (applied.is_error()) return Status::propagate(applied);

        const auto exposed = engine.expose(provider, schema.value());
        if (exposed.is_error()) return Status::propagate(exposed);

        utils::log::info(std::format("Entity '{}' on '{}': {} REST routes{}",
            schema.value().name, exposed.value().provider, exposed.value().routes.size(),
            exposed.value().graphql ? ", GraphQL resolvers" : ""));
    }
    return Status::ok();
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("polystore starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/polystore.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return EXIT_FAILURE;
        }
        utils::log::set_level(config_result.config.logging.level);

        const auto schema_file = config_result.config.engine.schema_file;
        DataEngine engine(std::move(config_result.config));

        utils::log::info("[2/4] Initializing engine");
        const auto initialized = engine.initialize();
        if (initialized.is_error()) {
            utils::log::error(std::format("{}: {}",
                error_category_to_string(initialized.error_category()),
                initialized.error_message()));
            return EXIT_FAILURE;
        }

        if (!schema_file.empty()) {
            utils::log::info(std::format("[3/4] Exposing entities from {}", schema_file));
            const auto exposed = expose_entities(engine, schema_file);
            if (exposed.is_error()) {
                utils::log::error(std::format("{}: {}",
                    error_category_to_string(exposed.error_category()), exposed.error_message()));
                engine.shutdown();
                return EXIT_FAILURE;
            }
        } else {
            utils::log::info("[3/4] No schema_file configured, serving health only");
        }

        const auto migrated = engine.run_migrations();
        if (migrated.is_error()) {
            utils::log::error(migrated.error_message());
            engine.shutdown();
            return EXIT_FAILURE;
        }

        utils::log::info(std::format("[4/4] Serving HTTP on {}:{}{}",
            engine.config().server.host, engine.config().server.port,
            engine.config().realtime.enabled
                ? std::format(", realtime on {}:{}", engine.config().realtime.host,
                              engine.config().realtime.port)
                : std::string{}));

        {
            SignalWatcher watcher(g_stop_signal, [&engine](int signal) {
                utils::log::info(std::format("Received signal {}, shutting down...", signal));
                engine.stop();
            });
            if (g_stop_signal == 0) engine.serve();
        }

        engine.shutdown();
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
