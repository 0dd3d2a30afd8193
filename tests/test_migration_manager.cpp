#include <catch2/catch_test_macros.hpp>
#include "db/connection_registry.hpp"
#include "db/document/document_executor.hpp"
#include "db/document/memory_document_driver.hpp"
#include "migration/migration_manager.hpp"
#include "mocks/mock_executor.hpp"

#include <stdexcept>

using namespace polystore;
using namespace polystore::testing;

namespace {

struct Harness {
    BackendRegistry backends;
    ConnectionRegistry registry{backends};
    SchemaManager schemas{registry};
    std::shared_ptr<MemoryDocumentDriver> driver = std::make_shared<MemoryDocumentDriver>();
    std::shared_ptr<DocumentExecutor> executor =
        std::make_shared<DocumentExecutor>("docs", ProviderKind::DOCUMENT, driver);

    Harness() { registry.attach(executor); }

    [[nodiscard]] MigrationManager manager(std::shared_ptr<IMigrationLedger> ledger) {
        return MigrationManager(std::move(ledger), MigrationContext(registry, schemas, "docs"));
    }
};

Migration counting(std::string id, int& runs) {
    Migration m;
    m.id = std::move(id);
    m.name = "count " + m.id;
    m.up = [&runs](MigrationContext&) {
        ++runs;
        return Status::ok();
    };
    return m;
}

} // namespace

TEST_CASE("MigrationManager: running twice applies once", "[migration]") {
    Harness h;
    auto ledger = std::make_shared<MemoryMigrationLedger>();
    int runs = 0;

    auto first = h.manager(ledger);
    REQUIRE(first.add_migration(counting("001", runs)).is_ok());
    auto report = first.run();
    REQUIRE(report.is_ok());
    CHECK(report.value().applied == std::vector<std::string>{"001"});
    CHECK(runs == 1);

    auto again = first.run();
    REQUIRE(again.is_ok());
    CHECK(again.value().applied.empty());
    CHECK(again.value().skipped == std::vector<std::string>{"001"});
    CHECK(runs == 1);

    // a fresh manager over the same ledger sees it as applied too
    auto second = h.manager(ledger);
    REQUIRE(second.add_migration(counting("001", runs)).is_ok());
    REQUIRE(second.run().is_ok());
    CHECK(runs == 1);
    CHECK(second.state("001") == MigrationState::APPLIED);
}

TEST_CASE("MigrationManager: actions run in registration order against the provider", "[migration]") {
    Harness h;
    auto manager = h.manager(std::make_shared<MemoryMigrationLedger>());
    std::vector<std::string> order;

    Migration create;
    create.id = "002";
    create.name = "create users";
    create.up = [&order](MigrationContext& ctx) {
        order.push_back("002");
        SchemaDescriptor s;
        s.name = "users";
        s.fields.push_back({.name = "name"});
        const auto applied = ctx.create_schema(s);
        return applied.is_ok() ? Status::ok() : Status::propagate(applied);
    };

    Migration seed;
    seed.id = "001";
    seed.name = "seed users";
    seed.up = [&order](MigrationContext& ctx) {
        order.push_back("001");
        JsonValue row = JsonValue::object();
        row.set("name", "admin");
        const auto inserted = ctx.query().insert_into("users", row).execute();
        return inserted.is_ok() ? Status::ok() : Status::propagate(inserted);
    };

    REQUIRE(manager.add_migration(create).is_ok());
    REQUIRE(manager.add_migration(seed).is_ok());
    REQUIRE(manager.run().is_ok());

    CHECK(order == std::vector<std::string>{"002", "001"});
    CHECK(h.driver->collection_size("users") == 1);
    CHECK(h.schemas.find_schema("docs", "users").has_value());
}

TEST_CASE("MigrationManager: first failure stops the run", "[migration]") {
    Harness h;
    auto ledger = std::make_shared<MemoryMigrationLedger>();
    auto manager = h.manager(ledger);
    int runs = 0;

    Migration broken;
    broken.id = "002";
    broken.name = "broken";
    broken.up = [](MigrationContext&) {
        return Status::error(ErrorCategory::DRIVER_ERROR, "column exists");
    };

    REQUIRE(manager.add_migration(counting("001", runs)).is_ok());
    REQUIRE(manager.add_migration(broken).is_ok());
    REQUIRE(manager.add_migration(counting("003", runs)).is_ok());

    auto result = manager.run();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::MIGRATION_FAILURE);
    CHECK(result.error_message().find("column exists") != std::string::npos);
    CHECK(runs == 1);

    CHECK(manager.state("001") == MigrationState::APPLIED);
    CHECK(manager.state("002") == MigrationState::FAILED);
    CHECK(manager.state("003") == MigrationState::PENDING);

    const auto report = manager.last_report();
    CHECK(report.failed == "002");
    CHECK(report.applied == std::vector<std::string>{"001"});
    CHECK(ledger->applied().value() == std::set<std::string>{"001"});
}

TEST_CASE("MigrationManager: thrown exceptions fail the migration", "[migration]") {
    Harness h;
    auto manager = h.manager(std::make_shared<MemoryMigrationLedger>());

    Migration throws;
    throws.id = "001";
    throws.up = [](MigrationContext&) -> Status { throw std::runtime_error("boom"); };
    REQUIRE(manager.add_migration(throws).is_ok());

    auto result = manager.run();
    REQUIRE(result.is_error());
    CHECK(result.error_message().find("boom") != std::string::npos);
    CHECK(manager.state("001") == MigrationState::FAILED);
}

TEST_CASE("MigrationManager: registration rules", "[migration]") {
    Harness h;
    auto manager = h.manager(std::make_shared<MemoryMigrationLedger>());
    int runs = 0;

    Migration no_up;
    no_up.id = "x";
    CHECK(manager.add_migration(no_up).error_category() == ErrorCategory::VALIDATION_ERROR);

    REQUIRE(manager.add_migration(counting("001", runs)).is_ok());
    CHECK(manager.add_migration(counting("001", runs)).error_category() ==
          ErrorCategory::VALIDATION_ERROR);

    // ids default to the registration timestamp, unique even within one millisecond
    REQUIRE(manager.add_migration(counting("", runs)).is_ok());
    REQUIRE(manager.add_migration(counting("", runs)).is_ok());
    const auto ids = manager.migration_ids();
    REQUIRE(ids.size() == 3);
    CHECK_FALSE(ids[1].empty());
    CHECK(ids[1] != ids[2]);
}

TEST_CASE("MigrationManager: rollback", "[migration]") {
    Harness h;
    auto ledger = std::make_shared<MemoryMigrationLedger>();
    auto manager = h.manager(ledger);
    int ups = 0;
    int downs = 0;

    Migration m = counting("001", ups);
    m.down = [&downs](MigrationContext&) {
        ++downs;
        return Status::ok();
    };
    REQUIRE(manager.add_migration(m).is_ok());
    REQUIRE(manager.add_migration(counting("002", ups)).is_ok());

    CHECK(manager.rollback("001").error_category() == ErrorCategory::VALIDATION_ERROR);

    REQUIRE(manager.run().is_ok());
    REQUIRE(manager.rollback("001").is_ok());
    CHECK(downs == 1);
    CHECK(manager.state("001") == MigrationState::PENDING);
    CHECK_FALSE(ledger->applied().value().contains("001"));

    CHECK(manager.rollback("002").error_category() == ErrorCategory::UNSUPPORTED_OPERATION);
    CHECK(manager.rollback("999").error_category() == ErrorCategory::NOT_FOUND);

    // rolled back migration runs again
    REQUIRE(manager.run().is_ok());
    CHECK(ups == 3);
}

// ============================================================================
// Ledgers
// ============================================================================

TEST_CASE("StoreMigrationLedger: persists applied ids in the target store", "[migration][ledger]") {
    Harness h;
    auto ledger = std::make_shared<StoreMigrationLedger>(h.executor);
    CHECK(ledger->kind() == "store");

    int runs = 0;
    auto manager = h.manager(ledger);
    REQUIRE(manager.add_migration(counting("001", runs)).is_ok());
    REQUIRE(manager.run().is_ok());
    CHECK(h.driver->collection_size("_migrations") == 1);

    auto rows = QueryBuilder(h.executor).select().from("_migrations").first().execute();
    REQUIRE(rows.is_ok());
    CHECK(rows.value().record()["name"].get<std::string>() == "count 001");
    CHECK(rows.value().record()["applied_at"].is_string());

    // a new ledger over the same store remembers it
    auto reopened = std::make_shared<StoreMigrationLedger>(h.executor);
    auto again = h.manager(reopened);
    REQUIRE(again.add_migration(counting("001", runs)).is_ok());
    REQUIRE(again.run().is_ok());
    CHECK(runs == 1);

    REQUIRE(reopened->remove("001").is_ok());
    CHECK(h.driver->collection_size("_migrations") == 0);
}

TEST_CASE("StoreMigrationLedger: unavailable store fails the run", "[migration][ledger]") {
    Harness h;
    auto broken = std::make_shared<MockExecutor>("docs");
    broken->fail_execute = true;
    auto manager = h.manager(std::make_shared<StoreMigrationLedger>(broken));
    int runs = 0;
    REQUIRE(manager.add_migration(counting("001", runs)).is_ok());

    auto result = manager.run();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::MIGRATION_FAILURE);
    CHECK(result.error_message().find("ledger") != std::string::npos);
    CHECK(runs == 0);
}
