#include <catch2/catch_test_macros.hpp>
#include "db/connection_registry.hpp"
#include "mocks/mock_executor.hpp"

using namespace polystore;
using namespace polystore::testing;

namespace {

ProviderConfig provider(const std::string& name, ProviderKind kind = ProviderKind::POSTGRESQL) {
    ProviderConfig cfg;
    cfg.name = name;
    cfg.kind = kind;
    return cfg;
}

/// Standalone registry whose relational kinds all connect through one MockBackend
struct Backends {
    std::shared_ptr<MockBackend> backend = std::make_shared<MockBackend>();
    std::vector<std::shared_ptr<MockExecutor>> connected;
    BackendRegistry registry;

    Backends() {
        backend->on_connect = [this](const std::shared_ptr<MockExecutor>& e) {
            connected.push_back(e);
        };
        for (const auto kind : {ProviderKind::POSTGRESQL, ProviderKind::MYSQL}) {
            registry.register_backend(kind, [b = backend] {
                return std::make_unique<ForwardingBackend>(b);
            });
        }
    }

    class ForwardingBackend : public IDbBackend {
    public:
        explicit ForwardingBackend(std::shared_ptr<MockBackend> target) : target_(std::move(target)) {}
        ProviderFamily family() const override { return target_->family(); }
        Result<std::shared_ptr<IExecutor>> connect(const ProviderConfig& config) override {
            return target_->connect(config);
        }

    private:
        std::shared_ptr<MockBackend> target_;
    };
};

} // namespace

TEST_CASE("ConnectionRegistry: every reachable provider becomes routable", "[registry]") {
    Backends b;
    ConnectionRegistry registry(b.registry);

    REQUIRE(registry.initialize({provider("main"), provider("legacy", ProviderKind::MYSQL)}).is_ok());
    CHECK(registry.available_providers() == std::vector<std::string>{"main", "legacy"});
    CHECK(registry.failed_providers().empty());

    auto main = registry.executor("main");
    REQUIRE(main.is_ok());
    CHECK(main.value()->kind() == ProviderKind::POSTGRESQL);
    CHECK(registry.executor("legacy").value()->kind() == ProviderKind::MYSQL);
}

TEST_CASE("ConnectionRegistry: unreachable providers are excluded, not fatal", "[registry]") {
    Backends b;
    b.backend->unreachable = {"analytics"};
    b.backend->unhealthy = {"replica"};
    ConnectionRegistry registry(b.registry);

    REQUIRE(registry.initialize({provider("main"), provider("analytics"), provider("replica")}).is_ok());
    CHECK(registry.available_providers() == std::vector<std::string>{"main"});

    const auto failed = registry.failed_providers();
    REQUIRE(failed.size() == 2);
    CHECK(failed.at("analytics").find("unreachable") != std::string::npos);
    CHECK(failed.at("replica").find("ping failed") != std::string::npos);

    auto missing = registry.executor("analytics");
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::NO_CONNECTION);
    CHECK(missing.error_message().find("unavailable") != std::string::npos);

    // the unhealthy executor was closed before being dropped
    REQUIRE(b.connected.size() == 2);
    CHECK(b.connected[1]->close_count() == 1);
}

TEST_CASE("ConnectionRegistry: nothing connected is NoProvidersAvailable", "[registry]") {
    Backends b;
    b.backend->unreachable = {"main", "legacy"};
    ConnectionRegistry registry(b.registry);

    const auto st = registry.initialize({provider("main"), provider("legacy")});
    REQUIRE(st.is_error());
    CHECK(st.error_category() == ErrorCategory::NO_PROVIDERS_AVAILABLE);
    CHECK(registry.available_providers().empty());
}

TEST_CASE("ConnectionRegistry: kinds without a backend in this build", "[registry]") {
    BackendRegistry empty;
    ConnectionRegistry registry(empty);

    auto result = registry.connect(provider("docs", ProviderKind::DOCUMENT));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONNECTION_ERROR);
    CHECK(registry.failed_providers().at("docs").find("no backend") != std::string::npos);
}

TEST_CASE("ConnectionRegistry: unknown provider name", "[registry]") {
    BackendRegistry none;
    ConnectionRegistry registry(none);
    auto result = registry.executor("nope");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::NO_CONNECTION);
    CHECK_FALSE(registry.is_available("nope"));
}

TEST_CASE("ConnectionRegistry: close reports failures and is idempotent", "[registry]") {
    BackendRegistry none;
    ConnectionRegistry registry(none);

    auto good = std::make_shared<MockExecutor>("main");
    auto bad = std::make_shared<MockExecutor>("legacy");
    bad->fail_close = true;
    registry.attach(good);
    registry.attach(bad);

    const auto report = registry.close();
    REQUIRE(report.size() == 2);
    CHECK(report[0].provider == "main");
    CHECK(report[0].ok);
    CHECK(report[1].provider == "legacy");
    CHECK_FALSE(report[1].ok);
    CHECK(report[1].message == "mock close failed");

    CHECK(good->close_count() == 1);
    CHECK(registry.close().empty());
    CHECK(good->close_count() == 1);
    CHECK(registry.executor("main").error_category() == ErrorCategory::NO_CONNECTION);
}

TEST_CASE("ConnectionRegistry: attaching a provider again replaces and closes the old executor", "[registry]") {
    BackendRegistry none;
    ConnectionRegistry registry(none);

    auto first = std::make_shared<MockExecutor>("main");
    auto second = std::make_shared<MockExecutor>("main");
    registry.attach(first);
    registry.attach(second);

    CHECK(first->close_count() == 1);
    CHECK(registry.available_providers().size() == 1);
    CHECK(registry.executor("main").value() == second);
}
