#include "TestSupport.hpp"
#include "modules/integration/IntegrationManager.hpp"
#include "modules/integration/ServiceRouter.hpp"
#include "modules/integration/virtual/VirtualIntegration.hpp"
#include "modules/integration/presence/PresenceIntegration.hpp"

using namespace TestSupport;
using drogon::sync_wait;

namespace {

/** 记录调用次数的后台集成 */
class GoodIntegration {
public:
    std::string name() const { return "good"; }
    double pollInterval() const { return 0.05; }

    drogon::Task<> setup(IntegrationContextPtr) { co_return; }
    drogon::Task<> teardown() { ++teardowns; co_return; }
    drogon::Task<> handleServiceCall(const std::string&, const std::string& service, const Json::Value&) {
        if (service == "explode") throw std::runtime_error("boom");
        ++calls;
        co_return;
    }
    drogon::Task<> poll(IntegrationContextPtr, CancellationTokenPtr) { ++polls; co_return; }

    std::atomic<int> polls{0};
    std::atomic<int> calls{0};
    std::atomic<int> teardowns{0};
};

class FailingSetupIntegration {
public:
    std::string name() const { return "failing"; }

    drogon::Task<> setup(IntegrationContextPtr) {
        throw IntegrationException("device unreachable");
        co_return;
    }
    drogon::Task<> teardown() { ++teardowns; co_return; }
    drogon::Task<> handleServiceCall(const std::string&, const std::string&, const Json::Value&) {
        co_return;
    }

    std::atomic<int> teardowns{0};
};

/** 每次扫描都抛异常 */
class FlakyIntegration {
public:
    std::string name() const { return "flaky"; }
    double pollInterval() const { return 0.05; }

    drogon::Task<> setup(IntegrationContextPtr) { co_return; }
    drogon::Task<> teardown() { ++teardowns; co_return; }
    drogon::Task<> handleServiceCall(const std::string&, const std::string&, const Json::Value&) {
        co_return;
    }
    drogon::Task<> poll(IntegrationContextPtr, CancellationTokenPtr) {
        ++attempts;
        throw std::runtime_error("scan timeout");
        co_return;
    }

    std::atomic<int> attempts{0};
    std::atomic<int> teardowns{0};
};

class DisabledIntegration {
public:
    std::string name() const { return "disabled"; }
    bool enabled() const { return false; }

    drogon::Task<> setup(IntegrationContextPtr) { ++setups; co_return; }
    drogon::Task<> teardown() { co_return; }
    drogon::Task<> handleServiceCall(const std::string&, const std::string&, const Json::Value&) {
        co_return;
    }

    std::atomic<int> setups{0};
};

/** setup 抛出非 std::exception 的值 */
class ThrowsIntOnSetup {
public:
    std::string name() const { return "throws_int"; }

    drogon::Task<> setup(IntegrationContextPtr) {
        throw 42;
        co_return;
    }
    drogon::Task<> teardown() { co_return; }
    drogon::Task<> handleServiceCall(const std::string&, const std::string&, const Json::Value&) {
        co_return;
    }
};

/** 扫描与 teardown 都抛出非 std::exception 的值 */
class ThrowsStringOnScan {
public:
    std::string name() const { return "throws_string"; }
    double pollInterval() const { return 0.05; }

    drogon::Task<> setup(IntegrationContextPtr) { co_return; }
    drogon::Task<> teardown() {
        ++teardowns;
        throw std::string("socket gone");
        co_return;
    }
    drogon::Task<> handleServiceCall(const std::string&, const std::string&, const Json::Value&) {
        co_return;
    }
    drogon::Task<> poll(IntegrationContextPtr, CancellationTokenPtr) {
        ++attempts;
        throw std::string("socket gone");
        co_return;
    }

    std::atomic<int> attempts{0};
    std::atomic<int> teardowns{0};
};

static_assert(BackgroundIntegration<GoodIntegration>);
static_assert(!BackgroundIntegration<FailingSetupIntegration>);
static_assert(BackgroundIntegration<VirtualIntegration>);
static_assert(BackgroundIntegration<PresenceIntegration>);

using FakeManager = IntegrationManager<GoodIntegration, FailingSetupIntegration,
                                       FlakyIntegration, DisabledIntegration>;

struct ManagerFixture : Fixture {
    std::shared_ptr<GoodIntegration> good = std::make_shared<GoodIntegration>();
    std::shared_ptr<FailingSetupIntegration> failing = std::make_shared<FailingSetupIntegration>();
    std::shared_ptr<FlakyIntegration> flaky = std::make_shared<FlakyIntegration>();
    std::shared_ptr<DisabledIntegration> disabled = std::make_shared<DisabledIntegration>();
    std::shared_ptr<FakeManager> manager;

    ManagerFixture() {
        manager = std::make_shared<FakeManager>(good, failing, flaky, disabled);
        manager->setContext(std::make_shared<IntegrationContext>(entities, bus));
    }
};

/**
 * @brief 仅含虚拟集成的运行时：路由 → 管理器 → 集成
 */
struct VirtualFixture : Fixture {
    using Manager = IntegrationManager<VirtualIntegration>;

    std::shared_ptr<VirtualIntegration> integration = std::make_shared<VirtualIntegration>(true, 3600);
    std::shared_ptr<Manager> manager = std::make_shared<Manager>(integration);
    ServiceRouterPtr router;

    VirtualFixture() {
        router = std::make_shared<ServiceRouter>(store, entities, bus);
        manager->setContext(std::make_shared<IntegrationContext>(entities, bus));
        router->setIntegrationDispatch(
            [m = manager](const std::string& name, const std::string& entityId,
                          const std::string& service, const Json::Value& data) {
                return m->handleServiceCall(name, entityId, service, data);
            });
        sync_wait(manager->setupAll());
        manager->startAll();
    }

    ~VirtualFixture() {
        sync_wait(manager->teardownAll(1.0));
    }
};

}  // namespace

DROGON_TEST(IntegrationManager_SetupFailureIsIsolated)
{
    ManagerFixture fx;
    CHECK(sync_wait(fx.manager->setupAll()) == 2);

    CHECK(fx.manager->stateOf("good") == IntegrationState::Ready);
    CHECK(fx.manager->stateOf("flaky") == IntegrationState::Ready);
    CHECK(fx.manager->stateOf("failing") == IntegrationState::Failed);
    CHECK(fx.manager->stateOf("disabled") == IntegrationState::Disabled);
    CHECK(!fx.manager->stateOf("unknown").has_value());
    CHECK(fx.disabled->setups.load() == 0);

    auto status = fx.manager->status();
    CHECK(status["failing"]["last_error"].asString() == "device unreachable");
    CHECK(status["good"]["background"].asBool());
    CHECK(!status["failing"]["background"].asBool());

    sync_wait(fx.manager->teardownAll(1.0));
}

DROGON_TEST(IntegrationManager_SetupRequiresContext)
{
    auto manager = std::make_shared<IntegrationManager<GoodIntegration>>(std::make_shared<GoodIntegration>());
    CHECK_THROWS_AS(sync_wait(manager->setupAll()), InternalException);
}

DROGON_TEST(IntegrationManager_FlakyScanRetriesWithoutAffectingOthers)
{
    ManagerFixture fx;
    sync_wait(fx.manager->setupAll());
    CHECK(fx.manager->startAll() == 2);
    CHECK(fx.manager->activeTasks() == 2);

    CHECK(waitUntil([&] { return fx.flaky->attempts.load() >= 3; }));
    CHECK(waitUntil([&] { return fx.good->polls.load() >= 3; }));

    CHECK(fx.manager->stateOf("flaky") == IntegrationState::Retrying);
    CHECK(fx.manager->stateOf("good") == IntegrationState::Running);
    auto status = fx.manager->status();
    CHECK(status["flaky"]["consecutive_failures"].asInt() >= 1);
    CHECK(status["flaky"]["last_error"].asString() == "scan timeout");
    CHECK(status["good"]["scans"].asInt() >= 1);

    sync_wait(fx.manager->teardownAll(1.0));
    CHECK(fx.manager->activeTasks() == 0);
}

DROGON_TEST(IntegrationManager_NonStdThrowsAreRecorded)
{
    Fixture base;
    auto odd = std::make_shared<ThrowsIntOnSetup>();
    auto scanner = std::make_shared<ThrowsStringOnScan>();
    auto manager = std::make_shared<IntegrationManager<ThrowsIntOnSetup, ThrowsStringOnScan>>(odd, scanner);
    manager->setContext(std::make_shared<IntegrationContext>(base.entities, base.bus));

    CHECK(sync_wait(manager->setupAll()) == 1);
    CHECK(manager->stateOf("throws_int") == IntegrationState::Failed);
    CHECK(manager->status()["throws_int"]["last_error"].asString() == "unknown exception");

    CHECK(manager->startAll() == 1);
    CHECK(waitUntil([&] { return scanner->attempts.load() >= 2; }));
    CHECK(manager->stateOf("throws_string") == IntegrationState::Retrying);
    CHECK(manager->status()["throws_string"]["last_error"].asString() == "unknown exception");
    CHECK(manager->activeTasks() == 1);

    CHECK_NOTHROW(sync_wait(manager->teardownAll(1.0)));
    CHECK(manager->activeTasks() == 0);
    CHECK(scanner->teardowns.load() == 1);
    CHECK(manager->stateOf("throws_string") == IntegrationState::Stopped);
}

DROGON_TEST(IntegrationManager_TeardownOncePerSetUpIntegration)
{
    ManagerFixture fx;
    sync_wait(fx.manager->setupAll());
    fx.manager->startAll();

    sync_wait(fx.manager->teardownAll(1.0));
    sync_wait(fx.manager->teardownAll(1.0));

    CHECK(fx.good->teardowns.load() == 1);
    CHECK(fx.flaky->teardowns.load() == 1);
    CHECK(fx.failing->teardowns.load() == 0);
    CHECK(fx.manager->stateOf("good") == IntegrationState::Stopped);
    CHECK(fx.manager->stateOf("failing") == IntegrationState::Failed);

    int polls = fx.good->polls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    CHECK(fx.good->polls.load() == polls);
}

DROGON_TEST(IntegrationManager_ServiceCallDispatch)
{
    ManagerFixture fx;
    sync_wait(fx.manager->setupAll());
    fx.manager->startAll();

    Json::Value data(Json::objectValue);
    CHECK(sync_wait(fx.manager->handleServiceCall("good", "switch.a", "turn_on", data)));
    CHECK(fx.good->calls.load() == 1);

    CHECK(!sync_wait(fx.manager->handleServiceCall("zigbee", "switch.a", "turn_on", data)));
    CHECK_THROWS_AS(sync_wait(fx.manager->handleServiceCall("failing", "switch.a", "turn_on", data)),
                    IntegrationException);
    CHECK_THROWS_AS(sync_wait(fx.manager->handleServiceCall("good", "switch.a", "explode", data)),
                    IntegrationException);

    sync_wait(fx.manager->teardownAll(1.0));
    CHECK_THROWS_AS(sync_wait(fx.manager->handleServiceCall("good", "switch.a", "turn_on", data)),
                    IntegrationException);
}

DROGON_TEST(VirtualIntegration_DiscoversDevices)
{
    VirtualFixture fx;

    CHECK(sync_wait(fx.devices->list()).size() == 3);
    CHECK(fx.stateOf(VirtualIntegration::LIGHT) == EntityState::Off);
    CHECK(fx.stateOf(VirtualIntegration::SWITCH) == EntityState::Off);

    auto sensor = sync_wait(fx.entities->get(VirtualIntegration::SENSOR));
    CHECK(sensor.state == EntityState::Unknown);
    // 后台任务启动时已扫描一次，读数可能已偏离初始值
    double temperature = sensor.attributes.at("temperature").asDouble();
    CHECK(temperature >= 18.0);
    CHECK(temperature <= 26.0);
    CHECK(sensor.attributes.at("unit").asString() == "°C");

    // 重复 setup 不产生重复设备
    auto again = std::make_shared<VirtualIntegration>();
    sync_wait(again->setup(std::make_shared<IntegrationContext>(fx.entities, fx.bus)));
    CHECK(sync_wait(fx.devices->list()).size() == 3);
}

DROGON_TEST(VirtualIntegration_ServiceCallsThroughRouter)
{
    VirtualFixture fx;
    auto sub = fx.bus->subscribe();
    Json::Value data(Json::objectValue);

    sync_wait(fx.router->call(VirtualIntegration::LIGHT, "turn_on", data));
    CHECK(fx.stateOf(VirtualIntegration::LIGHT) == EntityState::On);

    auto events = drainEvents(sub);
    REQUIRE(countType(events, EventType::ServiceCalled) == 1);
    for (const auto& event : events) {
        if (event.type == EventType::ServiceCalled) {
            CHECK(event.data["integration"].asString() == "virtual");
            CHECK(event.data["service"].asString() == "turn_on");
        }
    }
    CHECK(countType(events, EventType::StateChanged) == 1);

    sync_wait(fx.router->call(VirtualIntegration::SWITCH, "toggle", data));
    CHECK(fx.stateOf(VirtualIntegration::SWITCH) == EntityState::On);

    CHECK_THROWS_AS(sync_wait(fx.router->call(VirtualIntegration::LIGHT, "set_color", data)),
                    ValidationException);

    drainEvents(sub);
    sync_wait(fx.router->call(VirtualIntegration::SENSOR, "turn_on", data));
    events = drainEvents(sub);
    CHECK(countType(events, EventType::StateChanged) == 0);
    CHECK(fx.stateOf(VirtualIntegration::SENSOR) == EntityState::Unknown);
}

DROGON_TEST(VirtualIntegration_PollDriftsTemperature)
{
    VirtualFixture fx;
    auto token = std::make_shared<CancellationToken>();
    auto ctx = std::make_shared<IntegrationContext>(fx.entities, fx.bus);

    for (int i = 0; i < 50; ++i) {
        sync_wait(fx.integration->poll(ctx, token));
        double t = fx.integration->temperature();
        CHECK(t >= 18.0);
        CHECK(t <= 26.0);
    }
    auto sensor = sync_wait(fx.entities->get(VirtualIntegration::SENSOR));
    CHECK(sensor.attributes.at("temperature").asDouble() == fx.integration->temperature());
    CHECK(sensor.state == EntityState::Unknown);
}

DROGON_TEST(TcpProbe_ClosedPortAndCancellation)
{
    auto token = std::make_shared<CancellationToken>();
    CHECK(!sync_wait(TcpProbe::run("127.0.0.1", 1, 1.0, token)));

    auto cancelled = std::make_shared<CancellationToken>();
    cancelled->cancel();
    CHECK(!sync_wait(TcpProbe::run("127.0.0.1", 1, 1.0, cancelled)));
}

DROGON_TEST(PresenceIntegration_ReportsUnreachableTarget)
{
    Fixture fx;
    std::vector<PresenceTarget> targets{{"phone", "127.0.0.1", 1}};
    auto presence = std::make_shared<PresenceIntegration>(true, targets, 3600, 1.0);
    auto ctx = std::make_shared<IntegrationContext>(fx.entities, fx.bus);

    sync_wait(presence->setup(ctx));
    auto entityId = PresenceIntegration::entityIdFor(targets[0]);
    CHECK(entityId == "binary_sensor.phone");
    auto entity = sync_wait(fx.entities->get(entityId));
    CHECK(entity.attributes.at("host").asString() == "127.0.0.1");

    Json::Value data(Json::objectValue);
    sync_wait(presence->handleServiceCall(entityId, "refresh", data));
    CHECK(fx.stateOf(entityId) == EntityState::Off);

    CHECK_NOTHROW(sync_wait(presence->handleServiceCall(entityId, "turn_on", data)));
    CHECK_THROWS_AS(sync_wait(presence->handleServiceCall("binary_sensor.tablet", "refresh", data)),
                    NotFoundException);
    CHECK_THROWS_AS(sync_wait(presence->handleServiceCall(entityId, "ring", data)),
                    ValidationException);

    sync_wait(presence->teardown());
}
