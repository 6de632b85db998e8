#include "TestSupport.hpp"
#include "modules/automation/Automation.Service.hpp"
#include "modules/integration/ServiceRouter.hpp"

using namespace TestSupport;
using drogon::sync_wait;
using RunOutcome = AutomationEngine::RunOutcome;

namespace {

/**
 * @brief 内存存储上的引擎 + 服务路由 + 管理服务
 */
struct EngineFixture : Fixture {
    ServiceRouterPtr router;
    AutomationEnginePtr engine;
    AutomationServicePtr automations;

    explicit EngineFixture(std::shared_ptr<MemoryStore> s = std::make_shared<MemoryStore>())
        : Fixture(std::move(s)) {
        router = std::make_shared<ServiceRouter>(store, entities, bus);
        engine = std::make_shared<AutomationEngine>(
            store, bus,
            [r = router](const std::string& entityId, const std::string& service,
                         const Json::Value& data) {
                return r->call(entityId, service, data);
            });
        automations = std::make_shared<AutomationService>(store, engine, 3600);
    }

    ~EngineFixture() {
        engine->stop();
        bus->close();
    }

    Automation add(Automation automation) {
        return sync_wait(automations->create(std::move(automation)));
    }
};

CallServiceAction call(const std::string& entityId, const std::string& service) {
    return CallServiceAction{entityId, service, Json::Value(Json::objectValue)};
}

/**
 * @brief 固定日期上的本地时刻
 */
Timestamp localAt(int hour, int minute) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 5;
    tm.tm_mday = 15;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::from_time_t(std::mktime(&tm)));
}

}  // namespace

DROGON_TEST(AutomationEngine_MotionTurnsOnLight)
{
    EngineFixture fx;
    fx.addEntity("binary_sensor.motion", EntityState::Off);
    fx.addEntity("light.hall", EntityState::Off);

    auto automation = fx.add(Automation::create(
        "hall motion",
        StateChangedTrigger{"binary_sensor.motion", std::nullopt, EntityState::On},
        {}, {call("light.hall", "turn_on")}));
    CHECK(fx.engine->automationCount() == 1);

    fx.engine->start(drogon::app().getLoop());
    auto sub = fx.bus->subscribe();

    sync_wait(fx.entities->updateState("binary_sensor.motion", EntityState::On));

    CHECK(waitUntil([&] { return fx.stateOf("light.hall") == EntityState::On; }));
    CHECK(waitUntil([&] {
        return sync_wait(fx.automations->get(automation.id)).lastTriggered.has_value();
    }));

    std::vector<Event> events;
    CHECK(waitUntil([&] {
        auto more = drainEvents(sub);
        events.insert(events.end(), more.begin(), more.end());
        return countType(events, EventType::AutomationTriggered) == 1;
    }));

    // 顺序：触发事件 → 服务调用产生的状态变化 → 完成事件
    auto position = [&](EventType type, const std::string& entityId) {
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].type == type && events[i].entityId == entityId) return static_cast<int>(i);
        }
        return -1;
    };
    int motion = position(EventType::StateChanged, "binary_sensor.motion");
    int light = position(EventType::StateChanged, "light.hall");
    int done = position(EventType::AutomationTriggered, "");
    CHECK(motion >= 0);
    CHECK(light > motion);
    CHECK(done > light);
    CHECK(countType(events, EventType::ServiceCalled) == 1);
}

DROGON_TEST(AutomationEngine_FromStateMismatchDoesNotRun)
{
    EngineFixture fx;
    fx.addEntity("binary_sensor.door", EntityState::Unknown);
    fx.addEntity("light.porch", EntityState::Off);

    fx.add(Automation::create(
        "door opened",
        StateChangedTrigger{"binary_sensor.door", EntityState::Off, EntityState::On},
        {}, {call("light.porch", "turn_on")}));
    fx.engine->start(drogon::app().getLoop());

    sync_wait(fx.entities->updateState("binary_sensor.door", EntityState::On));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK(fx.stateOf("light.porch") == EntityState::Off);
}

DROGON_TEST(AutomationEngine_ConditionsShortCircuit)
{
    auto spy = std::make_shared<SpyStore>();
    EngineFixture fx(spy);
    fx.addEntity("binary_sensor.home", EntityState::Off);
    fx.addEntity("binary_sensor.dark", EntityState::On);
    fx.addEntity("light.living", EntityState::Off);

    auto automation = fx.add(Automation::create(
        "welcome",
        ManualTrigger{},
        {StateIsCondition{"binary_sensor.home", EntityState::On},
         StateIsCondition{"binary_sensor.dark", EntityState::On}},
        {call("light.living", "turn_on")}));

    spy->resetLookups();
    auto outcome = sync_wait(fx.engine->trigger(automation.id));
    CHECK(outcome == RunOutcome::ConditionsNotMet);
    CHECK(spy->looked("binary_sensor.home"));
    CHECK(!spy->looked("binary_sensor.dark"));
    CHECK(fx.stateOf("light.living") == EntityState::Off);
    CHECK(!sync_wait(fx.automations->get(automation.id)).lastTriggered.has_value());
}

DROGON_TEST(AutomationEngine_StateIsOnMissingEntityIsFalse)
{
    EngineFixture fx;
    fx.addEntity("light.living", EntityState::Off);
    auto automation = fx.add(Automation::create(
        "ghost", ManualTrigger{},
        {StateIsCondition{"binary_sensor.ghost", EntityState::Off}},
        {call("light.living", "turn_on")}));

    CHECK(sync_wait(fx.engine->trigger(automation.id)) == RunOutcome::ConditionsNotMet);
}

DROGON_TEST(AutomationEngine_TimeRangeUsesEngineClock)
{
    EngineFixture fx;
    fx.addEntity("light.day", EntityState::Off);
    fx.addEntity("light.night", EntityState::Off);
    auto day = fx.add(Automation::create(
        "daytime", ManualTrigger{},
        {TimeRangeCondition{"08:00", "18:00"}},
        {call("light.day", "toggle")}));
    auto night = fx.add(Automation::create(
        "overnight", ManualTrigger{},
        {TimeRangeCondition{"22:00", "06:00"}},
        {call("light.night", "toggle")}));

    auto clock = std::make_shared<std::atomic<int64_t>>(0);
    fx.engine->setClock([clock]() { return TimestampHelper::fromMicros(clock->load()); });
    auto setLocal = [&](int hour, int minute) {
        clock->store(TimestampHelper::toMicros(localAt(hour, minute)));
    };

    setLocal(12, 0);
    CHECK(sync_wait(fx.engine->trigger(day.id)) == RunOutcome::Completed);
    CHECK(sync_wait(fx.engine->trigger(night.id)) == RunOutcome::ConditionsNotMet);

    setLocal(20, 0);
    CHECK(sync_wait(fx.engine->trigger(day.id)) == RunOutcome::ConditionsNotMet);
    CHECK(sync_wait(fx.engine->trigger(night.id)) == RunOutcome::ConditionsNotMet);

    setLocal(23, 30);
    CHECK(sync_wait(fx.engine->trigger(night.id)) == RunOutcome::Completed);
    setLocal(3, 0);
    CHECK(sync_wait(fx.engine->trigger(night.id)) == RunOutcome::Completed);
    CHECK(sync_wait(fx.engine->trigger(day.id)) == RunOutcome::ConditionsNotMet);

    CHECK(fx.stateOf("light.day") == EntityState::On);
    CHECK(fx.stateOf("light.night") == EntityState::Off);

    auto stamped = sync_wait(fx.automations->get(night.id)).lastTriggered;
    REQUIRE(stamped.has_value());
    CHECK(TimestampHelper::toLocal(*stamped).minuteOfDay() == 3 * 60);
}

DROGON_TEST(AutomationEngine_ManualTriggerErrors)
{
    EngineFixture fx;
    fx.addEntity("light.x", EntityState::Off);
    CHECK_THROWS_AS(sync_wait(fx.engine->trigger("missing")), NotFoundException);

    auto automation = fx.add(Automation::create("off", ManualTrigger{}, {}, {call("light.x", "turn_on")}));
    sync_wait(fx.automations->setEnabled(automation.id, false));
    CHECK(fx.engine->automationCount() == 0);
    CHECK_THROWS_AS(sync_wait(fx.engine->trigger(automation.id)), ValidationException);
}

DROGON_TEST(AutomationEngine_FailedActionAbortsOnlyThatRun)
{
    EngineFixture fx;
    fx.addEntity("light.ok", EntityState::Off);

    auto broken = fx.add(Automation::create(
        "broken", ManualTrigger{}, {}, {call("light.missing", "turn_on"), call("light.ok", "turn_on")}));
    auto unknownService = fx.add(Automation::create(
        "bad service", ManualTrigger{}, {}, {call("light.ok", "dance")}));
    auto healthy = fx.add(Automation::create(
        "healthy", ManualTrigger{}, {}, {call("light.ok", "turn_on")}));

    CHECK(sync_wait(fx.engine->trigger(broken.id)) == RunOutcome::Failed);
    CHECK(fx.stateOf("light.ok") == EntityState::Off);
    CHECK(!sync_wait(fx.automations->get(broken.id)).lastTriggered.has_value());

    CHECK(sync_wait(fx.engine->trigger(unknownService.id)) == RunOutcome::Failed);

    CHECK(sync_wait(fx.engine->trigger(healthy.id)) == RunOutcome::Completed);
    CHECK(fx.stateOf("light.ok") == EntityState::On);
    CHECK(sync_wait(fx.automations->get(healthy.id)).lastTriggered.has_value());
}

DROGON_TEST(AutomationEngine_StopInterruptsDelay)
{
    EngineFixture fx;
    fx.addEntity("light.late", EntityState::Off);
    auto automation = fx.add(Automation::create(
        "slow", ManualTrigger{}, {}, {DelayAction{30}, call("light.late", "turn_on")}));

    auto outcome = std::make_shared<std::atomic<int>>(-1);
    auto engine = fx.engine;
    auto id = automation.id;
    drogon::app().getLoop()->queueInLoop([engine, id, outcome]() {
        drogon::async_run([engine, id, outcome]() -> drogon::Task<> {
            auto result = co_await engine->trigger(id);
            outcome->store(static_cast<int>(result));
        });
    });

    REQUIRE(waitUntil([&] { return fx.engine->activeRuns() == 1; }));
    fx.engine->stop();

    CHECK(waitUntil([&] { return outcome->load() == static_cast<int>(RunOutcome::Cancelled); }));
    CHECK(fx.stateOf("light.late") == EntityState::Off);
    CHECK(!sync_wait(fx.automations->get(automation.id)).lastTriggered.has_value());
}

DROGON_TEST(AutomationEngine_DelayParksOnlyItsOwnRun)
{
    EngineFixture fx;
    fx.addEntity("light.late", EntityState::Off);
    fx.addEntity("binary_sensor.motion", EntityState::Off);
    fx.addEntity("light.hall", EntityState::Off);

    auto slow = fx.add(Automation::create(
        "slow", ManualTrigger{}, {}, {DelayAction{30}, call("light.late", "turn_on")}));
    fx.add(Automation::create(
        "hall motion",
        StateChangedTrigger{"binary_sensor.motion", std::nullopt, EntityState::On},
        {}, {call("light.hall", "turn_on")}));
    fx.engine->start(drogon::app().getLoop());

    auto outcome = std::make_shared<std::atomic<int>>(-1);
    auto engine = fx.engine;
    auto id = slow.id;
    drogon::app().getLoop()->queueInLoop([engine, id, outcome]() {
        drogon::async_run([engine, id, outcome]() -> drogon::Task<> {
            auto result = co_await engine->trigger(id);
            outcome->store(static_cast<int>(result));
        });
    });
    REQUIRE(waitUntil([&] { return fx.engine->activeRuns() == 1; }));

    sync_wait(fx.entities->updateState("binary_sensor.motion", EntityState::On));
    CHECK(waitUntil([&] { return fx.stateOf("light.hall") == EntityState::On; }, 2.0));

    // 第一个运行仍停在 Delay 中
    CHECK(outcome->load() == -1);
    CHECK(fx.engine->activeRuns() >= 1);
    CHECK(fx.stateOf("light.late") == EntityState::Off);

    fx.engine->stop();
    CHECK(waitUntil([&] { return outcome->load() == static_cast<int>(RunOutcome::Cancelled); }));
}

DROGON_TEST(AutomationEngine_TimePatternTickOncePerMinute)
{
    EngineFixture fx;
    fx.addEntity("switch.pump", EntityState::Off);
    fx.add(Automation::create("every minute", TimePatternTrigger{"* * * * *"}, {},
                              {call("switch.pump", "toggle")}));
    fx.add(Automation::create("never", TimePatternTrigger{"0 0 31 2 *"}, {},
                              {call("switch.pump", "toggle")}));

    auto now = TimestampHelper::now();
    CHECK(fx.engine->tick(now) == 1);
    CHECK(fx.engine->tick(now) == 0);

    CHECK(waitUntil([&] { return fx.stateOf("switch.pump") == EntityState::On; }));
    CHECK(fx.engine->tick(now + std::chrono::minutes(1)) == 1);
}

DROGON_TEST(AutomationService_RejectsInvalidDefinitions)
{
    EngineFixture fx;
    CHECK_THROWS_AS(sync_wait(fx.automations->create(
        Automation::create("too long", ManualTrigger{}, {}, {DelayAction{7200}}))), ValidationException);
    CHECK_THROWS_AS(sync_wait(fx.automations->remove("missing")), NotFoundException);

    auto created = fx.add(Automation::create("ok", ManualTrigger{}, {}, {DelayAction{0}}));
    auto replacement = Automation::create("renamed", ManualTrigger{}, {}, {DelayAction{1}});
    auto updated = sync_wait(fx.automations->update(created.id, replacement));
    CHECK(updated.id == created.id);
    CHECK(sync_wait(fx.automations->get(created.id)).name == "renamed");

    sync_wait(fx.automations->remove(created.id));
    CHECK(sync_wait(fx.automations->list()).empty());
}
