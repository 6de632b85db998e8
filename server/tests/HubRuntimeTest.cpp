#include "TestSupport.hpp"
#include "modules/hub/HubRuntime.hpp"

using namespace TestSupport;
using drogon::sync_wait;

// HubRuntime 是进程级单例，整个流程放在一个用例里
DROGON_TEST(HubRuntime_StartRunStop)
{
    HubConfig config;
    config.storageDriver = "memory";
    config.virtualPollIntervalSec = 3600;

    auto& runtime = HubRuntime::instance();
    runtime.build(config, HubRuntime::createStore(config));
    auto sub = runtime.bus()->subscribe();

    std::string stage;
    sync_wait(runtime.start(stage));
    CHECK(stage == "integrations:start");
    CHECK(runtime.isRunning());

    auto status = runtime.status();
    CHECK(status["running"].asBool());
    CHECK(status["storage"].asString() == "memory");
    CHECK(status["integrations"]["virtual"]["state"].asString() == "running");
    CHECK(status["integrations"]["presence"]["state"].asString() == "disabled");
    CHECK(sync_wait(runtime.devices()->list()).size() == 3);

    // 手动规则 → 路由 → 虚拟集成
    auto automation = sync_wait(runtime.automations()->create(Automation::create(
        "lights on", ManualTrigger{}, {},
        {CallServiceAction{VirtualIntegration::LIGHT, "turn_on", Json::Value(Json::objectValue)}})));
    auto outcome = sync_wait(runtime.automations()->trigger(automation.id));
    CHECK(outcome == AutomationEngine::RunOutcome::Completed);
    CHECK(sync_wait(runtime.entities()->get(VirtualIntegration::LIGHT)).state == EntityState::On);

    CHECK(waitUntil([&] {
        return sync_wait(runtime.store()->listEventsByEntity(VirtualIntegration::LIGHT, 50)).size() >= 2;
    }));

    sync_wait(runtime.stop());
    sync_wait(runtime.stop());
    CHECK(!runtime.isRunning());
    CHECK(runtime.bus()->isClosed());
    CHECK(runtime.integrations()->stateOf("virtual") == IntegrationState::Stopped);

    std::vector<Event> events;
    while (auto msg = sub->tryRecv()) {
        if (auto* event = std::get_if<Event>(&*msg)) events.push_back(*event);
        if (std::holds_alternative<BusClosed>(*msg)) break;
    }
    auto custom = [&](const std::string& name) {
        return std::any_of(events.begin(), events.end(), [&](const Event& e) {
            return e.type == EventType::Custom && e.data["name"].asString() == name;
        });
    };
    CHECK(custom("hub_started"));
    CHECK(custom("hub_stopping"));
    CHECK(countType(events, EventType::AutomationTriggered) == 1);
}
