#include "TestSupport.hpp"
#include "modules/history/HistoryRecorder.hpp"

using namespace TestSupport;
using drogon::sync_wait;

namespace {

HistoryRecorder::Options retention(int days, bool recordEvents = true) {
    HistoryRecorder::Options options;
    options.retentionDays = days;
    options.purgeIntervalHours = 1;
    options.recordEvents = recordEvents;
    return options;
}

}  // namespace

DROGON_TEST(History_PurgeRespectsRetention)
{
    Fixture fx;
    auto entity = fx.addEntity("sensor.power", EntityState::On);
    auto recorder = std::make_shared<HistoryRecorder>(fx.store, fx.bus, retention(30));

    auto now = TimestampHelper::now();
    sync_wait(fx.store->saveHistory(EntityHistory::snapshot(entity, now - std::chrono::hours(24 * 40))));
    sync_wait(fx.store->saveHistory(EntityHistory::snapshot(entity, now - std::chrono::hours(24 * 10))));
    REQUIRE(fx.store->historySize() == 2);

    CHECK(sync_wait(recorder->purgeOnce(now)) == 1);
    auto rows = sync_wait(fx.store->listHistory("sensor.power", now - std::chrono::hours(24 * 365), now, 0));
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].recordedAt == now - std::chrono::hours(24 * 10));

    CHECK(sync_wait(recorder->purgeOnce(now)) == 0);
}

DROGON_TEST(History_RecordSnapshotsAtEventTime)
{
    Fixture fx;
    fx.addEntity("light.den", EntityState::Off);
    auto recorder = std::make_shared<HistoryRecorder>(fx.store, fx.bus, retention(30));
    auto sub = fx.bus->subscribe();

    sync_wait(fx.entities->updateState("light.den", EntityState::On));
    auto events = drainEvents(sub);
    REQUIRE(events.size() == 1);

    sync_wait(recorder->record(events[0]));
    CHECK(recorder->recordedCount() == 1);

    auto rows = sync_wait(fx.store->listHistory("light.den", events[0].timestamp, events[0].timestamp, 0));
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].state == EntityState::On);
    CHECK(rows[0].recordedAt == events[0].timestamp);

    auto journal = sync_wait(fx.store->listEventsByEntity("light.den", 10));
    REQUIRE(journal.size() == 1);
    CHECK(journal[0].id == events[0].id);
}

DROGON_TEST(History_NonStateEventsOnlyJournaled)
{
    Fixture fx;
    auto recorder = std::make_shared<HistoryRecorder>(fx.store, fx.bus, retention(30));

    Json::Value data;
    data["automation_id"] = "a1";
    data["automation_name"] = "test";
    sync_wait(recorder->record(Event::create(EventType::AutomationTriggered, "", data)));
    CHECK(fx.store->historySize() == 0);
    CHECK(sync_wait(fx.store->listRecentEvents(10)).size() == 1);

    auto quiet = std::make_shared<HistoryRecorder>(fx.store, fx.bus, retention(30, false));
    sync_wait(quiet->record(Event::create(EventType::AutomationTriggered, "", data)));
    CHECK(sync_wait(fx.store->listRecentEvents(10)).size() == 1);
}

DROGON_TEST(History_MissingEntityIsSkipped)
{
    Fixture fx;
    auto recorder = std::make_shared<HistoryRecorder>(fx.store, fx.bus, retention(30));

    Json::Value data;
    data["entity_id"] = "light.gone";
    data["old_state"] = "off";
    data["new_state"] = "on";
    sync_wait(recorder->record(Event::create(EventType::StateChanged, "light.gone", data)));

    CHECK(recorder->recordedCount() == 0);
    CHECK(fx.store->historySize() == 0);
}

DROGON_TEST(History_RecorderFollowsBus)
{
    Fixture fx;
    fx.addEntity("switch.heater", EntityState::Off);
    auto recorder = std::make_shared<HistoryRecorder>(fx.store, fx.bus, retention(30));
    recorder->start(drogon::app().getLoop());

    sync_wait(fx.entities->updateState("switch.heater", EntityState::On));
    sync_wait(fx.entities->updateAttributes("switch.heater", {{"power_w", Json::Value(1200)}}));
    sync_wait(fx.entities->updateState("switch.heater", EntityState::Off));

    CHECK(waitUntil([&] { return fx.store->historySize() == 3; }));
    auto rows = sync_wait(fx.store->listHistory("switch.heater",
                                                TimestampHelper::now() - std::chrono::hours(1),
                                                TimestampHelper::now(), 0));
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].recordedAt <= rows[1].recordedAt);
    CHECK(rows[1].recordedAt <= rows[2].recordedAt);
    CHECK(rows[2].state == EntityState::Off);
    CHECK(rows[2].attributes.at("power_w").asInt() == 1200);

    recorder->stop();
    fx.bus->close();
}
