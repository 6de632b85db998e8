#include "TestSupport.hpp"

namespace {

LocalTime at(int hour, int minute, int dayOfMonth = 15, int month = 6, int dayOfWeek = 3) {
    LocalTime t;
    t.hour = hour;
    t.minute = minute;
    t.dayOfMonth = dayOfMonth;
    t.month = month;
    t.dayOfWeek = dayOfWeek;
    return t;
}

Event stateChanged(const std::string& entityId, const char* from, const char* to) {
    Json::Value data;
    data["entity_id"] = entityId;
    data["old_state"] = from;
    data["new_state"] = to;
    return Event::create(EventType::StateChanged, entityId, data);
}

}  // namespace

DROGON_TEST(CronSchedule_Matching)
{
    auto everyMinute = CronSchedule::parse("* * * * *");
    CHECK(everyMinute.matches(at(0, 0)));
    CHECK(everyMinute.matches(at(23, 59)));

    auto quarterHours = CronSchedule::parse("*/15 8-18 * * 1-5");
    CHECK(quarterHours.matches(at(8, 0, 15, 6, 1)));
    CHECK(quarterHours.matches(at(18, 45, 15, 6, 5)));
    CHECK(!quarterHours.matches(at(8, 10, 15, 6, 1)));
    CHECK(!quarterHours.matches(at(19, 0, 15, 6, 1)));
    CHECK(!quarterHours.matches(at(9, 0, 15, 6, 0)));

    auto sunday = CronSchedule::parse("30 7 * * 7");
    CHECK(sunday.matches(at(7, 30, 15, 6, 0)));

    // 日与周同时受限时取并集
    auto either = CronSchedule::parse("0 12 1 * 1");
    CHECK(either.matches(at(12, 0, 1, 6, 4)));
    CHECK(either.matches(at(12, 0, 20, 6, 1)));
    CHECK(!either.matches(at(12, 0, 20, 6, 4)));
}

DROGON_TEST(CronSchedule_StarStepKeepsIntersection)
{
    // */n 的日、周字段不算受限，日与周仍取交集
    auto evenWeekdays = CronSchedule::parse("0 0 1 * */2");
    CHECK(evenWeekdays.matches(at(0, 0, 1, 6, 2)));
    CHECK(!evenWeekdays.matches(at(0, 0, 1, 6, 1)));
    CHECK(!evenWeekdays.matches(at(0, 0, 10, 6, 2)));

    auto everyTenthDay = CronSchedule::parse("0 0 */10 * 1");
    CHECK(everyTenthDay.matches(at(0, 0, 11, 6, 1)));
    CHECK(!everyTenthDay.matches(at(0, 0, 5, 6, 1)));
    CHECK(!everyTenthDay.matches(at(0, 0, 11, 6, 3)));
}

DROGON_TEST(CronSchedule_RejectsMalformed)
{
    CHECK_THROWS_AS(CronSchedule::parse("* * * *"), ValidationException);
    CHECK_THROWS_AS(CronSchedule::parse("60 * * * *"), ValidationException);
    CHECK_THROWS_AS(CronSchedule::parse("* 24 * * *"), ValidationException);
    CHECK_THROWS_AS(CronSchedule::parse("* * 0 * *"), ValidationException);
    CHECK_THROWS_AS(CronSchedule::parse("*/0 * * * *"), ValidationException);
    CHECK_THROWS_AS(CronSchedule::parse("a * * * *"), ValidationException);
}

DROGON_TEST(TimeRange_WrapsMidnight)
{
    TimeRangeCondition day{"08:00", "20:00"};
    CHECK(day.contains(8 * 60));
    CHECK(day.contains(20 * 60));
    CHECK(!day.contains(21 * 60));

    TimeRangeCondition night{"22:00", "06:00"};
    CHECK(night.contains(23 * 60));
    CHECK(night.contains(0));
    CHECK(night.contains(6 * 60));
    CHECK(!night.contains(12 * 60));

    CHECK_THROWS_AS(TimeRangeCondition::parseHhMm("25:00"), ValidationException);
    CHECK_THROWS_AS(TimeRangeCondition::parseHhMm("0800"), ValidationException);
}

DROGON_TEST(Automation_TriggerMatchesFromTo)
{
    auto automation = Automation::create(
        "motion light",
        StateChangedTrigger{"binary_sensor.motion", EntityState::Off, EntityState::On},
        {}, {CallServiceAction{"light.hall", "turn_on", Json::Value(Json::objectValue)}});

    CHECK(automation.matchesEvent(stateChanged("binary_sensor.motion", "off", "on")));
    CHECK(!automation.matchesEvent(stateChanged("binary_sensor.motion", "on", "off")));
    CHECK(!automation.matchesEvent(stateChanged("binary_sensor.motion", "unknown", "on")));
    CHECK(!automation.matchesEvent(stateChanged("binary_sensor.door", "off", "on")));

    auto anyChange = Automation::create(
        "any", StateChangedTrigger{"binary_sensor.motion", std::nullopt, std::nullopt},
        {}, {DelayAction{1}});
    CHECK(anyChange.matchesEvent(stateChanged("binary_sensor.motion", "on", "unavailable")));

    Json::Value data;
    data["entity_id"] = "binary_sensor.motion";
    auto attributeEvent = Event::create(EventType::AttributeChanged, "binary_sensor.motion", data);
    CHECK(!anyChange.matchesEvent(attributeEvent));
}

DROGON_TEST(Automation_Validation)
{
    auto noActions = Automation::create("empty", ManualTrigger{}, {}, {});
    CHECK_THROWS_AS(noActions.validate(), ValidationException);

    auto noName = Automation::create(" ", ManualTrigger{}, {}, {DelayAction{1}});
    CHECK_THROWS_AS(noName.validate(), ValidationException);

    auto longDelay = Automation::create("long", ManualTrigger{}, {}, {DelayAction{7200}});
    CHECK_THROWS_AS(longDelay.validate(3600), ValidationException);
    CHECK_NOTHROW(longDelay.validate(7200));

    auto badCron = Automation::create("cron", TimePatternTrigger{"every day"}, {}, {DelayAction{1}});
    CHECK_THROWS_AS(badCron.validate(), ValidationException);

    auto badRange = Automation::create("range", ManualTrigger{},
                                       {TimeRangeCondition{"8am", "20:00"}}, {DelayAction{1}});
    CHECK_THROWS_AS(badRange.validate(), ValidationException);
}

DROGON_TEST(Automation_FromJson)
{
    auto json = JsonHelper::parse(R"({
        "name": "night porch",
        "trigger": {"type": "time_pattern", "cron": "0 22 * * *"},
        "conditions": [
            {"type": "state_is", "entity_id": "binary_sensor.home", "state": "on"},
            {"type": "time_range", "after": "21:00", "before": "02:00"}
        ],
        "actions": [
            {"type": "call_service", "entity_id": "light.porch", "service": "turn_on"},
            {"type": "delay", "seconds": 300},
            {"type": "call_service", "entity_id": "light.porch", "service": "turn_off"}
        ]
    })");

    auto automation = Automation::fromJson(json);
    CHECK(!automation.id.empty());
    CHECK(automation.enabled);
    CHECK(automation.isTimePattern());
    CHECK(std::get<TimePatternTrigger>(automation.trigger).schedule == "0 22 * * *");
    REQUIRE(automation.conditions.size() == 2);
    REQUIRE(automation.actions.size() == 3);
    CHECK(std::get<DelayAction>(automation.actions[1]).seconds == 300);
    CHECK_NOTHROW(automation.validate());

    auto out = automation.toJson();
    CHECK(out["trigger"]["schedule"].asString() == "0 22 * * *");
    CHECK(out["last_triggered"].isNull());

    auto bad = JsonHelper::parse(R"({"name": "x", "trigger": {"type": "sunset"}, "actions": []})");
    CHECK_THROWS_AS(Automation::fromJson(bad), ValidationException);
}
