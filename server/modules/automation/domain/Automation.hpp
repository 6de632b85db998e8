#pragma once

#include "common/domain/Event.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/JsonHelper.hpp"
#include "modules/entity/domain/Entity.hpp"
#include "CronSchedule.hpp"

// ==================== 触发器 ====================

/** 指定实体状态变化时触发；from/to 为空表示不限 */
struct StateChangedTrigger {
    std::string entityId;
    std::optional<EntityState> from;
    std::optional<EntityState> to;
};

/** 按 cron 时间模式触发（由定时 tick 驱动，不匹配总线事件） */
struct TimePatternTrigger {
    std::string schedule;
};

/** 只能手动触发 */
struct ManualTrigger {};

using Trigger = std::variant<StateChangedTrigger, TimePatternTrigger, ManualTrigger>;

// ==================== 条件 ====================

struct StateIsCondition {
    std::string entityId;
    EntityState state = EntityState::On;
};

/**
 * @brief 本地时间段 [after, before]，两端包含；after > before 时跨越午夜
 */
struct TimeRangeCondition {
    std::string after;   // HH:MM
    std::string before;  // HH:MM

    bool contains(int minuteOfDay) const {
        int a = parseHhMm(after);
        int b = parseHhMm(before);
        if (a <= b) {
            return minuteOfDay >= a && minuteOfDay <= b;
        }
        return minuteOfDay >= a || minuteOfDay <= b;
    }

    /**
     * @brief "HH:MM" → 当天分钟数
     * @throws ValidationException 格式错误
     */
    static int parseHhMm(const std::string& str) {
        auto colon = str.find(':');
        if (colon == std::string::npos) {
            throw ValidationException("时间格式应为 HH:MM: " + str);
        }
        auto h = StringUtils::parseInt(str.substr(0, colon));
        auto m = StringUtils::parseInt(str.substr(colon + 1));
        if (!h || !m || *h < 0 || *h > 23 || *m < 0 || *m > 59) {
            throw ValidationException("时间格式应为 HH:MM: " + str);
        }
        return *h * 60 + *m;
    }
};

using Condition = std::variant<StateIsCondition, TimeRangeCondition>;

// ==================== 动作 ====================

struct CallServiceAction {
    std::string entityId;
    std::string service;
    Json::Value data{Json::objectValue};
};

struct DelayAction {
    int64_t seconds = 0;
};

using Action = std::variant<CallServiceAction, DelayAction>;

// ==================== JSON 转换 ====================

namespace AutomationJson {

inline Json::Value triggerToJson(const Trigger& trigger) {
    Json::Value json;
    if (auto* t = std::get_if<StateChangedTrigger>(&trigger)) {
        json["type"] = "state_changed";
        json["entity_id"] = t->entityId;
        json["from"] = t->from ? Json::Value(entityStateToString(*t->from)) : Json::Value(Json::nullValue);
        json["to"] = t->to ? Json::Value(entityStateToString(*t->to)) : Json::Value(Json::nullValue);
    } else if (auto* t = std::get_if<TimePatternTrigger>(&trigger)) {
        json["type"] = "time_pattern";
        json["schedule"] = t->schedule;
    } else {
        json["type"] = "manual";
    }
    return json;
}

inline std::optional<EntityState> optionalState(const Json::Value& json, const char* key) {
    if (!json.isMember(key) || json[key].isNull()) return std::nullopt;
    return entityStateFromString(json[key].asString());
}

inline Trigger triggerFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw ValidationException("trigger 必须是对象");
    }
    auto type = JsonHelper::getString(json, "type");
    if (type == "state_changed") {
        StateChangedTrigger t;
        t.entityId = JsonHelper::getString(json, "entity_id");
        t.from = optionalState(json, "from");
        t.to = optionalState(json, "to");
        return t;
    }
    if (type == "time_pattern") {
        // 兼容旧字段名 cron
        auto schedule = JsonHelper::getString(json, "schedule");
        if (schedule.empty()) schedule = JsonHelper::getString(json, "cron");
        return TimePatternTrigger{schedule};
    }
    if (type == "manual") {
        return ManualTrigger{};
    }
    throw ValidationException("未知触发器类型: " + type);
}

inline Json::Value conditionToJson(const Condition& condition) {
    Json::Value json;
    if (auto* c = std::get_if<StateIsCondition>(&condition)) {
        json["type"] = "state_is";
        json["entity_id"] = c->entityId;
        json["state"] = entityStateToString(c->state);
    } else if (auto* c = std::get_if<TimeRangeCondition>(&condition)) {
        json["type"] = "time_range";
        json["after"] = c->after;
        json["before"] = c->before;
    }
    return json;
}

inline Condition conditionFromJson(const Json::Value& json) {
    auto type = JsonHelper::getString(json, "type");
    if (type == "state_is") {
        return StateIsCondition{JsonHelper::getString(json, "entity_id"),
                                entityStateFromString(JsonHelper::getString(json, "state"))};
    }
    if (type == "time_range") {
        return TimeRangeCondition{JsonHelper::getString(json, "after"),
                                  JsonHelper::getString(json, "before")};
    }
    throw ValidationException("未知条件类型: " + type);
}

inline Json::Value actionToJson(const Action& action) {
    Json::Value json;
    if (auto* a = std::get_if<CallServiceAction>(&action)) {
        json["type"] = "call_service";
        json["entity_id"] = a->entityId;
        json["service"] = a->service;
        json["data"] = a->data;
    } else if (auto* a = std::get_if<DelayAction>(&action)) {
        json["type"] = "delay";
        json["seconds"] = static_cast<Json::Int64>(a->seconds);
    }
    return json;
}

inline Action actionFromJson(const Json::Value& json) {
    auto type = JsonHelper::getString(json, "type");
    if (type == "call_service") {
        CallServiceAction a;
        a.entityId = JsonHelper::getString(json, "entity_id");
        a.service = JsonHelper::getString(json, "service");
        a.data = JsonHelper::getObject(json, "data");
        return a;
    }
    if (type == "delay") {
        if (!json.isMember("seconds") || !json["seconds"].isIntegral()) {
            throw ValidationException("delay 动作缺少整数 seconds 字段");
        }
        return DelayAction{json["seconds"].asInt64()};
    }
    throw ValidationException("未知动作类型: " + type);
}

}  // namespace AutomationJson

/**
 * @brief 自动化规则：触发器 + 有序条件（AND，短路）+ 有序动作（顺序执行）
 *
 * 不变量：名称非空；至少一个动作；触发器总是存在。
 * 引擎只读取 enabled 的规则，只回写 lastTriggered。
 */
struct Automation {
    std::string id;
    std::string name;
    bool enabled = true;
    Trigger trigger = ManualTrigger{};
    std::vector<Condition> conditions;
    std::vector<Action> actions;
    std::optional<Timestamp> lastTriggered;

    static Automation create(std::string name, Trigger trigger,
                             std::vector<Condition> conditions, std::vector<Action> actions) {
        Automation automation;
        automation.id = drogon::utils::getUuid();
        automation.name = std::move(name);
        automation.trigger = std::move(trigger);
        automation.conditions = std::move(conditions);
        automation.actions = std::move(actions);
        return automation;
    }

    /**
     * @brief 校验规则结构
     * @param maxDelaySec Delay 动作允许的最大秒数
     */
    void validate(int64_t maxDelaySec = Constants::AUTOMATION_MAX_DELAY_SEC) const {
        if (StringUtils::trim(name).empty()) {
            throw ValidationException("自动化名称不能为空");
        }
        if (actions.empty()) {
            throw ValidationException("自动化至少需要一个动作: " + name);
        }

        if (auto* t = std::get_if<StateChangedTrigger>(&trigger)) {
            Entity::validateKey(t->entityId);
        } else if (auto* t = std::get_if<TimePatternTrigger>(&trigger)) {
            CronSchedule::parse(t->schedule);
        }

        for (const auto& condition : conditions) {
            if (auto* c = std::get_if<StateIsCondition>(&condition)) {
                Entity::validateKey(c->entityId);
            } else if (auto* c = std::get_if<TimeRangeCondition>(&condition)) {
                TimeRangeCondition::parseHhMm(c->after);
                TimeRangeCondition::parseHhMm(c->before);
            }
        }

        for (const auto& action : actions) {
            if (auto* a = std::get_if<CallServiceAction>(&action)) {
                Entity::validateKey(a->entityId);
                if (a->service.empty()) {
                    throw ValidationException("call_service 动作缺少 service: " + a->entityId);
                }
            } else if (auto* a = std::get_if<DelayAction>(&action)) {
                if (a->seconds < 0 || a->seconds > maxDelaySec) {
                    throw ValidationException("delay 秒数超出范围 [0, " +
                        std::to_string(maxDelaySec) + "]: " + std::to_string(a->seconds));
                }
            }
        }
    }

    /**
     * @brief 触发器是否匹配总线事件
     *
     * 只有 StateChanged 触发器会匹配事件；TimePattern 与 Manual 走其他入口
     */
    bool matchesEvent(const Event& event) const {
        auto* t = std::get_if<StateChangedTrigger>(&trigger);
        if (!t) return false;
        if (event.type != EventType::StateChanged) return false;
        if (event.entityId != t->entityId) return false;

        if (t->from) {
            const auto& old = event.data["old_state"];
            if (!old.isString() || old.asString() != entityStateToString(*t->from)) return false;
        }
        if (t->to) {
            const auto& now = event.data["new_state"];
            if (!now.isString() || now.asString() != entityStateToString(*t->to)) return false;
        }
        return true;
    }

    bool isTimePattern() const {
        return std::holds_alternative<TimePatternTrigger>(trigger);
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["name"] = name;
        json["enabled"] = enabled;
        json["trigger"] = AutomationJson::triggerToJson(trigger);
        json["conditions"] = Json::Value(Json::arrayValue);
        for (const auto& c : conditions) {
            json["conditions"].append(AutomationJson::conditionToJson(c));
        }
        json["actions"] = Json::Value(Json::arrayValue);
        for (const auto& a : actions) {
            json["actions"].append(AutomationJson::actionToJson(a));
        }
        json["last_triggered"] = lastTriggered
            ? Json::Value(TimestampHelper::toIso(*lastTriggered))
            : Json::Value(Json::nullValue);
        return json;
    }

    /**
     * @brief 从管理端 JSON 构建（不含 last_triggered，id 为空时生成新 id）
     * @throws ValidationException 结构错误
     */
    static Automation fromJson(const Json::Value& json) {
        if (!json.isObject()) {
            throw ValidationException("自动化定义必须是 JSON 对象");
        }
        Automation automation;
        automation.id = JsonHelper::getString(json, "id");
        if (automation.id.empty()) automation.id = drogon::utils::getUuid();
        automation.name = JsonHelper::getString(json, "name");
        automation.enabled = json.get("enabled", true).asBool();
        automation.trigger = AutomationJson::triggerFromJson(json["trigger"]);

        const auto& conditions = json["conditions"];
        if (conditions.isArray()) {
            for (const auto& c : conditions) {
                automation.conditions.push_back(AutomationJson::conditionFromJson(c));
            }
        }
        const auto& actions = json["actions"];
        if (actions.isArray()) {
            for (const auto& a : actions) {
                automation.actions.push_back(AutomationJson::actionFromJson(a));
            }
        }
        return automation;
    }
};
