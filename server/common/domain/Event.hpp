#pragma once

#include "common/utils/TimestampHelper.hpp"
#include "common/utils/AppException.hpp"

/**
 * @brief 事件类型
 */
enum class EventType {
    StateChanged,
    AttributeChanged,
    EntityAdded,
    EntityRemoved,
    AutomationTriggered,
    ServiceCalled,
    DeviceDetected,
    Custom
};

inline const char* eventTypeToString(EventType type) {
    switch (type) {
        case EventType::StateChanged:        return "state_changed";
        case EventType::AttributeChanged:    return "attribute_changed";
        case EventType::EntityAdded:         return "entity_added";
        case EventType::EntityRemoved:       return "entity_removed";
        case EventType::AutomationTriggered: return "automation_triggered";
        case EventType::ServiceCalled:       return "service_called";
        case EventType::DeviceDetected:      return "device_detected";
        case EventType::Custom:              return "custom";
    }
    return "custom";
}

inline EventType eventTypeFromString(const std::string& str) {
    static const std::map<std::string, EventType> table = {
        {"state_changed", EventType::StateChanged},
        {"attribute_changed", EventType::AttributeChanged},
        {"entity_added", EventType::EntityAdded},
        {"entity_removed", EventType::EntityRemoved},
        {"automation_triggered", EventType::AutomationTriggered},
        {"service_called", EventType::ServiceCalled},
        {"device_detected", EventType::DeviceDetected},
        {"custom", EventType::Custom},
    };
    auto it = table.find(str);
    if (it == table.end()) {
        throw ValidationException("未知事件类型: " + str);
    }
    return it->second;
}

/**
 * @brief 事件时钟
 *
 * 进程内事件时间戳严格递增：墙钟未前进（或回拨）时在上一个值上加 1 微秒。
 */
class EventClock {
public:
    static Timestamp next() {
        int64_t now = TimestampHelper::toMicros(TimestampHelper::now());
        int64_t prev = last_.load(std::memory_order_relaxed);
        int64_t candidate;
        do {
            candidate = (std::max)(now, prev + 1);
        } while (!last_.compare_exchange_weak(prev, candidate, std::memory_order_relaxed));
        return TimestampHelper::fromMicros(candidate);
    }

private:
    inline static std::atomic<int64_t> last_{0};
};

/**
 * @brief 事件（创建后不可变）
 *
 * entityId 为实体键（如 "light.kitchen"），与实体无关的事件为空串。
 */
struct Event {
    std::string id;
    EventType type = EventType::Custom;
    std::string entityId;
    Timestamp timestamp{};
    Json::Value data{Json::objectValue};

    /**
     * @brief 创建新事件：分配 id 与单调时间戳
     */
    static Event create(EventType type, std::string entityId, Json::Value data) {
        Event event;
        event.id = drogon::utils::getUuid();
        event.type = type;
        event.entityId = std::move(entityId);
        event.timestamp = EventClock::next();
        event.data = std::move(data);
        return event;
    }

    /**
     * @brief 自定义事件，data.name 为事件名
     */
    static Event custom(const std::string& name, Json::Value data = Json::objectValue,
                        std::string entityId = "") {
        data["name"] = name;
        return create(EventType::Custom, std::move(entityId), std::move(data));
    }

    bool hasEntity() const { return !entityId.empty(); }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["event_type"] = eventTypeToString(type);
        json["entity_id"] = hasEntity() ? Json::Value(entityId) : Json::Value(Json::nullValue);
        json["timestamp"] = TimestampHelper::toIso(timestamp);
        json["data"] = data;
        return json;
    }
};
