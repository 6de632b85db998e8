#pragma once

#include "common/utils/TimestampHelper.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/StringUtils.hpp"

/**
 * @brief 实体状态
 */
enum class EntityState {
    On,
    Off,
    Unknown,
    Unavailable
};

inline const char* entityStateToString(EntityState state) {
    switch (state) {
        case EntityState::On:          return "on";
        case EntityState::Off:         return "off";
        case EntityState::Unknown:     return "unknown";
        case EntityState::Unavailable: return "unavailable";
    }
    return "unknown";
}

/**
 * @brief 文本 → 状态（大小写不敏感）
 * @throws ValidationException 无法识别的状态
 */
inline EntityState entityStateFromString(const std::string& str) {
    auto lower = StringUtils::toLower(StringUtils::trim(str));
    if (lower == "on") return EntityState::On;
    if (lower == "off") return EntityState::Off;
    if (lower == "unknown") return EntityState::Unknown;
    if (lower == "unavailable") return EntityState::Unavailable;
    throw ValidationException("无效的实体状态: " + str);
}

inline bool isAvailable(EntityState state) {
    return state != EntityState::Unavailable;
}

/** 属性值：布尔、整数、浮点、字符串或结构化 JSON */
using AttributeValue = Json::Value;
using AttributeMap = std::map<std::string, AttributeValue>;

inline Json::Value attributesToJson(const AttributeMap& attributes) {
    Json::Value json(Json::objectValue);
    for (const auto& [key, value] : attributes) {
        json[key] = value;
    }
    return json;
}

inline AttributeMap attributesFromJson(const Json::Value& json) {
    AttributeMap attributes;
    if (!json.isObject()) return attributes;
    for (const auto& key : json.getMemberNames()) {
        attributes[key] = json[key];
    }
    return attributes;
}

/**
 * @brief 合并属性补丁（插入/覆盖，不删除）
 * @return 实际发生变化的键
 */
inline std::vector<std::string> mergeAttributes(AttributeMap& target, const AttributeMap& patch) {
    std::vector<std::string> changed;
    for (const auto& [key, value] : patch) {
        auto it = target.find(key);
        if (it == target.end() || it->second != value) {
            target[key] = value;
            changed.push_back(key);
        }
    }
    return changed;
}

/**
 * @brief 实体：可观测/可控制的单个点（如一盏灯）
 *
 * 不变量：
 * - entityId 全局唯一，格式 "<domain>.<object_id>"
 * - lastChanged 仅在 state 值变化时更新
 * - lastUpdated 每次写入（状态或属性）都更新
 */
struct Entity {
    std::string id;
    std::string deviceId;
    std::string entityId;
    std::string friendlyName;
    EntityState state = EntityState::Unknown;
    AttributeMap attributes;
    Timestamp lastChanged{};
    Timestamp lastUpdated{};

    static Entity create(std::string deviceId, std::string entityId, std::string friendlyName,
                         EntityState state = EntityState::Unknown, AttributeMap attributes = {}) {
        auto now = TimestampHelper::now();
        Entity entity;
        entity.id = drogon::utils::getUuid();
        entity.deviceId = std::move(deviceId);
        entity.entityId = std::move(entityId);
        entity.friendlyName = std::move(friendlyName);
        entity.state = state;
        entity.attributes = std::move(attributes);
        entity.lastChanged = now;
        entity.lastUpdated = now;
        return entity;
    }

    /** "light.kitchen" → "light" */
    std::string domain() const {
        auto pos = entityId.find('.');
        return pos == std::string::npos ? entityId : entityId.substr(0, pos);
    }

    /**
     * @brief 记录一次写入；同一微秒内的连续写入仍保证 lastUpdated 前进
     */
    Timestamp touch(Timestamp now) {
        lastUpdated = (std::max)(now, lastUpdated + std::chrono::microseconds(1));
        return lastUpdated;
    }

    /**
     * @brief 写入新状态
     * @return 状态值是否变化
     */
    bool applyState(EntityState newState, Timestamp now) {
        auto written = touch(now);
        if (newState == state) return false;
        state = newState;
        lastChanged = written;
        return true;
    }

    static void validateKey(const std::string& key) {
        if (key.empty()) {
            throw ValidationException("entity_id 不能为空");
        }
        auto pos = key.find('.');
        if (pos == std::string::npos || pos == 0 || pos == key.size() - 1) {
            throw ValidationException("entity_id 格式应为 <domain>.<object_id>: " + key);
        }
    }

    void validate() const {
        validateKey(entityId);
        if (StringUtils::trim(friendlyName).empty()) {
            throw ValidationException("friendly_name 不能为空: " + entityId);
        }
        if (deviceId.empty()) {
            throw ValidationException("实体必须隶属于设备: " + entityId);
        }
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["device_id"] = deviceId;
        json["entity_id"] = entityId;
        json["friendly_name"] = friendlyName;
        json["state"] = entityStateToString(state);
        json["attributes"] = attributesToJson(attributes);
        json["last_changed"] = TimestampHelper::toIso(lastChanged);
        json["last_updated"] = TimestampHelper::toIso(lastUpdated);
        return json;
    }
};

/**
 * @brief 集成上报的实体描述
 *
 * state 缺省时保留已有状态（新实体为 Unknown）；friendlyName 为空时使用 entityId
 */
struct DiscoveredEntity {
    std::string entityId;
    std::string friendlyName;
    std::optional<EntityState> state;
    AttributeMap attributes;
};
