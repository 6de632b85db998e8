#pragma once

#include "modules/entity/domain/Entity.hpp"

/**
 * @brief 实体历史快照（只追加；仅由保留期清理删除，从不更新）
 */
struct EntityHistory {
    std::string id;
    std::string entityId;
    EntityState state = EntityState::Unknown;
    AttributeMap attributes;
    Timestamp recordedAt{};

    static EntityHistory snapshot(const Entity& entity, Timestamp recordedAt) {
        EntityHistory row;
        row.id = drogon::utils::getUuid();
        row.entityId = entity.entityId;
        row.state = entity.state;
        row.attributes = entity.attributes;
        row.recordedAt = recordedAt;
        return row;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["entity_id"] = entityId;
        json["state"] = entityStateToString(state);
        json["attributes"] = attributesToJson(attributes);
        json["recorded_at"] = TimestampHelper::toIso(recordedAt);
        return json;
    }
};
