#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/StringUtils.hpp"
#include "modules/entity/domain/Entity.hpp"

/**
 * @brief 设备：暴露一个或多个实体的物理/虚拟设备
 *
 * (integration, uniqueId) 在 uniqueId 非空时唯一，是集成重启后重新发现同一
 * 物理设备时的去重键；手动创建的设备 uniqueId 为空，不参与去重。
 */
struct Device {
    std::string id;
    std::string name;
    std::string manufacturer;   // 可选
    std::string model;          // 可选
    std::string areaId;         // 可选
    std::string integration;
    std::string uniqueId;

    static Device create(std::string name, std::string integration = "",
                         std::string uniqueId = "") {
        Device device;
        device.id = drogon::utils::getUuid();
        device.name = std::move(name);
        device.integration = std::move(integration);
        device.uniqueId = std::move(uniqueId);
        return device;
    }

    bool hasIdentity() const { return !uniqueId.empty(); }

    void validate() const {
        if (StringUtils::trim(name).empty()) {
            throw ValidationException("设备名称不能为空");
        }
    }

    /**
     * @brief 合并重新发现时的字段；areaId 仅在传入值非空时覆盖
     */
    void mergeFrom(const Device& incoming) {
        name = incoming.name;
        if (!incoming.manufacturer.empty()) manufacturer = incoming.manufacturer;
        if (!incoming.model.empty()) model = incoming.model;
        if (!incoming.areaId.empty()) areaId = incoming.areaId;
        if (!incoming.integration.empty()) integration = incoming.integration;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["name"] = name;
        json["manufacturer"] = manufacturer.empty() ? Json::Value(Json::nullValue) : Json::Value(manufacturer);
        json["model"] = model.empty() ? Json::Value(Json::nullValue) : Json::Value(model);
        json["area_id"] = areaId.empty() ? Json::Value(Json::nullValue) : Json::Value(areaId);
        json["integration"] = integration;
        json["unique_id"] = uniqueId;
        return json;
    }
};

/**
 * @brief 集成 → 核心的边界类型，转换为 Device/Entity 的 upsert，不直接持久化
 */
struct DiscoveredDevice {
    Device device;
    std::vector<DiscoveredEntity> entities;
    std::optional<Json::Value> serviceData;
};
