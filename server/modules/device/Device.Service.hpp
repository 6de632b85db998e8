#pragma once

#include "domain/Device.hpp"
#include "common/storage/HubStore.hpp"
#include "modules/entity/Entity.Service.hpp"

/**
 * @brief 设备服务（管理端 CRUD）
 *
 * 集成发现的设备走 EntityService::createOrUpsert；这里处理手动创建、
 * 改名、分配区域和删除。删除设备时先经由 EntityService 删除其实体，
 * 保证每个实体都有 EntityRemoved 事件。
 */
class DeviceService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    DeviceService(HubStorePtr store, EntityServicePtr entityService)
        : store_(std::move(store)), entityService_(std::move(entityService)) {}

    Task<Device> create(Device device) {
        if (device.id.empty()) device.id = drogon::utils::getUuid();
        device.validate();
        co_await requireArea(device.areaId);

        if (device.hasIdentity() &&
            co_await store_->findDeviceByUniqueId(device.integration, device.uniqueId)) {
            throw ValidationException("设备标识已存在: " + device.integration + "/" + device.uniqueId);
        }

        co_await store_->saveDevice(device);
        LOG_INFO << "[DeviceService] Device created: " << device.name << " (" << device.id << ")";
        co_return device;
    }

    /**
     * @brief 更新名称/厂商/型号/区域；integration 与 unique_id 不可修改
     */
    Task<Device> update(const std::string& id, const Device& patch) {
        auto device = co_await get(id);
        device.name = patch.name;
        device.manufacturer = patch.manufacturer;
        device.model = patch.model;
        device.areaId = patch.areaId;
        device.validate();
        co_await requireArea(device.areaId);

        co_await store_->saveDevice(device);
        co_return device;
    }

    Task<Device> get(const std::string& id) {
        auto device = co_await store_->findDevice(id);
        if (!device) {
            throw NotFoundException("设备不存在: " + id);
        }
        co_return std::move(*device);
    }

    Task<std::vector<Device>> list() {
        co_return co_await store_->listDevices();
    }

    /**
     * @brief 设备及其实体（批量查询实体）
     */
    Task<Json::Value> listWithEntities() {
        auto devices = co_await store_->listDevices();
        std::vector<std::string> ids;
        ids.reserve(devices.size());
        for (const auto& d : devices) ids.push_back(d.id);

        auto entities = co_await store_->findEntitiesByDeviceIds(ids);
        std::map<std::string, Json::Value> byDevice;
        for (const auto& e : entities) {
            byDevice[e.deviceId].append(e.toJson());
        }

        Json::Value items(Json::arrayValue);
        for (const auto& d : devices) {
            auto json = d.toJson();
            auto it = byDevice.find(d.id);
            json["entities"] = it != byDevice.end() ? it->second : Json::Value(Json::arrayValue);
            items.append(json);
        }
        co_return items;
    }

    Task<> remove(const std::string& id) {
        auto device = co_await get(id);

        auto entities = co_await store_->findEntitiesByDeviceIds({device.id});
        for (const auto& entity : entities) {
            co_await entityService_->remove(entity.entityId);
        }

        if (!(co_await store_->deleteDevice(device.id))) {
            throw NotFoundException("设备不存在: " + id);
        }
        LOG_INFO << "[DeviceService] Device removed: " << device.name
                 << " with " << entities.size() << " entities";
    }

private:
    HubStorePtr store_;
    EntityServicePtr entityService_;

    Task<> requireArea(const std::string& areaId) {
        if (areaId.empty()) co_return;
        if (!(co_await store_->findArea(areaId))) {
            throw ValidationException("区域不存在: " + areaId);
        }
    }
};

using DeviceServicePtr = std::shared_ptr<DeviceService>;
