#pragma once

#include "domain/Entity.hpp"
#include "modules/device/domain/Device.hpp"
#include "common/domain/EventBus.hpp"
#include "common/storage/HubStore.hpp"
#include "common/utils/AsyncMutex.hpp"

/**
 * @brief 实体状态权威（实体状态/属性的唯一写入者）
 *
 * 职责：
 * - 校验 → 变更 → 持久化 → 发布事件
 * - 同一实体键的写入串行化（按键协程锁），不同实体并行
 * - 集成上报的设备按 (integration, unique_id) 去重
 *
 * 事件契约：
 * - 每次至少改变一个字段的写入在存储成功后发布恰好一个事件
 * - 存储失败以 StorageException 抛出，不发布任何事件
 * - 发布失败（总线已关闭）只记日志，不影响写入结果
 */
class EntityService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    using UpsertResult = std::pair<Device, std::vector<Entity>>;

    EntityService(HubStorePtr store, EventBusPtr bus)
        : store_(std::move(store)), bus_(std::move(bus)) {}

    // ==================== 设备发现 ====================

    /**
     * @brief 设备 + 实体的插入或合并
     *
     * 设备身份：unique_id 非空时按 (integration, unique_id)，否则按 id，都未命中则插入。
     * 实体：不存在则插入（EntityAdded）；存在则更新名称、合并属性，
     * 仅在上报了 state 时写入状态（StateChanged 或 AttributeChanged）。
     */
    Task<UpsertResult> createOrUpsert(Device device, std::vector<DiscoveredEntity> entities,
                                      std::optional<Json::Value> serviceData = std::nullopt) {
        device.validate();
        for (const auto& discovered : entities) {
            Entity::validateKey(discovered.entityId);
        }

        auto deviceGuard = co_await deviceLocks_.acquire(deviceLockKey(device));

        std::optional<Device> existing;
        if (device.hasIdentity()) {
            existing = co_await store_->findDeviceByUniqueId(device.integration, device.uniqueId);
        }
        if (!existing && !device.id.empty()) {
            existing = co_await store_->findDevice(device.id);
        }

        const bool created = !existing;
        Device stored;
        if (existing) {
            stored = *existing;
            stored.mergeFrom(device);
        } else {
            stored = std::move(device);
            if (stored.id.empty()) stored.id = drogon::utils::getUuid();
        }
        co_await store_->saveDevice(stored);

        if (created) {
            Json::Value data;
            data["device_id"] = stored.id;
            data["name"] = stored.name;
            data["integration"] = stored.integration;
            data["unique_id"] = stored.uniqueId;
            if (serviceData) data["service_data"] = *serviceData;
            publish(Event::create(EventType::DeviceDetected, "", std::move(data)));
            LOG_INFO << "[EntityService] Device detected: " << stored.name
                     << " (" << stored.integration << "/" << stored.uniqueId << ")";
        }

        std::vector<Entity> results;
        results.reserve(entities.size());
        for (auto& discovered : entities) {
            results.push_back(co_await upsertEntity(stored, std::move(discovered)));
        }

        co_return std::make_pair(std::move(stored), std::move(results));
    }

    /**
     * @brief 集成上报入口
     */
    Task<UpsertResult> upsertDiscovered(DiscoveredDevice discovered) {
        co_return co_await createOrUpsert(std::move(discovered.device),
                                          std::move(discovered.entities),
                                          std::move(discovered.serviceData));
    }

    // ==================== 写入 ====================

    /**
     * @brief 手动创建实体（设备必须已存在）
     */
    Task<Entity> create(Entity entity) {
        if (entity.id.empty()) entity.id = drogon::utils::getUuid();
        if (StringUtils::trim(entity.friendlyName).empty()) entity.friendlyName = entity.entityId;
        entity.validate();

        auto guard = co_await entityLocks_.acquire(entity.entityId);

        if (!(co_await store_->findDevice(entity.deviceId))) {
            throw NotFoundException("设备不存在: " + entity.deviceId);
        }
        if (co_await store_->findEntityByKey(entity.entityId)) {
            throw ValidationException("entity_id 已存在: " + entity.entityId);
        }

        auto now = TimestampHelper::now();
        entity.lastChanged = now;
        entity.lastUpdated = now;
        co_await store_->saveEntity(entity);
        publishAdded(entity);
        co_return entity;
    }

    /**
     * @brief 更新状态
     *
     * 状态相同时 lastChanged 不变、lastUpdated 前进并持久化，但不发布事件
     */
    Task<Entity> updateState(const std::string& entityId, EntityState newState) {
        auto guard = co_await entityLocks_.acquire(entityId);

        auto entity = co_await requireEntity(entityId);
        auto oldState = entity.state;
        bool changed = entity.applyState(newState, TimestampHelper::now());

        co_await store_->saveEntity(entity);

        if (changed) {
            publish(Event::create(EventType::StateChanged, entity.entityId,
                                  stateChangedData(entity, oldState)));
            LOG_DEBUG << "[EntityService] " << entityId << ": " << entityStateToString(oldState)
                      << " -> " << entityStateToString(newState);
        }
        co_return entity;
    }

    /**
     * @brief 合并属性（插入/覆盖，不删除）
     */
    Task<Entity> updateAttributes(const std::string& entityId, const AttributeMap& patch) {
        auto guard = co_await entityLocks_.acquire(entityId);

        auto entity = co_await requireEntity(entityId);
        auto changedKeys = mergeAttributes(entity.attributes, patch);
        entity.touch(TimestampHelper::now());

        co_await store_->saveEntity(entity);

        if (!changedKeys.empty()) {
            publish(Event::create(EventType::AttributeChanged, entity.entityId,
                                  attributeChangedData(entity, changedKeys)));
        }
        co_return entity;
    }

    /**
     * @brief 删除实体，发布 EntityRemoved
     */
    Task<> remove(const std::string& entityId) {
        auto guard = co_await entityLocks_.acquire(entityId);

        auto entity = co_await requireEntity(entityId);
        if (!(co_await store_->deleteEntity(entity.id))) {
            throw NotFoundException("实体不存在: " + entityId);
        }

        Json::Value data;
        data["entity_id"] = entity.entityId;
        data["device_id"] = entity.deviceId;
        publish(Event::create(EventType::EntityRemoved, entity.entityId, std::move(data)));
        LOG_INFO << "[EntityService] Entity removed: " << entityId;
    }

    // ==================== 查询 ====================

    Task<Entity> get(const std::string& entityId) {
        co_return co_await requireEntity(entityId);
    }

    Task<std::optional<Entity>> find(const std::string& entityId) {
        co_return co_await store_->findEntityByKey(entityId);
    }

    Task<std::vector<Entity>> list() {
        co_return co_await store_->listEntities();
    }

    Task<std::vector<Entity>> listByDevice(const std::string& deviceId) {
        co_return co_await store_->findEntitiesByDeviceIds({deviceId});
    }

private:
    HubStorePtr store_;
    EventBusPtr bus_;
    KeyedAsyncMutex entityLocks_;
    KeyedAsyncMutex deviceLocks_;

    static std::string deviceLockKey(const Device& device) {
        if (device.hasIdentity()) return "uid:" + device.integration + "/" + device.uniqueId;
        if (!device.id.empty()) return "id:" + device.id;
        return "new:" + drogon::utils::getUuid();
    }

    Task<Entity> requireEntity(const std::string& entityId) {
        auto entity = co_await store_->findEntityByKey(entityId);
        if (!entity) {
            throw NotFoundException("实体不存在: " + entityId);
        }
        co_return std::move(*entity);
    }

    Task<Entity> upsertEntity(const Device& device, DiscoveredEntity discovered) {
        auto guard = co_await entityLocks_.acquire(discovered.entityId);

        auto current = co_await store_->findEntityByKey(discovered.entityId);
        auto name = StringUtils::trim(discovered.friendlyName);

        if (!current) {
            auto entity = Entity::create(device.id, discovered.entityId,
                                         name.empty() ? discovered.entityId : name,
                                         discovered.state.value_or(EntityState::Unknown),
                                         std::move(discovered.attributes));
            entity.validate();
            co_await store_->saveEntity(entity);
            publishAdded(entity);
            co_return entity;
        }

        Entity entity = std::move(*current);
        bool metaChanged = false;
        if (!name.empty() && name != entity.friendlyName) {
            entity.friendlyName = name;
            metaChanged = true;
        }
        if (entity.deviceId != device.id) {
            LOG_WARN << "[EntityService] " << entity.entityId << " moved from device "
                     << entity.deviceId << " to " << device.id;
            entity.deviceId = device.id;
            metaChanged = true;
        }

        auto changedKeys = mergeAttributes(entity.attributes, discovered.attributes);
        auto oldState = entity.state;
        bool stateChanged = false;
        auto now = TimestampHelper::now();
        if (discovered.state) {
            stateChanged = entity.applyState(*discovered.state, now);
        } else if (metaChanged || !changedKeys.empty()) {
            entity.touch(now);
        } else {
            co_return entity;
        }

        co_await store_->saveEntity(entity);

        if (stateChanged) {
            auto data = stateChangedData(entity, oldState);
            if (!changedKeys.empty()) data["attributes_changed"] = true;
            publish(Event::create(EventType::StateChanged, entity.entityId, std::move(data)));
        } else if (!changedKeys.empty()) {
            publish(Event::create(EventType::AttributeChanged, entity.entityId,
                                  attributeChangedData(entity, changedKeys)));
        }
        co_return entity;
    }

    static Json::Value stateChangedData(const Entity& entity, EntityState oldState) {
        Json::Value data;
        data["entity_id"] = entity.entityId;
        data["old_state"] = entityStateToString(oldState);
        data["new_state"] = entityStateToString(entity.state);
        return data;
    }

    static Json::Value attributeChangedData(const Entity& entity,
                                            const std::vector<std::string>& changedKeys) {
        Json::Value data;
        data["entity_id"] = entity.entityId;
        Json::Value attributes(Json::objectValue);
        Json::Value keys(Json::arrayValue);
        for (const auto& key : changedKeys) {
            attributes[key] = entity.attributes.at(key);
            keys.append(key);
        }
        data["attributes"] = attributes;
        data["changed_keys"] = keys;
        return data;
    }

    void publishAdded(const Entity& entity) {
        Json::Value data;
        data["entity_id"] = entity.entityId;
        data["device_id"] = entity.deviceId;
        data["state"] = entityStateToString(entity.state);
        publish(Event::create(EventType::EntityAdded, entity.entityId, std::move(data)));
    }

    void publish(Event event) {
        auto type = event.type;
        auto entityId = event.entityId;
        try {
            if (!bus_->publish(std::move(event))) {
                LOG_WARN << "[EntityService] Event " << eventTypeToString(type)
                         << " for " << entityId << " not delivered: bus closed";
            }
        } catch (const std::exception& e) {
            LOG_ERROR << "[EntityService] Failed to publish " << eventTypeToString(type)
                      << " for " << entityId << ": " << e.what();
        }
    }
};

using EntityServicePtr = std::shared_ptr<EntityService>;
