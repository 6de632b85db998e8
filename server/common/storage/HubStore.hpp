#pragma once

#include "common/domain/Event.hpp"
#include "modules/entity/domain/Entity.hpp"
#include "modules/device/domain/Device.hpp"
#include "modules/area/domain/Area.hpp"
#include "modules/automation/domain/Automation.hpp"
#include "modules/history/domain/EntityHistory.hpp"

/**
 * @brief 存储端口
 *
 * 核心只通过此接口访问持久化；写入的串行化由具体存储负责。
 * 所有失败以 StorageException 抛出，find* 未命中返回 nullopt 而非异常。
 * save* 为 upsert 语义（按 id）。
 */
class HubStore {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    virtual ~HubStore() = default;

    // ==================== Entity ====================

    virtual Task<> saveEntity(const Entity& entity) = 0;
    virtual Task<std::optional<Entity>> findEntity(const std::string& id) = 0;
    virtual Task<std::optional<Entity>> findEntityByKey(const std::string& entityId) = 0;
    virtual Task<std::vector<Entity>> listEntities() = 0;
    /** 批量按设备查询，避免逐设备循环查询 */
    virtual Task<std::vector<Entity>> findEntitiesByDeviceIds(const std::vector<std::string>& deviceIds) = 0;
    virtual Task<bool> deleteEntity(const std::string& id) = 0;

    // ==================== Device ====================

    virtual Task<> saveDevice(const Device& device) = 0;
    virtual Task<std::optional<Device>> findDevice(const std::string& id) = 0;
    virtual Task<std::optional<Device>> findDeviceByUniqueId(const std::string& integration,
                                                             const std::string& uniqueId) = 0;
    virtual Task<std::vector<Device>> listDevices() = 0;
    /** 删除设备及其下所有实体 */
    virtual Task<bool> deleteDevice(const std::string& id) = 0;

    // ==================== Area ====================

    virtual Task<> saveArea(const Area& area) = 0;
    virtual Task<std::optional<Area>> findArea(const std::string& id) = 0;
    virtual Task<std::vector<Area>> listAreas() = 0;
    virtual Task<bool> deleteArea(const std::string& id) = 0;

    // ==================== Event ====================

    virtual Task<> saveEvent(const Event& event) = 0;
    virtual Task<std::optional<Event>> findEvent(const std::string& id) = 0;
    /** 最近事件，按时间倒序 */
    virtual Task<std::vector<Event>> listRecentEvents(int limit) = 0;
    virtual Task<std::vector<Event>> listEventsByEntity(const std::string& entityId, int limit) = 0;

    // ==================== Automation ====================

    virtual Task<> saveAutomation(const Automation& automation) = 0;
    virtual Task<std::optional<Automation>> findAutomation(const std::string& id) = 0;
    virtual Task<std::vector<Automation>> listAutomations() = 0;
    virtual Task<std::vector<Automation>> listEnabledAutomations() = 0;
    virtual Task<bool> deleteAutomation(const std::string& id) = 0;

    // ==================== EntityHistory ====================

    virtual Task<> saveHistory(const EntityHistory& row) = 0;
    /** [from, to] 区间内的快照，按时间正序 */
    virtual Task<std::vector<EntityHistory>> listHistory(const std::string& entityId,
                                                         Timestamp from, Timestamp to,
                                                         int limit) = 0;
    /** 删除 recordedAt < cutoff 的行，返回删除数量 */
    virtual Task<uint64_t> purgeHistoryBefore(Timestamp cutoff) = 0;
};

using HubStorePtr = std::shared_ptr<HubStore>;
