#pragma once

#include "HubStore.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 内存存储（storage.driver = "memory"，也用于测试）
 *
 * 进程退出即丢失。与 PgStore 保持相同的唯一性约束：
 * - entity_id 全局唯一
 * - (integration, unique_id) 在 unique_id 非空时唯一
 */
class MemoryStore : public HubStore {
public:
    // ==================== Entity ====================

    Task<> saveEntity(const Entity& entity) override {
        std::unique_lock lock(mutex_);
        for (const auto& [id, existing] : entities_) {
            if (id != entity.id && existing.entityId == entity.entityId) {
                throw StorageException("entity_id 已存在: " + entity.entityId);
            }
        }
        entities_[entity.id] = entity;
        co_return;
    }

    Task<std::optional<Entity>> findEntity(const std::string& id) override {
        std::shared_lock lock(mutex_);
        co_return findIn(entities_, id);
    }

    Task<std::optional<Entity>> findEntityByKey(const std::string& entityId) override {
        std::shared_lock lock(mutex_);
        for (const auto& [id, entity] : entities_) {
            if (entity.entityId == entityId) co_return entity;
        }
        co_return std::nullopt;
    }

    Task<std::vector<Entity>> listEntities() override {
        std::shared_lock lock(mutex_);
        std::vector<Entity> result;
        for (const auto& [id, entity] : entities_) result.push_back(entity);
        std::sort(result.begin(), result.end(), [](const Entity& a, const Entity& b) {
            return a.entityId < b.entityId;
        });
        co_return result;
    }

    Task<std::vector<Entity>> findEntitiesByDeviceIds(const std::vector<std::string>& deviceIds) override {
        std::set<std::string> wanted(deviceIds.begin(), deviceIds.end());
        std::shared_lock lock(mutex_);
        std::vector<Entity> result;
        for (const auto& [id, entity] : entities_) {
            if (wanted.count(entity.deviceId)) result.push_back(entity);
        }
        std::sort(result.begin(), result.end(), [](const Entity& a, const Entity& b) {
            return a.entityId < b.entityId;
        });
        co_return result;
    }

    Task<bool> deleteEntity(const std::string& id) override {
        std::unique_lock lock(mutex_);
        co_return entities_.erase(id) > 0;
    }

    // ==================== Device ====================

    Task<> saveDevice(const Device& device) override {
        std::unique_lock lock(mutex_);
        if (device.hasIdentity()) {
            for (const auto& [id, existing] : devices_) {
                if (id != device.id && existing.integration == device.integration &&
                    existing.uniqueId == device.uniqueId) {
                    throw StorageException("设备标识已存在: " + device.integration + "/" + device.uniqueId);
                }
            }
        }
        devices_[device.id] = device;
        co_return;
    }

    Task<std::optional<Device>> findDevice(const std::string& id) override {
        std::shared_lock lock(mutex_);
        co_return findIn(devices_, id);
    }

    Task<std::optional<Device>> findDeviceByUniqueId(const std::string& integration,
                                                     const std::string& uniqueId) override {
        if (uniqueId.empty()) co_return std::nullopt;
        std::shared_lock lock(mutex_);
        for (const auto& [id, device] : devices_) {
            if (device.integration == integration && device.uniqueId == uniqueId) co_return device;
        }
        co_return std::nullopt;
    }

    Task<std::vector<Device>> listDevices() override {
        std::shared_lock lock(mutex_);
        std::vector<Device> result;
        for (const auto& [id, device] : devices_) result.push_back(device);
        std::sort(result.begin(), result.end(), [](const Device& a, const Device& b) {
            return a.name < b.name;
        });
        co_return result;
    }

    Task<bool> deleteDevice(const std::string& id) override {
        std::unique_lock lock(mutex_);
        if (devices_.erase(id) == 0) co_return false;
        std::erase_if(entities_, [&](const auto& kv) { return kv.second.deviceId == id; });
        co_return true;
    }

    // ==================== Area ====================

    Task<> saveArea(const Area& area) override {
        std::unique_lock lock(mutex_);
        areas_[area.id] = area;
        co_return;
    }

    Task<std::optional<Area>> findArea(const std::string& id) override {
        std::shared_lock lock(mutex_);
        co_return findIn(areas_, id);
    }

    Task<std::vector<Area>> listAreas() override {
        std::shared_lock lock(mutex_);
        std::vector<Area> result;
        for (const auto& [id, area] : areas_) result.push_back(area);
        std::sort(result.begin(), result.end(), [](const Area& a, const Area& b) {
            return a.name < b.name;
        });
        co_return result;
    }

    Task<bool> deleteArea(const std::string& id) override {
        std::unique_lock lock(mutex_);
        co_return areas_.erase(id) > 0;
    }

    // ==================== Event ====================

    Task<> saveEvent(const Event& event) override {
        std::unique_lock lock(mutex_);
        events_.push_back(event);
        if (events_.size() > maxEvents_) {
            events_.pop_front();
        }
        co_return;
    }

    Task<std::optional<Event>> findEvent(const std::string& id) override {
        std::shared_lock lock(mutex_);
        for (const auto& event : events_) {
            if (event.id == id) co_return event;
        }
        co_return std::nullopt;
    }

    Task<std::vector<Event>> listRecentEvents(int limit) override {
        std::shared_lock lock(mutex_);
        std::vector<Event> result;
        for (auto it = events_.rbegin(); it != events_.rend() && static_cast<int>(result.size()) < limit; ++it) {
            result.push_back(*it);
        }
        co_return result;
    }

    Task<std::vector<Event>> listEventsByEntity(const std::string& entityId, int limit) override {
        std::shared_lock lock(mutex_);
        std::vector<Event> result;
        for (auto it = events_.rbegin(); it != events_.rend() && static_cast<int>(result.size()) < limit; ++it) {
            if (it->entityId == entityId) result.push_back(*it);
        }
        co_return result;
    }

    // ==================== Automation ====================

    Task<> saveAutomation(const Automation& automation) override {
        std::unique_lock lock(mutex_);
        automations_[automation.id] = automation;
        co_return;
    }

    Task<std::optional<Automation>> findAutomation(const std::string& id) override {
        std::shared_lock lock(mutex_);
        co_return findIn(automations_, id);
    }

    Task<std::vector<Automation>> listAutomations() override {
        std::shared_lock lock(mutex_);
        std::vector<Automation> result;
        for (const auto& [id, automation] : automations_) result.push_back(automation);
        co_return result;
    }

    Task<std::vector<Automation>> listEnabledAutomations() override {
        std::shared_lock lock(mutex_);
        std::vector<Automation> result;
        for (const auto& [id, automation] : automations_) {
            if (automation.enabled) result.push_back(automation);
        }
        co_return result;
    }

    Task<bool> deleteAutomation(const std::string& id) override {
        std::unique_lock lock(mutex_);
        co_return automations_.erase(id) > 0;
    }

    // ==================== EntityHistory ====================

    Task<> saveHistory(const EntityHistory& row) override {
        std::unique_lock lock(mutex_);
        history_.push_back(row);
        co_return;
    }

    Task<std::vector<EntityHistory>> listHistory(const std::string& entityId,
                                                 Timestamp from, Timestamp to,
                                                 int limit) override {
        std::shared_lock lock(mutex_);
        std::vector<EntityHistory> result;
        for (const auto& row : history_) {
            if (row.entityId == entityId && row.recordedAt >= from && row.recordedAt <= to) {
                result.push_back(row);
            }
        }
        std::sort(result.begin(), result.end(), [](const EntityHistory& a, const EntityHistory& b) {
            return a.recordedAt < b.recordedAt;
        });
        if (limit > 0 && static_cast<int>(result.size()) > limit) {
            result.resize(static_cast<size_t>(limit));
        }
        co_return result;
    }

    Task<uint64_t> purgeHistoryBefore(Timestamp cutoff) override {
        std::unique_lock lock(mutex_);
        auto removed = std::erase_if(history_, [&](const EntityHistory& row) {
            return row.recordedAt < cutoff;
        });
        co_return static_cast<uint64_t>(removed);
    }

    size_t historySize() const {
        std::shared_lock lock(mutex_);
        return history_.size();
    }

private:
    template<typename Map>
    static std::optional<typename Map::mapped_type> findIn(const Map& map, const std::string& id) {
        auto it = map.find(id);
        if (it == map.end()) return std::nullopt;
        return it->second;
    }

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entity> entities_;
    std::map<std::string, Device> devices_;
    std::map<std::string, Area> areas_;
    std::map<std::string, Automation> automations_;
    std::deque<Event> events_;
    std::vector<EntityHistory> history_;
    size_t maxEvents_ = static_cast<size_t>(Constants::MAX_UNPAGED_ROWS) * 5;
};
