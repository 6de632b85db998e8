#pragma once

#include "domain/Area.hpp"
#include "common/storage/HubStore.hpp"

/**
 * @brief 区域服务
 *
 * 父节点必须存在；父链回到自身视为环，拒绝写入。
 * 仍有子区域或设备的区域不允许删除。
 */
class AreaService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    explicit AreaService(HubStorePtr store) : store_(std::move(store)) {}

    Task<Area> create(Area area) {
        if (area.id.empty()) area.id = drogon::utils::getUuid();
        area.validate();
        co_await checkParent(area);
        co_await store_->saveArea(area);
        co_return area;
    }

    Task<Area> update(const std::string& id, const std::string& name, const std::string& parentId) {
        auto area = co_await get(id);
        area.name = name;
        area.parentId = parentId;
        area.validate();
        co_await checkParent(area);
        co_await store_->saveArea(area);
        co_return area;
    }

    Task<Area> get(const std::string& id) {
        auto area = co_await store_->findArea(id);
        if (!area) {
            throw NotFoundException("区域不存在: " + id);
        }
        co_return std::move(*area);
    }

    Task<std::vector<Area>> list() {
        co_return co_await store_->listAreas();
    }

    Task<> remove(const std::string& id) {
        auto area = co_await get(id);

        auto areas = co_await store_->listAreas();
        for (const auto& other : areas) {
            if (other.parentId == area.id) {
                throw ValidationException("区域下仍有子区域: " + other.name);
            }
        }
        auto devices = co_await store_->listDevices();
        for (const auto& device : devices) {
            if (device.areaId == area.id) {
                throw ValidationException("区域下仍有设备: " + device.name);
            }
        }

        co_await store_->deleteArea(area.id);
    }

private:
    HubStorePtr store_;

    /**
     * @brief 沿父链向上检查：父节点存在且链上不出现自身
     */
    Task<> checkParent(const Area& area) {
        std::set<std::string> visited{area.id};
        std::string current = area.parentId;
        while (!current.empty()) {
            if (!visited.insert(current).second) {
                throw ValidationException("区域层级存在环: " + area.name);
            }
            auto parent = co_await store_->findArea(current);
            if (!parent) {
                throw ValidationException("父区域不存在: " + current);
            }
            current = parent->parentId;
        }
    }
};

using AreaServicePtr = std::shared_ptr<AreaService>;
