#pragma once

#include "modules/entity/Entity.Service.hpp"
#include "common/domain/EventBus.hpp"

/**
 * @brief 集成可见的运行时接口
 *
 * 只暴露两项能力：上报发现的设备，发布事件。
 * 在全部服务装配完成后创建，于 setup 时交给集成。
 */
class IntegrationContext {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    IntegrationContext(EntityServicePtr entityService, EventBusPtr bus)
        : entityService_(std::move(entityService)), bus_(std::move(bus)) {}

    Task<EntityService::UpsertResult> upsertDiscovered(DiscoveredDevice discovered) {
        co_return co_await entityService_->upsertDiscovered(std::move(discovered));
    }

    /**
     * @return false 总线已关闭
     */
    bool publish(Event event) {
        return bus_->publish(std::move(event));
    }

private:
    EntityServicePtr entityService_;
    EventBusPtr bus_;
};

using IntegrationContextPtr = std::shared_ptr<IntegrationContext>;
