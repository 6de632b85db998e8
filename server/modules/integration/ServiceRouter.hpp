#pragma once

#include "modules/entity/Entity.Service.hpp"
#include "common/storage/HubStore.hpp"

/**
 * @brief 服务调用路由
 *
 * 目标实体所属设备的 integration 由 IntegrationManager 管理时交给该集成处理；
 * 否则（手动创建的设备）走内置服务 turn_on / turn_off / toggle，直接写入状态。
 * 调用成功后发布 ServiceCalled。
 */
class ServiceRouter {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    /**
     * @brief 集成分发函数
     * @return false 表示没有名为 integration 的集成（回落到内置服务）
     */
    using IntegrationDispatch = std::function<Task<bool>(const std::string& integration,
                                                         const std::string& entityId,
                                                         const std::string& service,
                                                         const Json::Value& data)>;

    ServiceRouter(HubStorePtr store, EntityServicePtr entityService, EventBusPtr bus)
        : store_(std::move(store)), entityService_(std::move(entityService)), bus_(std::move(bus)) {}

    /**
     * @brief 两阶段装配：集成管理器构造完成后注入
     */
    void setIntegrationDispatch(IntegrationDispatch dispatch) {
        dispatch_ = std::move(dispatch);
    }

    /**
     * @brief 调用实体服务
     * @throws NotFoundException 实体不存在
     * @throws ValidationException 服务未知
     * @throws IntegrationException 所属集成未运行或调用失败
     */
    Task<> call(std::string entityId, std::string service, Json::Value data) {
        auto entity = co_await entityService_->get(entityId);

        std::string integration;
        if (auto device = co_await store_->findDevice(entity.deviceId)) {
            integration = device->integration;
        }

        bool handled = false;
        if (!integration.empty() && dispatch_) {
            handled = co_await dispatch_(integration, entityId, service, data);
        }
        if (!handled) {
            co_await callBuiltin(entity, service);
            integration.clear();
        }

        Json::Value payload;
        payload["entity_id"] = entityId;
        payload["service"] = service;
        payload["data"] = data;
        payload["integration"] = integration.empty() ? Json::Value(Json::nullValue) : Json::Value(integration);
        if (!bus_->publish(Event::create(EventType::ServiceCalled, entityId, std::move(payload)))) {
            LOG_WARN << "[ServiceRouter] ServiceCalled for " << entityId << " not delivered: bus closed";
        }
    }

    /**
     * @brief 内置服务是否可识别
     */
    static bool isBuiltinService(const std::string& service) {
        return service == "turn_on" || service == "turn_off" || service == "toggle";
    }

private:
    HubStorePtr store_;
    EntityServicePtr entityService_;
    EventBusPtr bus_;
    IntegrationDispatch dispatch_;

    Task<> callBuiltin(const Entity& entity, const std::string& service) {
        if (!isBuiltinService(service)) {
            throw ValidationException("未知服务: " + service + "（实体 " + entity.entityId + "）");
        }
        if (service == "turn_on") {
            co_await entityService_->updateState(entity.entityId, EntityState::On);
        } else if (service == "turn_off") {
            co_await entityService_->updateState(entity.entityId, EntityState::Off);
        } else {
            auto next = entity.state == EntityState::On ? EntityState::Off : EntityState::On;
            co_await entityService_->updateState(entity.entityId, next);
        }
    }
};

using ServiceRouterPtr = std::shared_ptr<ServiceRouter>;
