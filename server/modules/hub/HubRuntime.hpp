#pragma once

#include "common/storage/MemoryStore.hpp"
#include "common/storage/PgStore.hpp"
#include "common/utils/HubConfig.hpp"
#include "modules/entity/Entity.Service.hpp"
#include "modules/device/Device.Service.hpp"
#include "modules/area/Area.Service.hpp"
#include "modules/automation/Automation.Service.hpp"
#include "modules/integration/ServiceRouter.hpp"
#include "modules/integration/IntegrationManager.hpp"
#include "modules/integration/virtual/VirtualIntegration.hpp"
#include "modules/integration/presence/PresenceIntegration.hpp"
#include "modules/history/HistoryRecorder.hpp"
#include "modules/live/LiveUpdateHub.hpp"

/**
 * @brief 运行时组合根（单例）
 *
 * 装配顺序：存储 → 总线 → 实体服务 → 其余服务 → 引擎/记录器/推送 → 集成。
 * IntegrationContext 在所有服务装配完成后才创建（两阶段生命周期）。
 *
 * 关闭顺序：引擎停止接收新运行 → 集成取消并 teardown → 记录器定时器停止 → 关闭总线。
 */
class HubRuntime {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    using Integrations = IntegrationManager<VirtualIntegration, PresenceIntegration>;
    using IntegrationsPtr = std::shared_ptr<Integrations>;

    static HubRuntime& instance() {
        static HubRuntime runtime;
        return runtime;
    }

    static HubStorePtr createStore(const HubConfig& config) {
        if (config.usesDatabase()) {
            return std::make_shared<PgStore>();
        }
        LOG_WARN << "[Hub] Using in-memory storage, data is lost on exit";
        return std::make_shared<MemoryStore>();
    }

    /**
     * @brief 按配置装配全部组件（不启动任何任务）
     */
    void build(const HubConfig& config, HubStorePtr store) {
        config_ = config;
        store_ = std::move(store);
        bus_ = std::make_shared<EventBus>(config.eventBusCapacity);

        entityService_ = std::make_shared<EntityService>(store_, bus_);
        deviceService_ = std::make_shared<DeviceService>(store_, entityService_);
        areaService_ = std::make_shared<AreaService>(store_);
        router_ = std::make_shared<ServiceRouter>(store_, entityService_, bus_);

        engine_ = std::make_shared<AutomationEngine>(
            store_, bus_,
            [router = router_](const std::string& entityId, const std::string& service,
                               const Json::Value& data) {
                return router->call(entityId, service, data);
            },
            config.automationTickIntervalSec);
        automationService_ = std::make_shared<AutomationService>(
            store_, engine_, config.automationMaxDelaySec);

        history_ = std::make_shared<HistoryRecorder>(store_, bus_, HistoryRecorder::Options{
            config.historyRetentionDays, config.historyPurgeIntervalHours, config.recordEvents});
        live_ = std::make_shared<LiveUpdateHub>(bus_, config.liveUpdateQueueCapacity);

        integrations_ = std::make_shared<Integrations>(
            std::make_shared<VirtualIntegration>(config.virtualEnabled, config.virtualPollIntervalSec),
            std::make_shared<PresenceIntegration>(config.presenceEnabled, config.presenceTargets,
                                                  config.presenceScanIntervalSec,
                                                  config.presenceConnectTimeoutSec));
        router_->setIntegrationDispatch(
            [integrations = integrations_](const std::string& integration, const std::string& entityId,
                                           const std::string& service, const Json::Value& data) {
                return integrations->handleServiceCall(integration, entityId, service, data);
            });
        integrations_->setContext(std::make_shared<IntegrationContext>(entityService_, bus_));

        LOG_INFO << "[Hub] Components wired (storage: " << config.storageDriver
                 << ", bus capacity: " << bus_->capacity() << ")";
    }

    /**
     * @brief 启动阶段：engine:load → workers:start → integrations:setup → integrations:start
     * @param stage 输出当前阶段名，失败时用于提示
     */
    Task<> start(std::string& stage) {
        if (!bus_) {
            throw InternalException("HubRuntime 尚未装配");
        }
        auto* loop = drogon::app().getLoop();

        stage = "engine:load";
        LOG_INFO << "[Startup] " << stage;
        co_await engine_->loadAutomations();

        stage = "workers:start";
        LOG_INFO << "[Startup] " << stage;
        history_->start(loop);
        live_->start();
        engine_->start(loop);

        stage = "integrations:setup";
        LOG_INFO << "[Startup] " << stage;
        auto ready = co_await integrations_->setupAll();

        stage = "integrations:start";
        LOG_INFO << "[Startup] " << stage;
        auto background = integrations_->startAll();

        running_ = true;

        Json::Value data;
        data["integrations_ready"] = static_cast<Json::UInt64>(ready);
        data["background_tasks"] = static_cast<Json::UInt64>(background);
        bus_->publish(Event::custom("hub_started", std::move(data)));
    }

    /**
     * @brief 有序关闭；可重复调用
     */
    Task<> stop() {
        if (!bus_ || stopped_.exchange(true)) co_return;
        LOG_INFO << "[Hub] Shutting down";

        engine_->stop();
        try {
            co_await integrations_->teardownAll();
        } catch (const std::exception& e) {
            LOG_ERROR << "[Hub] Integration teardown failed: " << e.what();
        }
        history_->stop();
        bus_->publish(Event::custom("hub_stopping"));
        bus_->close();

        running_ = false;
        LOG_INFO << "[Hub] Stopped";
    }

    bool isRunning() const { return running_.load(); }

    const HubConfig& config() const { return config_; }
    HubStorePtr store() const { return store_; }
    EventBusPtr bus() const { return bus_; }
    EntityServicePtr entities() const { return entityService_; }
    DeviceServicePtr devices() const { return deviceService_; }
    AreaServicePtr areas() const { return areaService_; }
    AutomationServicePtr automations() const { return automationService_; }
    AutomationEnginePtr engine() const { return engine_; }
    ServiceRouterPtr router() const { return router_; }
    IntegrationsPtr integrations() const { return integrations_; }
    HistoryRecorderPtr history() const { return history_; }
    LiveUpdateHubPtr live() const { return live_; }

    /**
     * @brief 运行状态摘要（诊断用）
     */
    Json::Value status() const {
        Json::Value json;
        json["running"] = isRunning();
        json["storage"] = config_.storageDriver;
        if (bus_) {
            json["event_bus"]["capacity"] = static_cast<Json::UInt64>(bus_->capacity());
            json["event_bus"]["published"] = static_cast<Json::UInt64>(bus_->publishedCount());
            json["event_bus"]["subscribers"] = static_cast<Json::UInt64>(bus_->subscriberCount());
        }
        if (engine_) {
            json["automations"]["enabled"] = static_cast<Json::UInt64>(engine_->automationCount());
            json["automations"]["active_runs"] = engine_->activeRuns();
        }
        if (live_) {
            json["live_subscribers"] = static_cast<Json::UInt64>(live_->subscriberCount());
        }
        if (integrations_) {
            json["integrations"] = integrations_->status();
        }
        return json;
    }

private:
    HubRuntime() = default;

    HubConfig config_;
    HubStorePtr store_;
    EventBusPtr bus_;
    EntityServicePtr entityService_;
    DeviceServicePtr deviceService_;
    AreaServicePtr areaService_;
    AutomationServicePtr automationService_;
    AutomationEnginePtr engine_;
    ServiceRouterPtr router_;
    IntegrationsPtr integrations_;
    HistoryRecorderPtr history_;
    LiveUpdateHubPtr live_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
};
