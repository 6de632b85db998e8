#pragma once

#include "modules/integration/IntegrationContext.hpp"
#include "common/utils/CancellationToken.hpp"

/**
 * @brief 虚拟集成：演示与测试用的模拟设备
 *
 * | 设备                    | 实体                        | 行为                         |
 * |-------------------------|-----------------------------|------------------------------|
 * | Virtual Light           | light.virtual_light         | turn_on / turn_off / toggle  |
 * | Virtual Switch          | switch.virtual_switch       | turn_on / turn_off / toggle  |
 * | Virtual Temperature     | sensor.virtual_temperature  | 只读；后台任务使读数漂移     |
 *
 * 状态写入都经由 IntegrationContext::upsertDiscovered。
 */
class VirtualIntegration {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    static constexpr const char* NAME = "virtual";
    static constexpr const char* LIGHT = "light.virtual_light";
    static constexpr const char* SWITCH = "switch.virtual_switch";
    static constexpr const char* SENSOR = "sensor.virtual_temperature";
    static constexpr double BASE_TEMPERATURE = 21.5;

    explicit VirtualIntegration(bool enabled = true,
                                double pollIntervalSec = Constants::VIRTUAL_POLL_INTERVAL_SEC)
        : enabled_(enabled), pollInterval_(pollIntervalSec) {}

    std::string name() const { return NAME; }
    bool enabled() const { return enabled_; }
    double pollInterval() const { return pollInterval_; }

    Task<> setup(IntegrationContextPtr ctx) {
        ctx_ = std::move(ctx);
        co_await ctx_->upsertDiscovered(describe(LIGHT, EntityState::Off));
        co_await ctx_->upsertDiscovered(describe(SWITCH, EntityState::Off));
        co_await ctx_->upsertDiscovered(describe(SENSOR, EntityState::Unknown));
        LOG_INFO << "[Virtual] 3 devices discovered";
    }

    Task<> teardown() {
        ctx_.reset();
        co_return;
    }

    /**
     * @brief 开关类实体响应 turn_on / turn_off / toggle；传感器对已知服务无操作
     * @throws ValidationException 未知服务
     * @throws NotFoundException 不属于本集成的实体
     */
    Task<> handleServiceCall(const std::string& entityId, const std::string& service,
                             const Json::Value& /*data*/) {
        if (entityId != LIGHT && entityId != SWITCH && entityId != SENSOR) {
            throw NotFoundException("虚拟集成中不存在实体: " + entityId);
        }
        if (service != "turn_on" && service != "turn_off" && service != "toggle") {
            throw ValidationException("虚拟集成不支持服务: " + service);
        }
        if (entityId == SENSOR) co_return;
        if (!ctx_) {
            throw IntegrationException("虚拟集成未运行");
        }

        EntityState next;
        {
            std::lock_guard lock(mutex_);
            auto& current = switchStates_[entityId];
            if (service == "turn_on") {
                next = EntityState::On;
            } else if (service == "turn_off") {
                next = EntityState::Off;
            } else {
                next = current == EntityState::On ? EntityState::Off : EntityState::On;
            }
            current = next;
        }
        co_await ctx_->upsertDiscovered(describe(entityId, next));
    }

    /**
     * @brief 温度读数随机游走，范围 [18, 26]，保留一位小数
     */
    Task<> poll(IntegrationContextPtr ctx, CancellationTokenPtr token) {
        if (token->isCancelled()) co_return;
        double reading;
        {
            std::lock_guard lock(mutex_);
            thread_local std::mt19937 rng{std::random_device{}()};
            std::uniform_real_distribution<double> step(-0.5, 0.5);
            temperature_ = std::clamp(temperature_ + step(rng), 18.0, 26.0);
            temperature_ = std::round(temperature_ * 10.0) / 10.0;
            reading = temperature_;
        }
        co_await ctx->upsertDiscovered(describe(SENSOR, std::nullopt, reading));
    }

    double temperature() const {
        std::lock_guard lock(mutex_);
        return temperature_;
    }

private:
    bool enabled_;
    double pollInterval_;
    IntegrationContextPtr ctx_;
    mutable std::mutex mutex_;
    std::map<std::string, EntityState> switchStates_{
        {LIGHT, EntityState::Off},
        {SWITCH, EntityState::Off},
    };
    double temperature_ = BASE_TEMPERATURE;

    static DiscoveredDevice describe(const std::string& entityId, std::optional<EntityState> state,
                                     double temperature = BASE_TEMPERATURE) {
        DiscoveredDevice discovered;
        auto& device = discovered.device;
        device.integration = NAME;
        device.manufacturer = "homehub";

        DiscoveredEntity entity;
        entity.entityId = entityId;
        entity.state = state;

        if (entityId == LIGHT) {
            device.name = "Virtual Light";
            device.model = "VLight-1";
            device.uniqueId = "virtual_light";
            entity.friendlyName = "Virtual Light";
        } else if (entityId == SWITCH) {
            device.name = "Virtual Switch";
            device.model = "VSwitch-1";
            device.uniqueId = "virtual_switch";
            entity.friendlyName = "Virtual Switch";
        } else {
            device.name = "Virtual Sensor";
            device.model = "VSensor-1";
            device.uniqueId = "virtual_sensor";
            entity.friendlyName = "Virtual Temperature";
            entity.attributes["temperature"] = temperature;
            entity.attributes["unit"] = "°C";
        }

        discovered.entities.push_back(std::move(entity));
        return discovered;
    }
};
