#pragma once

#include "modules/integration/IntegrationContext.hpp"
#include "common/network/TcpProbe.hpp"
#include "common/utils/HubConfig.hpp"

/**
 * @brief 网络在线检测集成
 *
 * 每个配置目标对应一个设备和实体 binary_sensor.<name>；
 * 每轮扫描对目标做一次有时限的 TCP 连接探测，可达为 on，否则为 off。
 * 服务 refresh 立即探测单个目标。teardown 中止进行中的探测。
 */
class PresenceIntegration {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    static constexpr const char* NAME = "presence";

    PresenceIntegration(bool enabled, std::vector<PresenceTarget> targets,
                        double scanIntervalSec = Constants::PRESENCE_SCAN_INTERVAL_SEC,
                        double connectTimeoutSec = Constants::PRESENCE_CONNECT_TIMEOUT_SEC)
        : enabled_(enabled),
          targets_(std::move(targets)),
          scanInterval_(scanIntervalSec),
          connectTimeout_(connectTimeoutSec) {}

    std::string name() const { return NAME; }
    bool enabled() const { return enabled_; }
    double pollInterval() const { return scanInterval_; }

    static std::string entityIdFor(const PresenceTarget& target) {
        return "binary_sensor." + target.name;
    }

    Task<> setup(IntegrationContextPtr ctx) {
        ctx_ = std::move(ctx);
        for (const auto& target : targets_) {
            co_await ctx_->upsertDiscovered(describe(target, std::nullopt));
        }
        LOG_INFO << "[Presence] " << targets_.size() << " targets registered";
    }

    Task<> teardown() {
        teardownToken_->cancel();
        ctx_.reset();
        co_return;
    }

    /**
     * @brief refresh 立即探测；开关类服务对传感器无操作
     * @throws NotFoundException 不属于本集成的实体
     * @throws ValidationException 未知服务
     */
    Task<> handleServiceCall(const std::string& entityId, const std::string& service,
                             const Json::Value& /*data*/) {
        auto target = findTarget(entityId);
        if (!target) {
            throw NotFoundException("在线检测中不存在实体: " + entityId);
        }
        if (service == "turn_on" || service == "turn_off" || service == "toggle") {
            co_return;
        }
        if (service != "refresh") {
            throw ValidationException("在线检测不支持服务: " + service);
        }
        auto ctx = ctx_;
        if (!ctx) {
            throw IntegrationException("在线检测未运行");
        }
        co_await probeAndReport(ctx, *target, teardownToken_);
    }

    Task<> poll(IntegrationContextPtr ctx, CancellationTokenPtr token) {
        for (const auto& target : targets_) {
            if (token->isCancelled()) co_return;
            co_await probeAndReport(ctx, target, token);
        }
    }

    const std::vector<PresenceTarget>& targets() const { return targets_; }

private:
    bool enabled_;
    std::vector<PresenceTarget> targets_;
    double scanInterval_;
    double connectTimeout_;
    IntegrationContextPtr ctx_;
    CancellationTokenPtr teardownToken_ = std::make_shared<CancellationToken>();

    std::optional<PresenceTarget> findTarget(const std::string& entityId) const {
        for (const auto& target : targets_) {
            if (entityIdFor(target) == entityId) return target;
        }
        return std::nullopt;
    }

    Task<> probeAndReport(IntegrationContextPtr ctx, PresenceTarget target, CancellationTokenPtr token) {
        bool reachable = co_await TcpProbe::run(target.host, target.port, connectTimeout_, token);
        if (token->isCancelled()) co_return;

        LOG_TRACE << "[Presence] " << target.name << " (" << target.host << ":" << target.port
                  << ") " << (reachable ? "reachable" : "unreachable");
        co_await ctx->upsertDiscovered(
            describe(target, reachable ? EntityState::On : EntityState::Off));
    }

    static DiscoveredDevice describe(const PresenceTarget& target, std::optional<EntityState> state) {
        DiscoveredDevice discovered;
        discovered.device.name = target.name;
        discovered.device.manufacturer = "homehub";
        discovered.device.model = "TCP Probe";
        discovered.device.integration = NAME;
        discovered.device.uniqueId = "presence_" + target.name;

        DiscoveredEntity entity;
        entity.entityId = entityIdFor(target);
        entity.friendlyName = target.name;
        entity.state = state;
        entity.attributes["host"] = target.host;
        entity.attributes["port"] = static_cast<Json::UInt>(target.port);
        discovered.entities.push_back(std::move(entity));
        return discovered;
    }
};
