#pragma once

#include "AutomationEngine.hpp"

/**
 * @brief 自动化管理服务
 *
 * 写入前按配置的 Delay 上限校验；每次修改后刷新引擎快照
 */
class AutomationService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    AutomationService(HubStorePtr store, AutomationEnginePtr engine,
                      int64_t maxDelaySec = Constants::AUTOMATION_MAX_DELAY_SEC)
        : store_(std::move(store)), engine_(std::move(engine)), maxDelaySec_(maxDelaySec) {}

    Task<Automation> create(Automation automation) {
        if (automation.id.empty()) automation.id = drogon::utils::getUuid();
        automation.lastTriggered.reset();
        automation.validate(maxDelaySec_);

        if (co_await store_->findAutomation(automation.id)) {
            throw ValidationException("自动化 id 已存在: " + automation.id);
        }
        co_await store_->saveAutomation(automation);
        co_await engine_->reloadAutomations();

        LOG_INFO << "[AutomationService] Created: " << automation.name;
        co_return automation;
    }

    /**
     * @brief 替换定义；保留 id 与 last_triggered
     */
    Task<Automation> update(const std::string& id, Automation automation) {
        auto existing = co_await get(id);
        automation.id = existing.id;
        automation.lastTriggered = existing.lastTriggered;
        automation.validate(maxDelaySec_);

        co_await store_->saveAutomation(automation);
        co_await engine_->reloadAutomations();
        co_return automation;
    }

    Task<Automation> setEnabled(const std::string& id, bool enabled) {
        auto automation = co_await get(id);
        if (automation.enabled == enabled) co_return automation;

        automation.enabled = enabled;
        co_await store_->saveAutomation(automation);
        co_await engine_->reloadAutomations();
        LOG_INFO << "[AutomationService] " << automation.name << (enabled ? " enabled" : " disabled");
        co_return automation;
    }

    Task<> remove(const std::string& id) {
        if (!(co_await store_->deleteAutomation(id))) {
            throw NotFoundException("自动化不存在: " + id);
        }
        co_await engine_->reloadAutomations();
    }

    Task<Automation> get(const std::string& id) {
        auto automation = co_await store_->findAutomation(id);
        if (!automation) {
            throw NotFoundException("自动化不存在: " + id);
        }
        co_return std::move(*automation);
    }

    Task<std::vector<Automation>> list() {
        co_return co_await store_->listAutomations();
    }

    Task<AutomationEngine::RunOutcome> trigger(const std::string& id) {
        co_return co_await engine_->trigger(id);
    }

private:
    HubStorePtr store_;
    AutomationEnginePtr engine_;
    int64_t maxDelaySec_;
};

using AutomationServicePtr = std::shared_ptr<AutomationService>;
