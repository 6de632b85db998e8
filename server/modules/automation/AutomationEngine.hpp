#pragma once

#include "domain/Automation.hpp"
#include "common/domain/EventBus.hpp"
#include "common/storage/HubStore.hpp"
#include "common/utils/CancellationToken.hpp"

/**
 * @brief 自动化引擎
 *
 * 流程：事件总线订阅 → 匹配触发器 → 每个匹配的规则独立运行（async_run）
 * → 条件依次求值（首个为假即静默中止）→ 动作依次执行 → 回写 last_triggered
 * → 发布 AutomationTriggered。
 *
 * 特性：
 * - 启用规则的内存快照，管理端修改后 reloadAutomations 刷新
 * - 事件循环本身从不等待动作；单次运行的异常只中止该次运行
 * - TimePattern 规则由定时 tick 驱动，每个自然分钟至多检查一次
 * - 停止后不再启动新运行；等待中的 Delay 提前结束，该次运行放弃
 */
class AutomationEngine : public std::enable_shared_from_this<AutomationEngine> {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    /** 服务调用入口（由组合根接到 ServiceRouter） */
    using ServiceCallFn = std::function<Task<>(const std::string& entityId,
                                              const std::string& service,
                                              const Json::Value& data)>;
    using Clock = std::function<Timestamp()>;

    enum class RunOutcome {
        Completed,
        ConditionsNotMet,
        Failed,
        Cancelled
    };

    static const char* runOutcomeToString(RunOutcome outcome) {
        switch (outcome) {
            case RunOutcome::Completed:        return "completed";
            case RunOutcome::ConditionsNotMet: return "conditions_not_met";
            case RunOutcome::Failed:           return "failed";
            case RunOutcome::Cancelled:        return "cancelled";
        }
        return "failed";
    }

    AutomationEngine(HubStorePtr store, EventBusPtr bus, ServiceCallFn callService,
                     double tickIntervalSec = Constants::AUTOMATION_TICK_INTERVAL_SEC)
        : store_(std::move(store)),
          bus_(std::move(bus)),
          callService_(std::move(callService)),
          tickInterval_(tickIntervalSec) {}

    AutomationEngine(const AutomationEngine&) = delete;
    AutomationEngine& operator=(const AutomationEngine&) = delete;

    /** 测试用：替换时钟 */
    void setClock(Clock clock) { clock_ = std::move(clock); }

    // ==================== 规则快照 ====================

    /**
     * @brief 从存储加载启用的规则
     *
     * 结构无效的规则（如 cron 解析失败）记录日志后跳过
     */
    Task<> loadAutomations() {
        auto automations = co_await store_->listEnabledAutomations();

        std::vector<CachedAutomation> cache;
        cache.reserve(automations.size());
        for (auto& automation : automations) {
            CachedAutomation cached;
            try {
                if (auto* t = std::get_if<TimePatternTrigger>(&automation.trigger)) {
                    cached.schedule = CronSchedule::parse(t->schedule);
                }
            } catch (const std::exception& e) {
                LOG_WARN << "[AutomationEngine] Skipping " << automation.name
                         << ": " << e.what();
                continue;
            }
            cached.automation = std::move(automation);
            cache.push_back(std::move(cached));
        }

        size_t count = cache.size();
        {
            std::unique_lock lock(mutex_);
            automations_ = std::move(cache);
        }
        LOG_INFO << "[AutomationEngine] " << count << " enabled automations loaded";
    }

    Task<> reloadAutomations() {
        co_await loadAutomations();
    }

    size_t automationCount() const {
        std::shared_lock lock(mutex_);
        return automations_.size();
    }

    // ==================== 生命周期 ====================

    /**
     * @brief 订阅总线并启动事件循环与 tick 定时器
     *
     * 订阅在返回前完成，之后发布的事件都会被处理
     */
    void start(trantor::EventLoop* loop = nullptr) {
        if (started_.exchange(true)) return;
        stopping_ = false;

        auto sub = bus_->subscribe();
        drogon::async_run([self = shared_from_this(), sub]() -> Task<> {
            co_await self->runLoop(sub);
        });

        if (!loop) loop = drogon::app().getLoop();
        tickLoop_ = loop;
        std::weak_ptr<AutomationEngine> weak = shared_from_this();
        tickTimer_ = loop->runEvery(tickInterval_, [weak]() {
            if (auto self = weak.lock()) {
                self->tick(self->now());
            }
        });
        LOG_INFO << "[AutomationEngine] Started (tick every " << tickInterval_ << "s)";
    }

    /**
     * @brief 停止：不再启动新运行，等待中的 Delay 提前结束
     */
    void stop() {
        if (stopping_.exchange(true)) return;
        if (tickLoop_ && tickTimer_) {
            tickLoop_->invalidateTimer(*tickTimer_);
            tickTimer_.reset();
        }
        stopToken_->cancel();
        LOG_INFO << "[AutomationEngine] Stopped (" << activeRuns_.load() << " runs abandoned)";
    }

    bool isStopping() const { return stopping_.load(); }
    int activeRuns() const { return activeRuns_.load(); }

    // ==================== 触发入口 ====================

    /**
     * @brief TimePattern 检查；同一自然分钟内重复调用无效
     * @return 本次启动的运行数
     */
    size_t tick(Timestamp now) {
        int64_t minute = TimestampHelper::toMicros(now) / 60'000'000;
        if (minute == lastTickMinute_.exchange(minute)) return 0;

        auto local = TimestampHelper::toLocal(now);
        std::vector<Automation> due;
        {
            std::shared_lock lock(mutex_);
            for (const auto& cached : automations_) {
                if (cached.schedule && cached.schedule->matches(local)) {
                    due.push_back(cached.automation);
                }
            }
        }
        for (auto& automation : due) {
            LOG_DEBUG << "[AutomationEngine] Time pattern matched: " << automation.name;
            launch(std::move(automation));
        }
        return due.size();
    }

    /**
     * @brief 手动触发（任意触发器类型），等待运行结束
     * @throws NotFoundException 规则不存在
     * @throws ValidationException 规则已停用
     */
    Task<RunOutcome> trigger(const std::string& automationId) {
        auto automation = co_await store_->findAutomation(automationId);
        if (!automation) {
            throw NotFoundException("自动化不存在: " + automationId);
        }
        if (!automation->enabled) {
            throw ValidationException("自动化已停用: " + automation->name);
        }
        if (stopping_) {
            co_return RunOutcome::Cancelled;
        }
        LOG_INFO << "[AutomationEngine] Manual trigger: " << automation->name;
        co_return co_await execute(std::move(*automation));
    }

    /**
     * @brief 执行一次：条件 → 动作 → 回写
     *
     * 不抛异常；错误记录日志并返回 Failed
     */
    Task<RunOutcome> execute(Automation automation) {
        ++activeRuns_;
        auto outcome = co_await runOnce(automation);
        --activeRuns_;
        co_return outcome;
    }

private:
    struct CachedAutomation {
        Automation automation;
        std::optional<CronSchedule> schedule;
    };

    HubStorePtr store_;
    EventBusPtr bus_;
    ServiceCallFn callService_;
    double tickInterval_;
    Clock clock_;

    mutable std::shared_mutex mutex_;
    std::vector<CachedAutomation> automations_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<int> activeRuns_{0};
    std::atomic<int64_t> lastTickMinute_{-1};
    CancellationTokenPtr stopToken_ = std::make_shared<CancellationToken>();
    trantor::EventLoop* tickLoop_ = nullptr;
    std::optional<trantor::TimerId> tickTimer_;

    Timestamp now() const {
        return clock_ ? clock_() : TimestampHelper::now();
    }

    Task<> runLoop(EventBus::SubscriptionPtr sub) {
        while (true) {
            auto msg = co_await sub->recv();
            if (std::holds_alternative<BusClosed>(msg)) {
                break;
            }
            if (auto* lag = std::get_if<Lagged>(&msg)) {
                LOG_WARN << "[AutomationEngine] Lagged behind event bus, skipped "
                         << lag->skipped << " events";
                continue;
            }
            if (stopping_) continue;
            handleEvent(std::get<Event>(msg));
        }
        LOG_DEBUG << "[AutomationEngine] Event loop exited";
    }

    void handleEvent(const Event& event) {
        std::vector<Automation> matched;
        {
            std::shared_lock lock(mutex_);
            for (const auto& cached : automations_) {
                if (cached.automation.matchesEvent(event)) {
                    matched.push_back(cached.automation);
                }
            }
        }
        for (auto& automation : matched) {
            LOG_DEBUG << "[AutomationEngine] " << automation.name << " triggered by "
                      << eventTypeToString(event.type) << " " << event.entityId;
            launch(std::move(automation));
        }
    }

    /**
     * @brief 独立任务运行，调用方不等待
     */
    void launch(Automation automation) {
        if (stopping_) return;
        drogon::async_run([self = shared_from_this(), automation = std::move(automation)]() -> Task<> {
            co_await self->execute(automation);
        });
    }

    Task<RunOutcome> runOnce(const Automation& automation) {
        std::string error;
        int code = ErrorCodes::INTERNAL_ERROR;
        try {
            for (const auto& condition : automation.conditions) {
                if (!(co_await evaluate(condition))) {
                    LOG_DEBUG << "[AutomationEngine] " << automation.name << ": conditions not met";
                    co_return RunOutcome::ConditionsNotMet;
                }
            }

            for (const auto& action : automation.actions) {
                if (stopping_) {
                    LOG_INFO << "[AutomationEngine] " << automation.name << " abandoned on shutdown";
                    co_return RunOutcome::Cancelled;
                }
                if (auto* call = std::get_if<CallServiceAction>(&action)) {
                    co_await callService_(call->entityId, call->service, call->data);
                } else if (auto* delay = std::get_if<DelayAction>(&action)) {
                    if (!(co_await cancellableSleep(static_cast<double>(delay->seconds), stopToken_))) {
                        LOG_INFO << "[AutomationEngine] " << automation.name
                                 << " delay interrupted on shutdown";
                        co_return RunOutcome::Cancelled;
                    }
                }
            }

            co_await markTriggered(automation);
            co_return RunOutcome::Completed;
        } catch (const AppException& e) {
            error = e.what();
            code = e.getCode();
        } catch (const std::exception& e) {
            error = e.what();
        }

        // 1xxx 是规则本身写错（实体或服务不存在），不是中枢故障
        if (ErrorCodes::isClientError(code)) {
            LOG_WARN << "[AutomationEngine] " << automation.name << " rejected (" << code << "): " << error;
        } else {
            LOG_ERROR << "[AutomationEngine] " << automation.name << " failed: " << error;
        }
        co_return RunOutcome::Failed;
    }

    Task<bool> evaluate(const Condition& condition) {
        if (auto* c = std::get_if<StateIsCondition>(&condition)) {
            auto entity = co_await store_->findEntityByKey(c->entityId);
            co_return entity && entity->state == c->state;
        }
        if (auto* c = std::get_if<TimeRangeCondition>(&condition)) {
            co_return c->contains(TimestampHelper::toLocal(now()).minuteOfDay());
        }
        co_return false;
    }

    /**
     * @brief 回写 last_triggered（重新读取，保留并发的管理端修改）并发布事件
     */
    Task<> markTriggered(const Automation& automation) {
        auto triggeredAt = now();

        auto current = co_await store_->findAutomation(automation.id);
        if (current) {
            current->lastTriggered = triggeredAt;
            co_await store_->saveAutomation(*current);
        } else {
            LOG_WARN << "[AutomationEngine] " << automation.name
                     << " was deleted during its run, last_triggered not saved";
        }

        {
            std::unique_lock lock(mutex_);
            for (auto& cached : automations_) {
                if (cached.automation.id == automation.id) {
                    cached.automation.lastTriggered = triggeredAt;
                }
            }
        }

        Json::Value data;
        data["automation_id"] = automation.id;
        data["automation_name"] = automation.name;
        if (!bus_->publish(Event::create(EventType::AutomationTriggered, "", std::move(data)))) {
            LOG_WARN << "[AutomationEngine] AutomationTriggered for " << automation.name
                     << " not delivered: bus closed";
        }
        LOG_INFO << "[AutomationEngine] " << automation.name << " completed";
    }
};

using AutomationEnginePtr = std::shared_ptr<AutomationEngine>;
