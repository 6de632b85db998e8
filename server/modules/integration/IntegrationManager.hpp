#pragma once

#include "IntegrationContext.hpp"
#include "common/network/ReconnectPolicy.hpp"
#include "common/utils/CancellationToken.hpp"

/**
 * @brief 集成接口约束（静态分发，无虚函数）
 */
template<typename T>
concept Integration = requires(T& t, const T& ct, IntegrationContextPtr ctx,
                               const std::string& str, const Json::Value& data) {
    { ct.name() } -> std::convertible_to<std::string>;
    { t.setup(ctx) } -> std::same_as<drogon::Task<>>;
    { t.teardown() } -> std::same_as<drogon::Task<>>;
    { t.handleServiceCall(str, str, data) } -> std::same_as<drogon::Task<>>;
};

/**
 * @brief 带后台任务的集成：每 pollInterval 秒调用一次 poll
 */
template<typename T>
concept BackgroundIntegration = Integration<T>
    && requires(T& t, const T& ct, IntegrationContextPtr ctx, CancellationTokenPtr token) {
    { ct.pollInterval() } -> std::convertible_to<double>;
    { t.poll(ctx, token) } -> std::same_as<drogon::Task<>>;
};

/**
 * @brief 集成生命周期管理
 *
 * 持有固定的集成类型元组。生命周期：
 * - setupAll：逐个 setup，单个失败标记为 Failed 并记录日志，不影响其它集成
 * - startAll：为 setup 成功且带后台任务的集成启动受监督循环
 *   （扫描异常 → 指数退避重试，上限为轮询间隔）
 * - teardownAll：取消全部后台任务，有限时间内等待退出，
 *   然后对每个 setup 成功的集成调用一次 teardown
 *
 * 集成可选提供 enabled()；返回 false 时直接标记为 Disabled。
 */
template<Integration... Ts>
class IntegrationManager : public std::enable_shared_from_this<IntegrationManager<Ts...>> {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    explicit IntegrationManager(std::shared_ptr<Ts>... integrations)
        : slots_(Slot<Ts>{std::move(integrations)}...) {}

    IntegrationManager(const IntegrationManager&) = delete;
    IntegrationManager& operator=(const IntegrationManager&) = delete;

    void setContext(IntegrationContextPtr ctx) { ctx_ = std::move(ctx); }

    /**
     * @brief 依次 setup 全部集成
     * @return setup 成功的数量
     */
    Task<size_t> setupAll() {
        if (!ctx_) {
            throw InternalException("IntegrationContext 未设置");
        }
        std::vector<std::function<Task<bool>()>> steps;
        forEachSlot([&](auto& slot) {
            steps.push_back([this, &slot]() { return setupSlot(slot); });
        });

        size_t ready = 0;
        for (auto& step : steps) {
            if (co_await step()) ++ready;
        }
        LOG_INFO << "[Integrations] " << ready << "/" << sizeof...(Ts) << " integrations set up";
        co_return ready;
    }

    /**
     * @brief 启动后台任务
     * @return 启动的后台任务数
     */
    size_t startAll() {
        size_t started = 0;
        forEachSlot([&](auto& slot) {
            using T = typename std::decay_t<decltype(slot)>::IntegrationType;
            if constexpr (BackgroundIntegration<T>) {
                {
                    std::lock_guard lock(mutex_);
                    if (slot.fsm.state() != IntegrationState::Ready) return;
                    slot.fsm.onStarted();
                }
                ++activeTasks_;
                ++started;
                drogon::async_run([self = this->shared_from_this(), &slot]() -> Task<> {
                    std::string error;
                    try {
                        co_await self->supervise(slot);
                    } catch (const std::exception& e) {
                        error = e.what();
                    } catch (...) {
                        error = UNKNOWN_ERROR;
                    }
                    --self->activeTasks_;
                    if (!error.empty()) {
                        LOG_ERROR << "[Integrations] " << slot.integration->name()
                                  << " background task aborted: " << error;
                    }
                });
            }
        });
        return started;
    }

    /**
     * @brief 停止后台任务并 teardown
     *
     * 可重复调用；每个集成的 teardown 至多执行一次
     */
    Task<> teardownAll(double timeoutSec = Constants::INTEGRATION_SHUTDOWN_TIMEOUT_SEC) {
        stopToken_->cancel();

        auto* loop = EventLoopHelper::currentOrMain();
        auto deadline = std::chrono::steady_clock::now()
            + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                  std::chrono::duration<double>(timeoutSec));
        while (activeTasks_.load() > 0 && std::chrono::steady_clock::now() < deadline) {
            co_await drogon::sleepCoro(loop, 0.05);
        }
        if (activeTasks_.load() > 0) {
            LOG_WARN << "[Integrations] " << activeTasks_.load()
                     << " background tasks still running after " << timeoutSec << "s";
        }

        std::vector<std::function<Task<>()>> steps;
        forEachSlot([&](auto& slot) {
            steps.push_back([this, &slot]() { return teardownSlot(slot); });
        });
        for (auto& step : steps) {
            co_await step();
        }
    }

    /**
     * @brief 把服务调用交给指定名称的集成
     * @return false 没有该名称的集成
     * @throws IntegrationException 集成未运行或调用失败
     */
    Task<bool> handleServiceCall(const std::string& integration, const std::string& entityId,
                                 const std::string& service, const Json::Value& data) {
        std::function<Task<>()> call;
        bool found = false;
        forEachSlot([&](auto& slot) {
            if (found || slot.integration->name() != integration) return;
            found = true;
            std::lock_guard lock(mutex_);
            if (!slot.fsm.isRunning()) {
                throw IntegrationException("集成未运行: " + integration
                                           + " (" + slot.fsm.stateString() + ")");
            }
            call = [&slot, entityId, service, data]() {
                return slot.integration->handleServiceCall(entityId, service, data);
            };
        });
        if (!found) co_return false;

        try {
            co_await call();
        } catch (const AppException&) {
            throw;
        } catch (const std::exception& e) {
            throw IntegrationException(integration + " 服务调用失败: " + e.what());
        }
        co_return true;
    }

    /**
     * @brief 集成状态（诊断用）
     */
    Json::Value status() const {
        Json::Value items(Json::objectValue);
        std::lock_guard lock(mutex_);
        forEachSlot([&](const auto& slot) {
            using T = typename std::decay_t<decltype(slot)>::IntegrationType;
            auto json = slot.fsm.toJson();
            json["background"] = BackgroundIntegration<T>;
            items[std::string(slot.integration->name())] = json;
        });
        return items;
    }

    std::optional<IntegrationState> stateOf(const std::string& name) const {
        std::optional<IntegrationState> result;
        std::lock_guard lock(mutex_);
        forEachSlot([&](const auto& slot) {
            if (slot.integration->name() == name) result = slot.fsm.state();
        });
        return result;
    }

    int activeTasks() const { return activeTasks_.load(); }

private:
    /** 集成抛出非 std::exception 时记录的错误 */
    static constexpr const char* UNKNOWN_ERROR = "unknown exception";

    template<typename T>
    struct Slot {
        using IntegrationType = T;
        std::shared_ptr<T> integration;
        IntegrationStateMachine fsm;
    };

    std::tuple<Slot<Ts>...> slots_;
    IntegrationContextPtr ctx_;
    CancellationTokenPtr stopToken_ = std::make_shared<CancellationToken>();
    std::atomic<int> activeTasks_{0};
    mutable std::mutex mutex_;

    template<typename F>
    void forEachSlot(F&& f) {
        std::apply([&](auto&... slot) { (f(slot), ...); }, slots_);
    }

    template<typename F>
    void forEachSlot(F&& f) const {
        std::apply([&](const auto&... slot) { (f(slot), ...); }, slots_);
    }

    template<typename T>
    static bool isEnabled(const T& integration) {
        if constexpr (requires { { integration.enabled() } -> std::convertible_to<bool>; }) {
            return integration.enabled();
        } else {
            return true;
        }
    }

    template<typename T>
    Task<bool> setupSlot(Slot<T>& slot) {
        auto name = std::string(slot.integration->name());
        if (!isEnabled(*slot.integration)) {
            std::lock_guard lock(mutex_);
            slot.fsm.onDisabled();
            LOG_INFO << "[Integrations] " << name << " disabled";
            co_return false;
        }

        std::string error;
        try {
            co_await slot.integration->setup(ctx_);
        } catch (const std::exception& e) {
            error = e.what();
            if (error.empty()) error = "setup failed";
        } catch (...) {
            error = UNKNOWN_ERROR;
        }

        std::lock_guard lock(mutex_);
        if (!error.empty()) {
            slot.fsm.onSetupFailed(error);
            LOG_ERROR << "[Integrations] " << name << " setup failed: " << error;
            co_return false;
        }
        slot.fsm.onSetupOk();
        LOG_INFO << "[Integrations] " << name << " ready";
        co_return true;
    }

    /**
     * @brief 受监督的后台循环：异常只影响本集成，退避后重试
     */
    template<typename T>
    Task<> supervise(Slot<T>& slot) {
        auto name = std::string(slot.integration->name());
        auto token = stopToken_;
        double interval = (std::max)(static_cast<double>(slot.integration->pollInterval()), 0.01);

        while (!token->isCancelled()) {
            std::string error;
            bool failed = false;
            try {
                co_await slot.integration->poll(ctx_, token);
            } catch (const std::exception& e) {
                failed = true;
                error = e.what();
            } catch (...) {
                failed = true;
                error = UNKNOWN_ERROR;
            }
            if (token->isCancelled()) break;

            double wait = interval;
            {
                std::lock_guard lock(mutex_);
                if (failed) {
                    wait = slot.fsm.onScanFailed(error, interval);
                    LOG_WARN << "[Integrations] " << name << " scan failed ("
                             << slot.fsm.consecutiveFailures() << " in a row): " << error
                             << ", retrying in " << wait << "s";
                } else {
                    slot.fsm.onScanOk();
                }
            }
            if (!(co_await cancellableSleep(wait, token))) break;
        }
        LOG_DEBUG << "[Integrations] " << name << " background task exited";
    }

    template<typename T>
    Task<> teardownSlot(Slot<T>& slot) {
        auto name = std::string(slot.integration->name());
        {
            std::lock_guard lock(mutex_);
            if (!slot.fsm.wasSetUp()) co_return;
            slot.fsm.onStopped();
        }

        std::string error;
        try {
            co_await slot.integration->teardown();
        } catch (const std::exception& e) {
            error = e.what();
            if (error.empty()) error = "teardown failed";
        } catch (...) {
            error = UNKNOWN_ERROR;
        }
        if (!error.empty()) {
            LOG_ERROR << "[Integrations] " << name << " teardown failed: " << error;
        } else {
            LOG_INFO << "[Integrations] " << name << " stopped";
        }
    }
};
