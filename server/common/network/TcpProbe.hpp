#pragma once

#include "common/utils/CancellationToken.hpp"

/**
 * @brief 有时限的 TCP 连接探测
 *
 * 在主 EventLoop 上建立 trantor::TcpClient，连接成功即视为可达并立即断开。
 * 超时、连接错误、取消都视为不可达。协程在发起时所在的循环上恢复。
 */
class TcpProbe {
public:
    static drogon::Task<bool> run(std::string host, uint16_t port, double timeoutSec,
                                  CancellationTokenPtr token) {
        if (token && token->isCancelled()) co_return false;

        auto state = std::make_shared<State>();
        state->ioLoop = drogon::app().getLoop();
        state->resumeLoop = EventLoopHelper::currentOrMain();

        co_await Awaiter{state, std::move(host), port, timeoutSec, token};

        if (token) token->removeCallback(state->cancelId);
        co_return state->reachable;
    }

private:
    struct State {
        std::mutex mutex;
        bool done = false;
        bool reachable = false;
        trantor::EventLoop* ioLoop = nullptr;
        trantor::EventLoop* resumeLoop = nullptr;
        std::coroutine_handle<> handle;
        std::shared_ptr<trantor::TcpClient> client;
        std::optional<trantor::TimerId> timer;
        uint64_t cancelId = 0;
    };

    static void finish(const std::shared_ptr<State>& state, bool reachable) {
        std::shared_ptr<trantor::TcpClient> client;
        std::optional<trantor::TimerId> timer;
        {
            std::lock_guard lock(state->mutex);
            if (state->done) return;
            state->done = true;
            state->reachable = reachable;
            client = std::move(state->client);
            timer = state->timer;
        }

        auto* loop = state->ioLoop;
        loop->queueInLoop([loop, client, timer, reachable]() {
            if (timer) loop->invalidateTimer(*timer);
            if (!client) return;
            if (reachable) {
                client->disconnect();
            } else {
                client->stop();
            }
        });
        EventLoopHelper::resumeOn(state->resumeLoop, state->handle);
    }

    struct Awaiter {
        std::shared_ptr<State> state;
        std::string host;
        uint16_t port;
        double timeoutSec;
        CancellationTokenPtr token;

        bool await_ready() const noexcept { return false; }

        void await_suspend(std::coroutine_handle<> handle) {
            state->handle = handle;
            std::weak_ptr<State> weak = state;

            if (token) {
                auto id = token->onCancel([weak]() {
                    if (auto s = weak.lock()) finish(s, false);
                });
                std::lock_guard lock(state->mutex);
                state->cancelId = id;
            }

            state->ioLoop->runInLoop([state = state, host = host, port = port, timeoutSec = timeoutSec]() {
                {
                    std::lock_guard lock(state->mutex);
                    if (state->done) return;
                }
                std::weak_ptr<State> weak = state;
                auto client = std::make_shared<trantor::TcpClient>(
                    state->ioLoop, trantor::InetAddress(host, port), "PresenceProbe");

                client->setConnectionCallback([weak](const trantor::TcpConnectionPtr& conn) {
                    if (!conn->connected()) return;
                    if (auto s = weak.lock()) finish(s, true);
                });
                client->setConnectionErrorCallback([weak]() {
                    if (auto s = weak.lock()) finish(s, false);
                });

                auto timer = state->ioLoop->runAfter(timeoutSec, [weak]() {
                    if (auto s = weak.lock()) finish(s, false);
                });
                {
                    std::lock_guard lock(state->mutex);
                    if (state->done) {
                        state->ioLoop->invalidateTimer(timer);
                        return;
                    }
                    state->client = client;
                    state->timer = timer;
                }
                client->connect();
            });
        }

        void await_resume() const noexcept {}
    };
};
