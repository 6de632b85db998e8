#pragma once

#include "Constants.hpp"
#include "EventLoopHelper.hpp"

/**
 * @brief 协作式取消信号
 *
 * 由组合根在关闭时触发；后台任务在挂起点之间检查。
 * onCancel 回调用于中止进行中的 I/O（如探测连接）。
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    void cancel() {
        std::map<uint64_t, Callback> callbacks;
        {
            std::lock_guard lock(mutex_);
            if (cancelled_.exchange(true)) return;
            callbacks.swap(callbacks_);
        }
        for (auto& [id, cb] : callbacks) {
            cb();
        }
    }

    bool isCancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief 注册取消回调；已取消时立即执行并返回 0
     */
    uint64_t onCancel(Callback cb) {
        {
            std::lock_guard lock(mutex_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                auto id = ++nextId_;
                callbacks_.emplace(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void removeCallback(uint64_t id) {
        if (id == 0) return;
        std::lock_guard lock(mutex_);
        callbacks_.erase(id);
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::map<uint64_t, Callback> callbacks_;
    uint64_t nextId_ = 0;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

/**
 * @brief 可取消的等待
 *
 * 按固定切片 sleepCoro，每个切片之间检查取消信号。
 * @return true 睡满；false 被取消
 */
inline drogon::Task<bool> cancellableSleep(double seconds, const CancellationTokenPtr& token) {
    auto* loop = EventLoopHelper::currentOrMain();
    auto deadline = std::chrono::steady_clock::now()
        + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
              std::chrono::duration<double>(seconds));

    while (true) {
        if (token && token->isCancelled()) co_return false;
        auto remaining = std::chrono::duration<double>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) co_return true;
        co_await drogon::sleepCoro(loop, (std::min)(remaining, Constants::CANCEL_CHECK_SLICE_SEC));
    }
}
