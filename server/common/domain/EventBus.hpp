#pragma once

#include "Event.hpp"
#include "common/utils/EventLoopHelper.hpp"

/**
 * @brief 订阅者落后超过缓冲容量，游标已跳到最旧的保留事件
 */
struct Lagged {
    uint64_t skipped = 0;
};

/**
 * @brief 总线已关闭
 */
struct BusClosed {};

using BusMessage = std::variant<Event, Lagged, BusClosed>;

/**
 * @brief 事件总线 - 有界环形缓冲广播
 *
 * - 全局序号 head_ 单调递增，槽位 = 序号 % capacity
 * - 每个订阅者持有独立游标，从订阅时刻的 head_ 开始读
 * - publish 永不阻塞：缓冲满时覆盖最旧槽位，慢订阅者下次读取得到 Lagged
 * - 读端持 shared_lock，写端持 unique_lock，读之间不互斥
 *
 * 使用示例：
 * @code
 * auto sub = bus->subscribe();
 * while (true) {
 *     auto msg = co_await sub->recv();
 *     if (auto* event = std::get_if<Event>(&msg)) { ... }
 *     else if (auto* lag = std::get_if<Lagged>(&msg)) { LOG_WARN << lag->skipped; }
 *     else break;  // BusClosed
 * }
 * @endcode
 */
class EventBus : public std::enable_shared_from_this<EventBus> {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    class Subscription;
    using SubscriptionPtr = std::shared_ptr<Subscription>;

    explicit EventBus(size_t capacity)
        : capacity_((std::max)(capacity, size_t{1})), slots_(capacity_) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief 发布事件；时间戳在总线锁内重新分配，投递顺序即时间顺序
     * @return false 表示总线已关闭，事件被丢弃
     */
    bool publish(Event event) {
        std::vector<Waiter> toWake;
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                LOG_DEBUG << "[EventBus] Dropped " << eventTypeToString(event.type)
                          << " after close";
                return false;
            }
            event.timestamp = EventClock::next();
            slots_[head_ % capacity_] = std::move(event);
            ++head_;
            toWake.swap(waiters_);
        }
        published_.fetch_add(1, std::memory_order_relaxed);

        for (const auto& w : toWake) {
            EventLoopHelper::resumeOn(w.loop, w.handle);
        }
        return true;
    }

    /**
     * @brief 订阅：游标从当前位置开始，只接收之后发布的事件
     */
    SubscriptionPtr subscribe() {
        uint64_t start;
        {
            std::shared_lock lock(mutex_);
            start = head_;
        }
        return std::make_shared<Subscription>(Subscription::Key{}, shared_from_this(), start);
    }

    /**
     * @brief 关闭总线，唤醒所有等待中的订阅者（它们将读到 BusClosed）
     */
    void close() {
        std::vector<Waiter> toWake;
        {
            std::unique_lock lock(mutex_);
            if (closed_) return;
            closed_ = true;
            toWake.swap(waiters_);
        }
        for (const auto& w : toWake) {
            EventLoopHelper::resumeOn(w.loop, w.handle);
        }
        LOG_INFO << "[EventBus] Closed after " << publishedCount() << " events";
    }

    bool isClosed() const {
        std::shared_lock lock(mutex_);
        return closed_;
    }

    size_t capacity() const { return capacity_; }
    uint64_t publishedCount() const { return published_.load(std::memory_order_relaxed); }
    size_t subscriberCount() const { return subscribers_.load(std::memory_order_relaxed); }

    /**
     * @brief 订阅句柄（单消费者）
     */
    class Subscription {
        struct Key {
            explicit Key() = default;
        };

    public:
        /** 只能经 EventBus::subscribe 创建 */
        Subscription(Key, std::shared_ptr<EventBus> bus, uint64_t start)
            : bus_(std::move(bus)), cursor_(start) {
            bus_->subscribers_.fetch_add(1, std::memory_order_relaxed);
        }

        ~Subscription() {
            bus_->subscribers_.fetch_sub(1, std::memory_order_relaxed);
        }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        /**
         * @brief 非阻塞读取；没有新事件且总线未关闭时返回 nullopt
         */
        std::optional<BusMessage> tryRecv() {
            std::shared_lock lock(bus_->mutex_);
            return readLocked();
        }

        /**
         * @brief 读取下一条消息，没有新事件时挂起
         */
        Task<BusMessage> recv() {
            while (true) {
                if (auto msg = tryRecv()) {
                    co_return std::move(*msg);
                }
                co_await WaitAwaiter{*this};
            }
        }

        uint64_t cursor() const { return cursor_; }

    private:
        friend class EventBus;

        std::optional<BusMessage> readLocked() {
            const uint64_t head = bus_->head_;
            const uint64_t cap = bus_->capacity_;
            const uint64_t oldest = head > cap ? head - cap : 0;

            if (cursor_ < oldest) {
                Lagged lag{oldest - cursor_};
                cursor_ = oldest;
                return BusMessage{lag};
            }
            if (cursor_ < head) {
                Event event = bus_->slots_[cursor_ % cap];
                ++cursor_;
                return BusMessage{std::move(event)};
            }
            if (bus_->closed_) {
                return BusMessage{BusClosed{}};
            }
            return std::nullopt;
        }

        struct WaitAwaiter {
            Subscription& sub;

            bool await_ready() const noexcept { return false; }

            bool await_suspend(std::coroutine_handle<> handle) {
                std::unique_lock lock(sub.bus_->mutex_);
                // 加锁后复查，避免错过 publish 的唤醒
                if (sub.cursor_ < sub.bus_->head_ || sub.bus_->closed_) {
                    return false;
                }
                sub.bus_->waiters_.push_back({handle, EventLoopHelper::currentOrMain()});
                return true;
            }

            void await_resume() const noexcept {}
        };

        std::shared_ptr<EventBus> bus_;
        uint64_t cursor_;
    };

private:
    struct Waiter {
        std::coroutine_handle<> handle;
        trantor::EventLoop* loop = nullptr;
    };

    const size_t capacity_;
    std::vector<Event> slots_;
    uint64_t head_ = 0;
    bool closed_ = false;
    std::vector<Waiter> waiters_;
    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> published_{0};
    std::atomic<size_t> subscribers_{0};
};

using EventBusPtr = std::shared_ptr<EventBus>;
