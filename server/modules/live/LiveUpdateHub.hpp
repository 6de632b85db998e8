#pragma once

#include "common/domain/EventBus.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 实时推送扇出
 *
 * 每个事件只序列化一次：{ "type": "state_changed", "data": {...}, "ts": 1234567890 }
 * 每个订阅者有自己的有界队列和发送任务；队列已满的订阅者被断开并移除，
 * 慢订阅者不会拖慢总线或其他订阅者。
 */
class LiveUpdateHub : public std::enable_shared_from_this<LiveUpdateHub> {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    /** 发送一条已序列化的消息（可挂起） */
    using SendFn = std::function<Task<>(std::string)>;
    /** 断开订阅者 */
    using CloseFn = std::function<void(const std::string& reason)>;

    LiveUpdateHub(EventBusPtr bus, size_t queueCapacity = Constants::LIVE_UPDATE_QUEUE_CAPACITY)
        : bus_(std::move(bus)), queueCapacity_((std::max)(queueCapacity, size_t{1})) {}

    LiveUpdateHub(const LiveUpdateHub&) = delete;
    LiveUpdateHub& operator=(const LiveUpdateHub&) = delete;

    /**
     * @brief 订阅总线（订阅在返回前完成）
     */
    void start() {
        if (started_.exchange(true)) return;
        auto sub = bus_->subscribe();
        drogon::async_run([self = shared_from_this(), sub]() -> Task<> {
            co_await self->runLoop(sub);
        });
    }

    /**
     * @brief 注册订阅者并启动它的发送任务
     * @return 订阅者 id
     */
    uint64_t addSubscriber(SendFn send, CloseFn close) {
        auto subscriber = std::make_shared<Subscriber>();
        subscriber->send = std::move(send);
        subscriber->close = std::move(close);
        {
            std::unique_lock lock(mutex_);
            subscriber->id = ++nextId_;
            subscribers_[subscriber->id] = subscriber;
        }

        drogon::async_run([self = shared_from_this(), subscriber]() -> Task<> {
            co_await self->drain(subscriber);
        });
        LOG_INFO << "[Live] Subscriber#" << subscriber->id << " added, total: " << subscriberCount();
        return subscriber->id;
    }

    /**
     * @brief 连接关闭时调用；不会再回调 close
     */
    void removeSubscriber(uint64_t id) {
        auto subscriber = detach(id);
        if (!subscriber) return;
        shutdown(*subscriber);
        LOG_INFO << "[Live] Subscriber#" << id << " removed, total: " << subscriberCount();
    }

    /**
     * @brief 序列化一次并放入每个订阅者的队列
     */
    void dispatch(const Event& event) {
        auto msg = buildMessage(eventTypeToString(event.type), event.toJson(),
                                TimestampHelper::toMillis(event.timestamp));

        std::vector<std::shared_ptr<Subscriber>> overflowed;
        {
            std::shared_lock lock(mutex_);
            for (const auto& [id, subscriber] : subscribers_) {
                if (!enqueue(*subscriber, msg)) {
                    overflowed.push_back(subscriber);
                }
            }
        }

        for (const auto& subscriber : overflowed) {
            if (!detach(subscriber->id)) continue;
            shutdown(*subscriber);
            ++disconnected_;
            LOG_WARN << "[Live] Subscriber#" << subscriber->id << " queue full ("
                     << queueCapacity_ << "), disconnecting";
            subscriber->close("slow consumer");
        }
    }

    size_t subscriberCount() const {
        std::shared_lock lock(mutex_);
        return subscribers_.size();
    }

    uint64_t disconnectedCount() const { return disconnected_.load(); }
    size_t queueCapacity() const { return queueCapacity_; }

    /** 构建 JSON 消息字符串 */
    static std::string buildMessage(const std::string& type, const Json::Value& data, int64_t tsMillis) {
        Json::Value msg;
        msg["type"] = type;
        msg["data"] = data;
        msg["ts"] = static_cast<Json::Int64>(tsMillis);
        return JsonHelper::serialize(msg);
    }

    static std::string buildMessage(const std::string& type, const Json::Value& data) {
        return buildMessage(type, data, TimestampHelper::toMillis(TimestampHelper::now()));
    }

private:
    struct Subscriber {
        uint64_t id = 0;
        SendFn send;
        CloseFn close;

        std::mutex mutex;
        std::deque<std::string> queue;
        bool closed = false;
        std::coroutine_handle<> waiter;
        trantor::EventLoop* waiterLoop = nullptr;
    };

    /**
     * @brief 等待队列非空或关闭
     */
    struct WaitAwaiter {
        Subscriber& sub;

        bool await_ready() const noexcept { return false; }

        bool await_suspend(std::coroutine_handle<> handle) {
            std::lock_guard lock(sub.mutex);
            if (!sub.queue.empty() || sub.closed) return false;
            sub.waiter = handle;
            sub.waiterLoop = EventLoopHelper::currentOrMain();
            return true;
        }

        void await_resume() const noexcept {}
    };

    EventBusPtr bus_;
    size_t queueCapacity_;
    std::atomic<bool> started_{false};
    std::atomic<uint64_t> disconnected_{0};

    mutable std::shared_mutex mutex_;
    std::map<uint64_t, std::shared_ptr<Subscriber>> subscribers_;
    uint64_t nextId_ = 0;

    Task<> runLoop(EventBus::SubscriptionPtr sub) {
        while (true) {
            auto msg = co_await sub->recv();
            if (std::holds_alternative<BusClosed>(msg)) break;
            if (auto* lag = std::get_if<Lagged>(&msg)) {
                LOG_WARN << "[Live] Lagged behind event bus, " << lag->skipped << " events not pushed";
                continue;
            }
            dispatch(std::get<Event>(msg));
        }

        std::vector<std::shared_ptr<Subscriber>> remaining;
        {
            std::unique_lock lock(mutex_);
            for (auto& [id, subscriber] : subscribers_) remaining.push_back(subscriber);
            subscribers_.clear();
        }
        for (const auto& subscriber : remaining) {
            shutdown(*subscriber);
            subscriber->close("server shutting down");
        }
        LOG_DEBUG << "[Live] Fan-out exited";
    }

    /**
     * @return false 队列已满
     */
    bool enqueue(Subscriber& subscriber, const std::string& msg) {
        std::coroutine_handle<> handle;
        trantor::EventLoop* loop = nullptr;
        {
            std::lock_guard lock(subscriber.mutex);
            if (subscriber.closed) return true;
            if (subscriber.queue.size() >= queueCapacity_) return false;
            subscriber.queue.push_back(msg);
            handle = std::exchange(subscriber.waiter, nullptr);
            loop = subscriber.waiterLoop;
        }
        if (handle) EventLoopHelper::resumeOn(loop, handle);
        return true;
    }

    std::shared_ptr<Subscriber> detach(uint64_t id) {
        std::unique_lock lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) return nullptr;
        auto subscriber = it->second;
        subscribers_.erase(it);
        return subscriber;
    }

    /**
     * @brief 标记关闭、清空队列并唤醒发送任务使其退出
     */
    static void shutdown(Subscriber& subscriber) {
        std::coroutine_handle<> handle;
        trantor::EventLoop* loop = nullptr;
        {
            std::lock_guard lock(subscriber.mutex);
            subscriber.closed = true;
            subscriber.queue.clear();
            handle = std::exchange(subscriber.waiter, nullptr);
            loop = subscriber.waiterLoop;
        }
        if (handle) EventLoopHelper::resumeOn(loop, handle);
    }

    Task<> drain(std::shared_ptr<Subscriber> subscriber) {
        while (true) {
            std::optional<std::string> next;
            bool closed = false;
            {
                std::lock_guard lock(subscriber->mutex);
                if (!subscriber->queue.empty()) {
                    next = std::move(subscriber->queue.front());
                    subscriber->queue.pop_front();
                } else {
                    closed = subscriber->closed;
                }
            }
            if (closed) break;
            if (!next) {
                co_await WaitAwaiter{*subscriber};
                continue;
            }

            std::string error;
            try {
                co_await subscriber->send(std::move(*next));
            } catch (const std::exception& e) {
                error = e.what();
            }
            if (!error.empty()) {
                LOG_WARN << "[Live] Subscriber#" << subscriber->id << " send failed: " << error;
                if (detach(subscriber->id)) {
                    shutdown(*subscriber);
                    subscriber->close("send failed");
                }
                break;
            }
        }
        LOG_TRACE << "[Live] Subscriber#" << subscriber->id << " drain exited";
    }
};

using LiveUpdateHubPtr = std::shared_ptr<LiveUpdateHub>;
