#pragma once

#include "EventLoopHelper.hpp"

/**
 * @brief 协程互斥锁
 *
 * 等待者挂起而不阻塞工作线程，按 FIFO 顺序获得锁。
 * unlock 直接把所有权交给队首等待者，中途不会出现无主状态。
 */
class AsyncMutex {
public:
    AsyncMutex() = default;
    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    struct LockAwaiter {
        AsyncMutex& mutex;

        bool await_ready() { return mutex.tryLock(); }

        bool await_suspend(std::coroutine_handle<> handle) {
            std::lock_guard lock(mutex.stateMutex_);
            if (!mutex.locked_) {
                mutex.locked_ = true;
                return false;
            }
            mutex.waiters_.push_back({handle, EventLoopHelper::currentOrMain()});
            return true;
        }

        void await_resume() noexcept {}
    };

    /** co_await mutex.lock(); */
    LockAwaiter lock() { return LockAwaiter{*this}; }

    bool tryLock() {
        std::lock_guard lock(stateMutex_);
        if (locked_) return false;
        locked_ = true;
        return true;
    }

    void unlock() {
        Waiter next;
        {
            std::lock_guard lock(stateMutex_);
            if (waiters_.empty()) {
                locked_ = false;
                return;
            }
            next = waiters_.front();
            waiters_.pop_front();
        }
        EventLoopHelper::resumeOn(next.loop, next.handle);
    }

    bool isLocked() const {
        std::lock_guard lock(stateMutex_);
        return locked_;
    }

private:
    struct Waiter {
        std::coroutine_handle<> handle;
        trantor::EventLoop* loop = nullptr;
    };

    mutable std::mutex stateMutex_;
    bool locked_ = false;
    std::deque<Waiter> waiters_;
};

/**
 * @brief 按键分片的协程互斥锁
 *
 * 同一键的临界区串行执行，不同键互不影响。
 * 条目在最后一个使用者释放后回收，键空间不会无限增长。
 *
 * 使用示例：
 * @code
 * auto guard = co_await locks_.acquire("light.kitchen");
 * // ... 读-改-写 ...
 * @endcode
 */
class KeyedAsyncMutex {
public:
    template<typename T = void> using Task = drogon::Task<T>;

private:
    struct Entry {
        AsyncMutex mutex;
        size_t users = 0;
    };

public:
    class Guard {
    public:
        Guard() = default;
        Guard(KeyedAsyncMutex* owner, std::string key, std::shared_ptr<Entry> entry)
            : owner_(owner), key_(std::move(key)), entry_(std::move(entry)) {}

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        Guard(Guard&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr))
            , key_(std::move(other.key_))
            , entry_(std::move(other.entry_)) {}

        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::exchange(other.owner_, nullptr);
                key_ = std::move(other.key_);
                entry_ = std::move(other.entry_);
            }
            return *this;
        }

        ~Guard() { release(); }

        void release() {
            if (owner_ && entry_) {
                owner_->release(key_, entry_);
            }
            owner_ = nullptr;
            entry_.reset();
        }

    private:
        KeyedAsyncMutex* owner_ = nullptr;
        std::string key_;
        std::shared_ptr<Entry> entry_;
    };

    Task<Guard> acquire(const std::string& key) {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard lock(mapMutex_);
            auto& slot = entries_[key];
            if (!slot) slot = std::make_shared<Entry>();
            ++slot->users;
            entry = slot;
        }
        co_await entry->mutex.lock();
        co_return Guard(this, key, entry);
    }

    /** 当前持有或等待中的键数量 */
    size_t activeKeys() const {
        std::lock_guard lock(mapMutex_);
        return entries_.size();
    }

private:
    void release(const std::string& key, const std::shared_ptr<Entry>& entry) {
        entry->mutex.unlock();
        std::lock_guard lock(mapMutex_);
        if (--entry->users == 0) {
            entries_.erase(key);
        }
    }

    mutable std::mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};
