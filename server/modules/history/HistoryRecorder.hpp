#pragma once

#include "domain/EntityHistory.hpp"
#include "common/domain/EventBus.hpp"
#include "common/storage/HubStore.hpp"

/**
 * @brief 历史记录器与保留期清理
 *
 * - 订阅总线：StateChanged / AttributeChanged 写入实体快照，recorded_at 取事件时间
 * - recordEvents 为 true 时所有事件写入事件日志
 * - 定时清理早于保留期的历史行
 *
 * 单条写入失败只记录日志；落后（Lagged）时记录跳过数量后继续。
 */
class HistoryRecorder : public std::enable_shared_from_this<HistoryRecorder> {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    struct Options {
        int retentionDays = Constants::HISTORY_RETENTION_DAYS;
        int purgeIntervalHours = Constants::HISTORY_PURGE_INTERVAL_HOURS;
        bool recordEvents = true;
    };

    HistoryRecorder(HubStorePtr store, EventBusPtr bus, Options options)
        : store_(std::move(store)), bus_(std::move(bus)), options_(options) {}

    HistoryRecorder(const HistoryRecorder&) = delete;
    HistoryRecorder& operator=(const HistoryRecorder&) = delete;

    /**
     * @brief 订阅总线并启动清理定时器（订阅在返回前完成）
     */
    void start(trantor::EventLoop* loop = nullptr) {
        if (started_.exchange(true)) return;

        auto sub = bus_->subscribe();
        drogon::async_run([self = shared_from_this(), sub]() -> Task<> {
            co_await self->runLoop(sub);
        });

        if (!loop) loop = drogon::app().getLoop();
        purgeLoop_ = loop;
        std::weak_ptr<HistoryRecorder> weak = shared_from_this();
        purgeTimer_ = loop->runEvery(options_.purgeIntervalHours * 3600.0, [weak]() {
            auto self = weak.lock();
            if (!self) return;
            drogon::async_run([self]() -> Task<> {
                co_await self->purgeNow();
            });
        });

        LOG_INFO << "[History] Recorder started (retention " << options_.retentionDays
                 << "d, purge every " << options_.purgeIntervalHours << "h)";
    }

    void stop() {
        if (purgeLoop_ && purgeTimer_) {
            purgeLoop_->invalidateTimer(*purgeTimer_);
            purgeTimer_.reset();
        }
    }

    /**
     * @brief 删除 recorded_at 早于 now - retentionDays 的历史
     * @return 删除行数
     */
    Task<uint64_t> purgeOnce(Timestamp now) {
        auto cutoff = now - std::chrono::hours(24) * options_.retentionDays;
        auto removed = co_await store_->purgeHistoryBefore(cutoff);
        LOG_INFO << "[History] Purged " << removed << " rows older than "
                 << TimestampHelper::toIso(cutoff);
        co_return removed;
    }

    /**
     * @brief 处理一条事件（测试也直接调用）
     */
    Task<> record(const Event& event) {
        if (options_.recordEvents) {
            try {
                co_await store_->saveEvent(event);
            } catch (const std::exception& e) {
                LOG_ERROR << "[History] Failed to journal " << eventTypeToString(event.type)
                          << ": " << e.what();
            }
        }

        if (event.type != EventType::StateChanged && event.type != EventType::AttributeChanged) {
            co_return;
        }

        std::string error;
        try {
            auto entity = co_await store_->findEntityByKey(event.entityId);
            if (!entity) {
                LOG_DEBUG << "[History] " << event.entityId << " no longer exists, snapshot skipped";
                co_return;
            }
            co_await store_->saveHistory(EntityHistory::snapshot(*entity, event.timestamp));
            ++recorded_;
        } catch (const std::exception& e) {
            error = e.what();
        }
        if (!error.empty()) {
            LOG_ERROR << "[History] Failed to record " << event.entityId << ": " << error;
        }
    }

    uint64_t recordedCount() const { return recorded_.load(); }
    const Options& options() const { return options_; }

private:
    HubStorePtr store_;
    EventBusPtr bus_;
    Options options_;
    std::atomic<bool> started_{false};
    std::atomic<uint64_t> recorded_{0};
    trantor::EventLoop* purgeLoop_ = nullptr;
    std::optional<trantor::TimerId> purgeTimer_;

    Task<> runLoop(EventBus::SubscriptionPtr sub) {
        while (true) {
            auto msg = co_await sub->recv();
            if (std::holds_alternative<BusClosed>(msg)) break;
            if (auto* lag = std::get_if<Lagged>(&msg)) {
                LOG_WARN << "[History] Lagged behind event bus, " << lag->skipped
                         << " events not recorded";
                continue;
            }
            co_await record(std::get<Event>(msg));
        }
        LOG_DEBUG << "[History] Recorder exited";
    }

    Task<> purgeNow() {
        try {
            co_await purgeOnce(TimestampHelper::now());
        } catch (const std::exception& e) {
            LOG_ERROR << "[History] Purge failed: " << e.what();
        }
    }
};

using HistoryRecorderPtr = std::shared_ptr<HistoryRecorder>;
