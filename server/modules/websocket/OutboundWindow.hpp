#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"
#include "modules/live/LiveUpdateHub.hpp"

/**
 * @brief 单个 WebSocket 连接的出站确认窗口
 *
 * WebSocketConnection::send() 只把帧交给 Trantor 的发送缓冲，缓冲没有上限，
 * 也不反馈对端读了多少。这里每发出 ackInterval 字节就追加一个 Ping，
 * 载荷为当时累计的出站字节数；对端按 RFC 6455 原样回 Pong，
 * 收到即说明此前的帧都已被读走。
 *
 * 未确认字节超过 limit 时 admit() 抛异常，LiveUpdateHub 随即断开该订阅者。
 */
class OutboundWindow {
public:
    static constexpr std::string_view PING_PREFIX = "ack:";

    explicit OutboundWindow(size_t limitBytes = Constants::WS_OUTBOUND_LIMIT_BYTES,
                            size_t ackInterval = Constants::WS_ACK_INTERVAL_BYTES)
        : limit_((std::max)(limitBytes, size_t{1})),
          ackInterval_((std::max)((std::min)(ackInterval, limit_), size_t{1})) {}

    /**
     * @brief 登记即将发送的一帧
     * @return 需要紧随其后发送的 Ping 载荷
     * @throws AppException SLOW_CONSUMER，此帧不应再发送
     */
    std::optional<std::string> admit(size_t bytes) {
        std::lock_guard lock(mutex_);
        uint64_t pending = sent_ - acked_;
        // 窗口为空时总放行一帧，超大帧不会直接断开空闲连接
        if (pending > 0 && pending + bytes > limit_) {
            throw AppException(ErrorCodes::SLOW_CONSUMER,
                               "客户端未确认数据超过上限: " + std::to_string(pending) + " 字节",
                               ErrorKind::Internal);
        }
        sent_ += bytes;
        if (sent_ - lastMark_ < ackInterval_) return std::nullopt;
        lastMark_ = sent_;
        return std::string(PING_PREFIX) + std::to_string(sent_);
    }

    /**
     * @brief 处理 Pong 载荷
     * @return false 表示不是本窗口发出的 Ping（例如客户端自发的心跳）
     */
    bool acknowledge(std::string_view payload) {
        if (!payload.starts_with(PING_PREFIX)) return false;
        payload.remove_prefix(PING_PREFIX.size());

        uint64_t offset = 0;
        auto [ptr, ec] = std::from_chars(payload.data(), payload.data() + payload.size(), offset);
        if (ec != std::errc() || ptr != payload.data() + payload.size()) return false;

        std::lock_guard lock(mutex_);
        if (offset > sent_) return false;
        acked_ = (std::max)(acked_, offset);
        return true;
    }

    uint64_t pendingBytes() const {
        std::lock_guard lock(mutex_);
        return sent_ - acked_;
    }

    size_t limit() const { return limit_; }

private:
    const size_t limit_;
    const size_t ackInterval_;

    mutable std::mutex mutex_;
    uint64_t sent_ = 0;
    uint64_t acked_ = 0;
    uint64_t lastMark_ = 0;
};

using OutboundWindowPtr = std::shared_ptr<OutboundWindow>;

/**
 * @brief 把连接包装成 LiveUpdateHub 的发送函数
 *
 * Conn 需要 connected() 与 send(msg, type)，即 drogon::WebSocketConnection 的接口。
 * 超出窗口时抛出的异常由 LiveUpdateHub::drain 捕获并断开订阅者。
 */
template<typename Conn>
LiveUpdateHub::SendFn makeLiveSender(std::weak_ptr<Conn> weak, OutboundWindowPtr window) {
    return [weak = std::move(weak), window = std::move(window)](std::string msg) -> drogon::Task<> {
        auto conn = weak.lock();
        if (!conn || !conn->connected()) co_return;

        auto ping = window->admit(msg.size());
        conn->send(msg, drogon::WebSocketMessageType::Text);
        if (ping) {
            conn->send(*ping, drogon::WebSocketMessageType::Ping);
        }
        co_return;
    };
}
