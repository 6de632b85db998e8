#pragma once

#include "modules/hub/HubRuntime.hpp"
#include "OutboundWindow.hpp"

/**
 * @brief WebSocket 连接会话（存储在连接 context 中）
 */
struct LiveSession {
    uint64_t subscriberId = 0;
    OutboundWindowPtr window;
};

/**
 * @brief 实时推送 WebSocket 控制器
 *
 * 路径：/ws（无认证，面向局域网）
 * 推送：每个总线事件一条 { "type", "data", "ts" } 文本帧
 * 心跳：客户端发送 {"type":"ping"} → 服务端回复 {"type":"pong"}
 * 诊断：客户端发送 {"type":"status"} → 服务端回复运行状态
 * 背压：推送帧之间穿插确认用 Ping，长期不回 Pong 的客户端被断开
 */
class WsController : public drogon::WebSocketController<WsController> {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/ws");
    WS_PATH_LIST_END

    void handleNewConnection(const drogon::HttpRequestPtr& req,
                             const drogon::WebSocketConnectionPtr& conn) override {
        auto live = HubRuntime::instance().live();
        if (!live || !HubRuntime::instance().isRunning()) {
            conn->send(buildError(AppException(ErrorCodes::HUB_UNAVAILABLE, "服务尚未就绪", ErrorKind::Internal)));
            conn->shutdown(drogon::CloseCode::kUnexpectedCondition, "Not ready");
            return;
        }

        std::weak_ptr<drogon::WebSocketConnection> weak = conn;
        auto window = std::make_shared<OutboundWindow>();
        auto id = live->addSubscriber(
            makeLiveSender(weak, window),
            [weak](const std::string& reason) {
                if (auto c = weak.lock()) {
                    c->shutdown(drogon::CloseCode::kViolation, reason);
                }
            });

        auto session = std::make_shared<LiveSession>();
        session->subscriberId = id;
        session->window = window;
        conn->setContext(session);

        Json::Value data;
        data["subscriber_id"] = static_cast<Json::UInt64>(id);
        conn->send(LiveUpdateHub::buildMessage("connected", data));
        LOG_INFO << "[WS] " << req->peerAddr().toIpPort() << " subscribed as #" << id;
    }

    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                          std::string&& message,
                          const drogon::WebSocketMessageType& type) override {
        // WebSocket 协议级 Ping
        if (type == drogon::WebSocketMessageType::Ping) {
            conn->send(message, drogon::WebSocketMessageType::Pong);
            return;
        }
        if (type == drogon::WebSocketMessageType::Pong) {
            if (conn->hasContext()) {
                if (auto session = conn->getContext<LiveSession>(); session && session->window) {
                    session->window->acknowledge(message);
                }
            }
            return;
        }

        if (type != drogon::WebSocketMessageType::Text) return;

        Json::Value msg;
        try {
            msg = JsonHelper::parse(message);
        } catch (const std::exception& e) {
            LOG_DEBUG << "[WS] Malformed message: " << e.what();
            conn->send(buildError(ValidationException("消息不是合法 JSON")));
            return;
        }

        std::string msgType = JsonHelper::getString(msg, "type");

        // 应用层心跳
        if (msgType == "ping") {
            conn->send(LiveUpdateHub::buildMessage("pong", Json::Value(Json::objectValue)));
        } else if (msgType == "status") {
            conn->send(LiveUpdateHub::buildMessage("status", HubRuntime::instance().status()));
        } else {
            conn->send(buildError(AppException(ErrorCodes::UNSUPPORTED_MESSAGE,
                                             "不支持的消息类型: " + msgType, ErrorKind::Validation)));
        }
    }

    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override {
        if (!conn->hasContext()) return;
        auto session = conn->getContext<LiveSession>();
        if (!session) return;
        if (auto live = HubRuntime::instance().live()) {
            live->removeSubscriber(session->subscriberId);
        }
    }

private:
    static std::string buildError(const AppException& e) {
        return LiveUpdateHub::buildMessage("error", e.toJson());
    }
};
