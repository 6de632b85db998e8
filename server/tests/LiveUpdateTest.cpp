#include "TestSupport.hpp"
#include "modules/live/LiveUpdateHub.hpp"
#include "modules/websocket/OutboundWindow.hpp"

using namespace TestSupport;

namespace {

/**
 * @brief 记录收到的消息与断开原因（发送任务在事件循环线程上运行）
 */
struct Recorder {
    std::mutex mutex;
    std::vector<std::string> messages;
    std::vector<std::string> closeReasons;

    size_t messageCount() {
        std::lock_guard lock(mutex);
        return messages.size();
    }

    size_t closeCount() {
        std::lock_guard lock(mutex);
        return closeReasons.size();
    }

    std::string lastReason() {
        std::lock_guard lock(mutex);
        return closeReasons.empty() ? "" : closeReasons.back();
    }

    LiveUpdateHub::SendFn sender() {
        return [this](std::string msg) -> drogon::Task<> {
            std::lock_guard lock(mutex);
            messages.push_back(std::move(msg));
            co_return;
        };
    }

    LiveUpdateHub::CloseFn closer() {
        return [this](const std::string& reason) {
            std::lock_guard lock(mutex);
            closeReasons.push_back(reason);
        };
    }
};

/**
 * @brief 与 WebSocketConnection 同形的连接；answerPings 时像浏览器一样立即回 Pong
 */
struct FakeConnection {
    OutboundWindowPtr window;
    bool answerPings = false;

    std::mutex mutex;
    size_t texts = 0;
    size_t pings = 0;

    bool connected() const { return true; }

    void send(const std::string& msg, drogon::WebSocketMessageType type) {
        {
            std::lock_guard lock(mutex);
            if (type == drogon::WebSocketMessageType::Ping) {
                ++pings;
            } else {
                ++texts;
            }
        }
        if (type == drogon::WebSocketMessageType::Ping && answerPings) {
            window->acknowledge(msg);
        }
    }

    size_t textCount() {
        std::lock_guard lock(mutex);
        return texts;
    }

    size_t pingCount() {
        std::lock_guard lock(mutex);
        return pings;
    }
};

Event tick(int seq) {
    Json::Value data;
    data["entity_id"] = "sensor.counter";
    data["seq"] = seq;
    return Event::create(EventType::StateChanged, "sensor.counter", data);
}

}  // namespace

DROGON_TEST(LiveUpdate_MessageFormat)
{
    Json::Value data;
    data["entity_id"] = "light.kitchen";
    auto msg = JsonHelper::parse(LiveUpdateHub::buildMessage("state_changed", data, 1700000000123));
    CHECK(msg["type"].asString() == "state_changed");
    CHECK(msg["data"]["entity_id"].asString() == "light.kitchen");
    CHECK(msg["ts"].asInt64() == 1700000000123);
}

DROGON_TEST(LiveUpdate_ErrorFrameCarriesCode)
{
    auto msg = JsonHelper::parse(LiveUpdateHub::buildMessage(
        "error", NotFoundException("实体不存在: light.attic").toJson()));
    CHECK(msg["type"].asString() == "error");
    CHECK(msg["data"]["code"].asInt() == ErrorCodes::NOT_FOUND);
    CHECK(msg["data"]["kind"].asString() == "not_found");
    CHECK(msg["data"]["message"].asString() == "实体不存在: light.attic");
    CHECK(ErrorCodes::isClientError(ErrorCodes::UNSUPPORTED_MESSAGE));
    CHECK(!ErrorCodes::isClientError(ErrorCodes::HUB_UNAVAILABLE));
}

DROGON_TEST(LiveUpdate_DispatchReachesSubscribers)
{
    auto bus = std::make_shared<EventBus>(64);
    auto hub = std::make_shared<LiveUpdateHub>(bus, 8);
    Recorder a;
    Recorder b;
    hub->addSubscriber(a.sender(), a.closer());
    hub->addSubscriber(b.sender(), b.closer());
    CHECK(hub->subscriberCount() == 2);

    auto event = tick(1);
    hub->dispatch(event);
    CHECK(waitUntil([&] { return a.messageCount() == 1 && b.messageCount() == 1; }));

    auto msg = JsonHelper::parse(a.messages[0]);
    CHECK(msg["type"].asString() == "state_changed");
    CHECK(msg["data"]["id"].asString() == event.id);
    CHECK(msg["data"]["data"]["seq"].asInt() == 1);
    CHECK(msg["ts"].asInt64() == TimestampHelper::toMillis(event.timestamp));
    CHECK(a.messages[0] == b.messages[0]);
}

DROGON_TEST(LiveUpdate_SlowConsumerIsDisconnected)
{
    auto bus = std::make_shared<EventBus>(64);
    auto hub = std::make_shared<LiveUpdateHub>(bus, 8);
    auto gate = std::make_shared<CancellationToken>();

    Recorder fast;
    Recorder slow;
    hub->addSubscriber(fast.sender(), fast.closer());
    hub->addSubscriber(
        [gate](std::string) -> drogon::Task<> {
            co_await cancellableSleep(60.0, gate);
        },
        slow.closer());

    for (int i = 0; i < 20; ++i) {
        hub->dispatch(tick(i));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    CHECK(waitUntil([&] { return fast.messageCount() == 20; }));
    CHECK(slow.closeCount() == 1);
    CHECK(slow.lastReason() == "slow consumer");
    CHECK(fast.closeCount() == 0);
    CHECK(hub->subscriberCount() == 1);
    CHECK(hub->disconnectedCount() == 1);

    gate->cancel();
}

DROGON_TEST(LiveUpdate_SendFailureDetachesSubscriber)
{
    auto bus = std::make_shared<EventBus>(64);
    auto hub = std::make_shared<LiveUpdateHub>(bus, 8);
    Recorder broken;
    hub->addSubscriber(
        [](std::string) -> drogon::Task<> {
            throw std::runtime_error("connection reset");
            co_return;
        },
        broken.closer());

    hub->dispatch(tick(1));
    CHECK(waitUntil([&] { return broken.closeCount() == 1; }));
    CHECK(broken.lastReason() == "send failed");
    CHECK(hub->subscriberCount() == 0);
}

DROGON_TEST(LiveUpdate_RemoveAndBusClose)
{
    auto bus = std::make_shared<EventBus>(64);
    auto hub = std::make_shared<LiveUpdateHub>(bus, 8);
    hub->start();

    Recorder leaving;
    Recorder staying;
    auto leavingId = hub->addSubscriber(leaving.sender(), leaving.closer());
    hub->addSubscriber(staying.sender(), staying.closer());

    hub->removeSubscriber(leavingId);
    CHECK(hub->subscriberCount() == 1);

    bus->publish(tick(1));
    CHECK(waitUntil([&] { return staying.messageCount() == 1; }));
    CHECK(leaving.messageCount() == 0);
    CHECK(leaving.closeCount() == 0);

    bus->close();
    CHECK(waitUntil([&] { return staying.closeCount() == 1; }));
    CHECK(staying.lastReason() == "server shutting down");
    CHECK(hub->subscriberCount() == 0);
}

DROGON_TEST(OutboundWindow_AcknowledgedBytesFreeTheWindow)
{
    OutboundWindow window(1000, 300);
    CHECK(!window.admit(200).has_value());
    auto ping = window.admit(200);
    REQUIRE(ping.has_value());
    CHECK(*ping == "ack:400");
    CHECK(window.pendingBytes() == 400);

    CHECK(!window.acknowledge("keepalive"));
    CHECK(!window.acknowledge("ack:9999"));
    CHECK(!window.acknowledge("ack:12x"));
    CHECK(window.acknowledge(*ping));
    CHECK(window.pendingBytes() == 0);

    CHECK_NOTHROW(window.admit(600));
    CHECK_NOTHROW(window.admit(300));
    try {
        window.admit(200);
        CHECK(false);
    } catch (const AppException& e) {
        CHECK(e.getCode() == ErrorCodes::SLOW_CONSUMER);
    }
    CHECK(window.pendingBytes() == 900);
}

DROGON_TEST(LiveUpdate_UnacknowledgedClientIsDisconnected)
{
    auto bus = std::make_shared<EventBus>(64);
    auto hub = std::make_shared<LiveUpdateHub>(bus, 64);

    auto stalled = std::make_shared<FakeConnection>();
    stalled->window = std::make_shared<OutboundWindow>(2048, 512);
    auto responsive = std::make_shared<FakeConnection>();
    responsive->window = std::make_shared<OutboundWindow>(2048, 512);
    responsive->answerPings = true;

    Recorder stalledClose;
    Recorder responsiveClose;
    hub->addSubscriber(makeLiveSender(std::weak_ptr<FakeConnection>(stalled), stalled->window),
                       stalledClose.closer());
    hub->addSubscriber(makeLiveSender(std::weak_ptr<FakeConnection>(responsive), responsive->window),
                       responsiveClose.closer());

    for (int i = 0; i < 40; ++i) {
        hub->dispatch(tick(i));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    CHECK(waitUntil([&] { return responsive->textCount() == 40; }));
    CHECK(responsive->pingCount() > 0);
    CHECK(responsiveClose.closeCount() == 0);

    CHECK(waitUntil([&] { return stalledClose.closeCount() == 1; }));
    CHECK(stalledClose.lastReason() == "send failed");
    CHECK(stalled->textCount() < 40);
    CHECK(stalled->window->pendingBytes() <= 2048);
    CHECK(hub->subscriberCount() == 1);
}
