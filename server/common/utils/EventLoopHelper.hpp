#pragma once

/**
 * @brief 事件循环辅助
 *
 * 协程在哪个 EventLoop 上挂起，就应在哪个 EventLoop 上恢复。
 * 不在任何 EventLoop 线程上（如 sync_wait 的调用线程）时回落到主循环。
 */
namespace EventLoopHelper {

inline trantor::EventLoop* currentOrMain() {
    auto* loop = trantor::EventLoop::getEventLoopOfCurrentThread();
    return loop ? loop : drogon::app().getLoop();
}

/**
 * @brief 在指定循环上恢复协程（总是异步，避免在调用方栈上重入）
 */
inline void resumeOn(trantor::EventLoop* loop, std::coroutine_handle<> handle) {
    if (!loop) loop = drogon::app().getLoop();
    loop->queueInLoop([handle]() { handle.resume(); });
}

}  // namespace EventLoopHelper
