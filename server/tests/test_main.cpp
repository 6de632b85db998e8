#define DROGON_TEST_MAIN
#include <drogon/drogon_test.h>

#include "common/utils/LoggerManager.hpp"

/**
 * @brief 测试入口：事件循环在后台线程运行，用例在主线程用 sync_wait 驱动协程
 */
int main(int argc, char** argv) {
    using namespace drogon;

    if (const char* level = std::getenv("HOMEHUB_LOG_LEVEL"); level && *level) {
        LoggerManager::setLogLevel(level);
    } else {
        trantor::Logger::setLogLevel(trantor::Logger::kWarn);
    }

    std::promise<void> started;
    auto ready = started.get_future();
    std::thread loopThread([&started]() {
        app().getLoop()->queueInLoop([&started]() { started.set_value(); });
        app().run();
    });

    ready.get();
    int status = test::run(argc, argv);

    app().getLoop()->queueInLoop([]() { app().quit(); });
    loopThread.join();
    return status;
}
