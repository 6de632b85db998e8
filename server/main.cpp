// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>

#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/database/DatabaseInitializer.hpp"
#include "common/database/DatabaseService.hpp"
#include "modules/hub/HubRuntime.hpp"
#include "modules/websocket/WebSocket.Controller.hpp"

using namespace drogon;

namespace {

/**
 * @brief 各启动阶段失败时的排查提示
 */
const std::map<std::string, std::vector<std::string>>& stageHints() {
    static const std::vector<std::string> database = {
        "PostgreSQL 服务是否正在运行",
        "db_clients 的 host/port/user/passwd/dbname 是否正确",
        "custom_config.hub.storage.db_client 是否指向存在的 db_clients 项",
        "不需要持久化时可设置 custom_config.hub.storage.driver = \"memory\"",
    };
    static const std::map<std::string, std::vector<std::string>> hints = {
        {"storage:client", database},
        {"storage:ping", database},
        {"storage:initialize", database},
        {"engine:load", {
            "automation 表是否已正确创建",
            "trigger_json / conditions_json / actions_json 是否为合法 JSON",
        }},
        {"integrations:setup", {"custom_config.hub.integrations 配置是否正确"}},
        {"integrations:start", {"custom_config.hub.integrations 配置是否正确"}},
    };
    return hints;
}

void reportStartupFailure(const std::string& stage, const std::string& detail) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n [ERROR] 启动阶段失败: " << stage << "\n"
              << std::string(60, '-') << "\n  " << detail << "\n";

    auto it = stageHints().find(stage);
    if (it != stageHints().end()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : it->second) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_FATAL << "[Startup] " << stage << ": " << detail;
}

void quitLoop() {
    app().getLoop()->queueInLoop([]() { app().quit(); });
}

/**
 * @brief 存储就绪 → 运行时启动；任一阶段失败则有序关闭并退出
 */
Task<> bootstrap(bool usesDatabase) {
    std::string stage = "startup";
    std::string error;
    try {
        if (usesDatabase) {
            stage = "storage:client";
            DatabaseService db;
            if (!db.getClient()) {
                throw StorageException("Drogon 未能创建 DB 客户端 '" + DatabaseService::clientName() + "'");
            }

            stage = "storage:ping";
            LOG_INFO << "[Startup] " << stage;
            co_await db.ping();

            stage = "storage:initialize";
            LOG_INFO << "[Startup] " << stage;
            co_await DatabaseInitializer::initialize();
        }

        co_await HubRuntime::instance().start(stage);
        LOG_INFO << "[Startup] Hub running";
    } catch (const std::exception& e) {
        error = e.what();
        if (error.empty()) error = "未知异常";
    }

    if (!error.empty()) {
        reportStartupFailure(stage, error);
        co_await HubRuntime::instance().stop();
        quitLoop();
    }
}

/**
 * @brief SIGINT/SIGTERM：运行时有序关闭后退出事件循环（重复信号忽略）
 */
void requestShutdown(const char* signal) {
    static std::atomic<bool> requested{false};
    if (requested.exchange(true)) return;

    LOG_INFO << "[Shutdown] " << signal << " received";
    app().getLoop()->queueInLoop([]() {
        async_run([]() -> Task<> {
            co_await HubRuntime::instance().stop();
            quitLoop();
        });
    });
}

void onListening() {
    for (const auto& addr : app().getListeners()) {
        std::cout << "homehub live updates on ws://" << addr.toIpPort() << "/ws" << std::endl;
        LOG_INFO << "[Startup] Live updates on ws://" << addr.toIpPort() << "/ws";
    }
    std::cout << "Logs: " << ConfigManager::log().dir << "/" << LoggerManager::FILE_PREFIX
              << "*.log" << std::endl;

    const auto& config = ConfigManager::hub();
    HubRuntime::instance().build(config, HubRuntime::createStore(config));
    async_run([usesDatabase = config.usesDatabase()]() { return bootstrap(usesDatabase); });
}

}  // namespace

int main() {
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 配置失败时 ConfigManager 已输出详细错误
    if (!ConfigManager::load()) {
        std::cerr << "Server startup aborted due to configuration errors." << std::endl;
        return 1;
    }

    const auto& log = ConfigManager::log();
    LoggerManager::initialize(log.dir);
    LoggerManager::setLogLevel(log.level);
    LoggerManager::setConsoleEcho(log.console);
    LoggerManager::setRetentionDays(log.retentionDays);

    app().setTermSignalHandler([]() { requestShutdown("SIGTERM"); });
    app().setIntSignalHandler([]() { requestShutdown("SIGINT"); });
    app().registerBeginningAdvice(onListening);

    app().run();

    LOG_INFO << "[Shutdown] Event loop exited";
    LoggerManager::close();
    return 0;
}
