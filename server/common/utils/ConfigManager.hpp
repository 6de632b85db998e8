#pragma once

#include "common/database/DatabaseService.hpp"
#include "Constants.hpp"
#include "HubConfig.hpp"
#include "JsonHelper.hpp"
#include "LoggerManager.hpp"

namespace fs = std::filesystem;

/**
 * @brief 日志设置（custom_config.log 节）
 */
struct LogSettings {
    std::string level = "INFO";
    bool console = false;
    std::string dir = "./logs";
    int retentionDays = Constants::LOG_RETENTION_DAYS;
};

/**
 * @brief 一次配置检查的结果；errors 非空时不允许启动
 */
struct ConfigReport {
    HubConfig hub;
    LogSettings log;
    bool fastDbClient = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool ok() const { return errors.empty(); }
};

/**
 * @brief 配置管理器：查找配置文件，校验后交给 Drogon 并保存中枢配置
 *
 * Drogon 自己的键（listeners、db_clients、app）由 Drogon 加载；
 * custom_config.hub 与 custom_config.log 在这里解析。
 */
class ConfigManager {
public:
    /**
     * @brief 加载并验证配置文件
     * @return 失败时已把错误输出到 stderr
     */
    static bool load() {
        auto path = findConfigFile();
        if (!path) return false;

        Json::Value root;
        if (!readFile(*path, root)) return false;

        auto report = check(root);
        if (!report.warnings.empty()) {
            printFramed("WARN", "配置警告 (" + *path + ")", report.warnings);
        }
        if (!report.ok()) {
            printFramed("ERROR", "配置验证失败: " + *path, report.errors);
            return false;
        }

        try {
            drogon::app().loadConfigFile(*path);
        } catch (const std::exception& e) {
            printFramed("ERROR", "Drogon 加载配置失败", {e.what()});
            return false;
        }

        current_ = std::move(report);
        DatabaseService::configure(current_.hub.dbClientName, current_.fastDbClient);
        LOG_INFO << "[Config] Loaded " << *path << " (storage=" << current_.hub.storageDriver << ")";
        return true;
    }

    /**
     * @brief 校验整个配置文档（不依赖 Drogon，便于测试）
     */
    static ConfigReport check(const Json::Value& root) {
        ConfigReport report;
        checkListeners(root, report.errors);

        const auto& custom = root["custom_config"];
        report.hub = parseHubConfig(root, report.errors);
        report.log = parseLogSettings(custom.isObject() ? custom["log"] : Json::Value(), report.errors);

        if (report.hub.usesDatabase()) {
            checkDbClients(root, report);
        }
        if (report.hub.presenceEnabled && report.hub.presenceTargets.empty()) {
            report.warnings.emplace_back("[hub.integrations.presence] 已启用但没有配置 targets");
        }

        return report;
    }

    /**
     * @brief 解析并校验 custom_config.hub（含环境变量覆盖）
     */
    static HubConfig parseHubConfig(const Json::Value& root, std::vector<std::string>& errors) {
        Json::Value hubJson;
        if (root.isObject() && root["custom_config"].isObject()) {
            hubJson = root["custom_config"]["hub"];
        }
        auto cfg = HubConfig::fromJson(hubJson, errors);
        cfg.applyEnvOverrides(errors);
        cfg.validate(errors);
        return cfg;
    }

    /**
     * @brief 解析 custom_config.log；HOMEHUB_LOG_LEVEL 优先于文件
     */
    static LogSettings parseLogSettings(const Json::Value& log, std::vector<std::string>& errors) {
        LogSettings settings;
        if (log.isObject()) {
            settings.level = log.get("level", settings.level).asString();
            settings.console = log.get("console", settings.console).asBool();
            settings.dir = log.get("dir", settings.dir).asString();
            if (log.isMember("retention_days")) {
                if (log["retention_days"].isInt() && log["retention_days"].asInt() >= 0) {
                    settings.retentionDays = log["retention_days"].asInt();
                } else {
                    errors.emplace_back("[log] retention_days 必须是非负整数");
                }
            }
        } else if (!log.isNull()) {
            errors.emplace_back("[log] 必须是 JSON 对象");
        }

        if (const char* env = std::getenv("HOMEHUB_LOG_LEVEL"); env && *env) {
            settings.level = env;
        }
        if (!LoggerManager::parseLevel(settings.level)) {
            errors.push_back("[log] level 无效: " + settings.level +
                             "（可选: TRACE, DEBUG, INFO, WARN, ERROR, FATAL）");
        }
        if (settings.dir.empty()) {
            errors.emplace_back("[log] dir 不能为空");
        }
        return settings;
    }

    static const HubConfig& hub() { return current_.hub; }
    static const LogSettings& log() { return current_.log; }

private:
    inline static ConfigReport current_;

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> candidates = {
            "./config/config.local.json",
            "./config/config.json",
            "../config/config.json",
            "config.json",
        };
        for (const auto& path : candidates) {
            if (fs::exists(path)) return path;
        }

        std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
        for (const auto& p : candidates) {
            hints.push_back("  - " + p);
        }
        hints.emplace_back("可参考 config/config.example.json");
        printFramed("ERROR", "未找到配置文件", hints);
        return std::nullopt;
    }

    static bool readFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printFramed("ERROR", "无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printFramed("ERROR", "JSON 解析失败: " + path,
                        {errs, "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"});
            return false;
        }
        if (!root.isObject()) {
            printFramed("ERROR", "JSON 格式错误: " + path, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }
        return true;
    }

    static void checkListeners(const Json::Value& root, std::vector<std::string>& errors) {
        const auto& listeners = root["listeners"];
        if (!listeners.isArray() || listeners.empty()) {
            errors.emplace_back("[listeners] 需要至少一个监听地址（WebSocket /ws 依赖它）");
            return;
        }
        for (Json::ArrayIndex i = 0; i < listeners.size(); ++i) {
            auto prefix = "[listeners[" + std::to_string(i) + "]] ";
            if (!listeners[i].isObject()) {
                errors.push_back(prefix + "必须是 JSON 对象");
                continue;
            }
            if (JsonHelper::getString(listeners[i], "address").empty()) {
                errors.push_back(prefix + "缺少 address 字段");
            }
            checkPort(listeners[i], prefix, errors);
        }
    }

    /**
     * @brief postgres 存储需要一个与 storage.db_client 同名的 db_clients 项
     */
    static void checkDbClients(const Json::Value& root, ConfigReport& report) {
        const auto& clients = root["db_clients"];
        const auto& wanted = report.hub.dbClientName;
        if (!clients.isArray() || clients.empty()) {
            report.errors.emplace_back("[db_clients] postgres 存储需要至少一个 PostgreSQL 连接");
            return;
        }

        bool found = false;
        for (Json::ArrayIndex i = 0; i < clients.size(); ++i) {
            const auto& db = clients[i];
            auto prefix = "[db_clients[" + std::to_string(i) + "]] ";
            if (!db.isObject()) {
                report.errors.push_back(prefix + "必须是 JSON 对象");
                continue;
            }

            for (const char* field : {"name", "rdbms", "host", "user", "dbname"}) {
                if (JsonHelper::getString(db, field).empty()) {
                    report.errors.push_back(prefix + "缺少必填字段: " + field);
                }
            }
            checkPort(db, prefix, report.errors);

            if (!db["passwd"].isString()) {
                report.errors.push_back(prefix + "缺少 passwd 字段");
            } else if (isPlaceholder(db["passwd"].asString())) {
                report.warnings.push_back(prefix + "passwd 看起来是占位符，请填入实际密码");
            }

            if (JsonHelper::getString(db, "name") == wanted) {
                found = true;
                report.fastDbClient = db.get("is_fast", false).asBool();
            }
        }
        if (!found) {
            report.errors.push_back("[hub.storage] db_client '" + wanted + "' 不在 db_clients 中");
        }
    }

    static void checkPort(const Json::Value& obj, const std::string& prefix,
                          std::vector<std::string>& errors) {
        if (!obj["port"].isInt()) {
            errors.push_back(prefix + "缺少 port 字段");
            return;
        }
        int port = obj["port"].asInt();
        if (port < 1 || port > 65535) {
            errors.push_back(prefix + "port 值无效: " + std::to_string(port) + "（有效范围: 1-65535）");
        }
    }

    static bool isPlaceholder(const std::string& value) {
        return value.starts_with("YOUR_") || value.starts_with("your_")
            || value.find("CHANGE_ME") != std::string::npos
            || value == "password" || value == "PASSWORD";
    }

    static void printFramed(const char* tag, const std::string& title,
                            const std::vector<std::string>& lines) {
        bool error = std::string_view(tag) == "ERROR";
        std::string border(60, error ? '=' : '-');
        std::cerr << "\n" << border << "\n [" << tag << "] " << title << "\n"
                  << std::string(60, '-') << "\n";
        for (const auto& line : lines) {
            std::cerr << "  " << line << "\n";
            if (error) {
                LOG_ERROR << "[Config] " << line;
            } else {
                LOG_WARN << "[Config] " << line;
            }
        }
        std::cerr << border << "\n" << std::endl;
    }
};
