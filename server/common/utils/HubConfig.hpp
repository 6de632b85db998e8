#pragma once

#include "Constants.hpp"
#include "StringUtils.hpp"

/**
 * @brief 在线探测目标（presence 集成）
 */
struct PresenceTarget {
    std::string name;
    std::string host;
    uint16_t port = 0;
};

/**
 * @brief 中枢运行时配置（custom_config.hub 节）
 *
 * 所有字段都有缺省值，配置文件只需覆盖需要修改的项。
 * 解析错误收集到 errors 中，由 ConfigManager 统一输出。
 */
struct HubConfig {
    std::string storageDriver = "postgres";
    /** postgres 存储使用的 Drogon db_clients 名称 */
    std::string dbClientName = "default";

    size_t eventBusCapacity = Constants::EVENT_BUS_DEFAULT_CAPACITY;

    int historyRetentionDays = Constants::HISTORY_RETENTION_DAYS;
    int historyPurgeIntervalHours = Constants::HISTORY_PURGE_INTERVAL_HOURS;
    bool recordEvents = true;

    double automationTickIntervalSec = Constants::AUTOMATION_TICK_INTERVAL_SEC;
    int automationMaxDelaySec = Constants::AUTOMATION_MAX_DELAY_SEC;

    size_t liveUpdateQueueCapacity = Constants::LIVE_UPDATE_QUEUE_CAPACITY;

    bool virtualEnabled = true;
    int virtualPollIntervalSec = Constants::VIRTUAL_POLL_INTERVAL_SEC;

    bool presenceEnabled = false;
    int presenceScanIntervalSec = Constants::PRESENCE_SCAN_INTERVAL_SEC;
    double presenceConnectTimeoutSec = Constants::PRESENCE_CONNECT_TIMEOUT_SEC;
    std::vector<PresenceTarget> presenceTargets;

    bool usesDatabase() const { return storageDriver == "postgres"; }

    /**
     * @brief 从 JSON 解析，缺失字段保持缺省值
     */
    static HubConfig fromJson(const Json::Value& hub, std::vector<std::string>& errors) {
        HubConfig cfg;
        if (hub.isNull()) return cfg;
        if (!hub.isObject()) {
            errors.emplace_back("[hub] 必须是 JSON 对象");
            return cfg;
        }

        const auto& storage = hub["storage"];
        if (storage.isObject() && storage.isMember("driver")) {
            cfg.storageDriver = StringUtils::toLower(storage["driver"].asString());
        }
        if (storage.isObject() && storage.isMember("db_client")) {
            cfg.dbClientName = storage["db_client"].asString();
        }

        const auto& bus = hub["event_bus"];
        if (bus.isObject() && bus.isMember("capacity")) {
            readInt(bus, "capacity", "[hub.event_bus] ", errors, [&](int v) {
                cfg.eventBusCapacity = static_cast<size_t>(v);
            });
        }

        const auto& history = hub["history"];
        if (history.isObject()) {
            readInt(history, "retention_days", "[hub.history] ", errors,
                    [&](int v) { cfg.historyRetentionDays = v; });
            readInt(history, "purge_interval_hours", "[hub.history] ", errors,
                    [&](int v) { cfg.historyPurgeIntervalHours = v; });
            if (history.isMember("record_events")) {
                cfg.recordEvents = history["record_events"].asBool();
            }
        }

        const auto& automation = hub["automation"];
        if (automation.isObject()) {
            if (automation.isMember("tick_interval_seconds")) {
                if (!automation["tick_interval_seconds"].isNumeric()) {
                    errors.emplace_back("[hub.automation] tick_interval_seconds 必须是数字");
                } else {
                    cfg.automationTickIntervalSec = automation["tick_interval_seconds"].asDouble();
                }
            }
            readInt(automation, "max_delay_seconds", "[hub.automation] ", errors,
                    [&](int v) { cfg.automationMaxDelaySec = v; });
        }

        const auto& live = hub["live_update"];
        if (live.isObject()) {
            readInt(live, "queue_capacity", "[hub.live_update] ", errors,
                    [&](int v) { cfg.liveUpdateQueueCapacity = static_cast<size_t>(v); });
        }

        const auto& integrations = hub["integrations"];
        if (integrations.isObject()) {
            const auto& virt = integrations["virtual"];
            if (virt.isObject()) {
                cfg.virtualEnabled = virt.get("enabled", cfg.virtualEnabled).asBool();
                readInt(virt, "poll_interval_seconds", "[hub.integrations.virtual] ", errors,
                        [&](int v) { cfg.virtualPollIntervalSec = v; });
            }

            const auto& presence = integrations["presence"];
            if (presence.isObject()) {
                cfg.presenceEnabled = presence.get("enabled", cfg.presenceEnabled).asBool();
                readInt(presence, "scan_interval_seconds", "[hub.integrations.presence] ", errors,
                        [&](int v) { cfg.presenceScanIntervalSec = v; });
                if (presence.isMember("connect_timeout_seconds")) {
                    cfg.presenceConnectTimeoutSec = presence["connect_timeout_seconds"].asDouble();
                }
                parseTargets(presence["targets"], cfg.presenceTargets, errors);
            }
        }

        return cfg;
    }

    /**
     * @brief 环境变量覆盖（部署时不改配置文件）
     */
    void applyEnvOverrides(std::vector<std::string>& errors) {
        if (auto v = env("HOMEHUB_STORAGE_DRIVER")) {
            storageDriver = StringUtils::toLower(*v);
        }
        envInt("HOMEHUB_HISTORY_RETENTION_DAYS", errors, historyRetentionDays);
        envInt("HOMEHUB_HISTORY_PURGE_INTERVAL_HOURS", errors, historyPurgeIntervalHours);
        envBool("HOMEHUB_VIRTUAL_ENABLED", virtualEnabled);
        envBool("HOMEHUB_PRESENCE_ENABLED", presenceEnabled);
    }

    /**
     * @brief 取值范围校验
     */
    void validate(std::vector<std::string>& errors) const {
        if (storageDriver != "postgres" && storageDriver != "memory") {
            errors.push_back("[hub.storage] driver 无效: " + storageDriver + "（可选: postgres, memory）");
        }
        if (usesDatabase() && dbClientName.empty()) {
            errors.emplace_back("[hub.storage] db_client 不能为空");
        }
        if (eventBusCapacity < Constants::EVENT_BUS_MIN_CAPACITY) {
            errors.push_back("[hub.event_bus] capacity 不能小于 " +
                             std::to_string(Constants::EVENT_BUS_MIN_CAPACITY));
        }
        if (historyRetentionDays <= 0) {
            errors.emplace_back("[hub.history] retention_days 必须大于 0");
        }
        if (historyPurgeIntervalHours <= 0) {
            errors.emplace_back("[hub.history] purge_interval_hours 必须大于 0");
        }
        if (automationTickIntervalSec <= 0 || automationTickIntervalSec > 60) {
            errors.emplace_back("[hub.automation] tick_interval_seconds 有效范围: (0, 60]");
        }
        if (automationMaxDelaySec <= 0) {
            errors.emplace_back("[hub.automation] max_delay_seconds 必须大于 0");
        }
        if (liveUpdateQueueCapacity == 0) {
            errors.emplace_back("[hub.live_update] queue_capacity 必须大于 0");
        }
        if (virtualPollIntervalSec <= 0) {
            errors.emplace_back("[hub.integrations.virtual] poll_interval_seconds 必须大于 0");
        }
        if (presenceScanIntervalSec <= 0) {
            errors.emplace_back("[hub.integrations.presence] scan_interval_seconds 必须大于 0");
        }
        if (presenceConnectTimeoutSec <= 0) {
            errors.emplace_back("[hub.integrations.presence] connect_timeout_seconds 必须大于 0");
        }
    }

private:
    template<typename Fn>
    static void readInt(const Json::Value& obj, const char* key, const std::string& prefix,
                        std::vector<std::string>& errors, Fn&& assign) {
        if (!obj.isMember(key)) return;
        if (!obj[key].isInt()) {
            errors.push_back(prefix + key + " 必须是整数");
            return;
        }
        assign(obj[key].asInt());
    }

    static void parseTargets(const Json::Value& targets, std::vector<PresenceTarget>& out,
                             std::vector<std::string>& errors) {
        if (targets.isNull()) return;
        if (!targets.isArray()) {
            errors.emplace_back("[hub.integrations.presence] targets 必须是数组");
            return;
        }
        std::set<std::string> names;
        for (Json::ArrayIndex i = 0; i < targets.size(); ++i) {
            const auto& t = targets[i];
            auto prefix = "[hub.integrations.presence.targets[" + std::to_string(i) + "]] ";

            PresenceTarget target;
            target.name = StringUtils::toLower(t.get("name", "").asString());
            target.host = t.get("host", "").asString();
            int port = t.get("port", 0).asInt();

            if (target.name.empty()) {
                errors.push_back(prefix + "缺少 name 字段");
                continue;
            }
            if (!names.insert(target.name).second) {
                errors.push_back(prefix + "name 重复: " + target.name);
                continue;
            }
            if (!isIpv4(target.host)) {
                errors.push_back(prefix + "host 必须是 IPv4 地址: " + target.host);
                continue;
            }
            if (port < 1 || port > 65535) {
                errors.push_back(prefix + "port 值无效: " + std::to_string(port) +
                                 "（有效范围: 1-65535）");
                continue;
            }
            target.port = static_cast<uint16_t>(port);
            out.push_back(std::move(target));
        }
    }

    static bool isIpv4(const std::string& host) {
        auto parts = StringUtils::split(host, '.');
        if (parts.size() != 4 || std::count(host.begin(), host.end(), '.') != 3) return false;
        for (const auto& part : parts) {
            auto v = StringUtils::parseInt(part);
            if (!v || *v < 0 || *v > 255) return false;
        }
        return true;
    }

    static std::optional<std::string> env(const char* name) {
        const char* value = std::getenv(name);
        if (!value || !*value) return std::nullopt;
        return std::string(value);
    }

    static void envInt(const char* name, std::vector<std::string>& errors, int& target) {
        auto v = env(name);
        if (!v) return;
        auto parsed = StringUtils::parseInt(StringUtils::trim(*v));
        if (!parsed) {
            errors.push_back(std::string("[env] ") + name + " 不是有效整数: " + *v);
            return;
        }
        target = *parsed;
    }

    static void envBool(const char* name, bool& target) {
        auto v = env(name);
        if (!v) return;
        auto lower = StringUtils::toLower(StringUtils::trim(*v));
        target = (lower == "1" || lower == "true" || lower == "yes" || lower == "on");
    }
};
