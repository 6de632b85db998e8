#pragma once

#include "Constants.hpp"
#include "StringUtils.hpp"

namespace fs = std::filesystem;

/**
 * @brief 日志管理：trantor::AsyncFileLogger 异步写盘，按日期与大小轮转
 *
 * 文件命名: <dir>/homehub_YYYY-MM-DD.*.log（AsyncFileLogger 超限后追加序号）
 * 轮转: 跨天切换新文件；单文件超过 100MB 由 AsyncFileLogger 切分
 * 保留: 每次轮转删除超过 retentionDays 天的旧日志（0 表示不清理）
 * 控制台: 可选同时写 stdout（开发 / 容器日志）
 */
class LoggerManager {
public:
    static constexpr const char* FILE_PREFIX = "homehub_";
    static constexpr uint64_t FILE_SIZE_LIMIT = 100 * 1024 * 1024;

    /**
     * @brief 初始化：创建目录、打开当天日志、接管 trantor 输出
     */
    static void initialize(const std::string& logDir) {
        fs::create_directories(logDir);
        state().dir = logDir;

        int today = todayInt();
        {
            std::unique_lock lock(state().mutex);
            state().day = today;
            state().logger = openLogger(today);
        }

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(output, flush);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief 名称 → trantor 级别（大小写不敏感，WARNING 等同 WARN）
     */
    static std::optional<trantor::Logger::LogLevel> parseLevel(const std::string& name) {
        static const std::map<std::string, trantor::Logger::LogLevel> levels = {
            {"trace", trantor::Logger::kTrace},
            {"debug", trantor::Logger::kDebug},
            {"info", trantor::Logger::kInfo},
            {"warn", trantor::Logger::kWarn},
            {"warning", trantor::Logger::kWarn},
            {"error", trantor::Logger::kError},
            {"fatal", trantor::Logger::kFatal},
        };
        auto it = levels.find(StringUtils::toLower(StringUtils::trim(name)));
        if (it == levels.end()) return std::nullopt;
        return it->second;
    }

    static void setLogLevel(const std::string& name) {
        auto level = parseLevel(name);
        if (!level) {
            LOG_WARN << "[Logger] Unknown log level '" << name << "', keeping current level";
            return;
        }
        trantor::Logger::setLogLevel(*level);
    }

    static void setConsoleEcho(bool enabled) {
        state().console.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief 设置保留天数并立即清理一次
     */
    static void setRetentionDays(int days) {
        state().retentionDays.store((std::max)(days, 0), std::memory_order_relaxed);
        if (!state().dir.empty()) {
            purgeExpired(state().dir, days, todayInt());
        }
    }

    /**
     * @brief 删除 dir 下日期早于 today - days 的日志文件
     * @return 删除的文件数
     */
    static size_t purgeExpired(const std::string& dir, int days, int today) {
        if (days <= 0) return 0;
        int oldest = shiftDays(today, -days);

        size_t removed = 0;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file(ec)) continue;
            auto day = dayFromFileName(entry.path().filename().string());
            if (day && *day < oldest && fs::remove(entry.path(), ec)) {
                ++removed;
            }
        }
        return removed;
    }

    /**
     * @brief 从文件名解析日期（homehub_YYYY-MM-DD...）
     * @return YYYYMMDD
     */
    static std::optional<int> dayFromFileName(const std::string& name) {
        std::string prefix = FILE_PREFIX;
        if (name.size() < prefix.size() + 10 || name.compare(0, prefix.size(), prefix) != 0) {
            return std::nullopt;
        }
        auto date = name.substr(prefix.size(), 10);
        if (date[4] != '-' || date[7] != '-') return std::nullopt;
        auto y = StringUtils::parseInt(date.substr(0, 4));
        auto m = StringUtils::parseInt(date.substr(5, 2));
        auto d = StringUtils::parseInt(date.substr(8, 2));
        if (!y || !m || !d) return std::nullopt;
        return *y * 10000 + *m * 100 + *d;
    }

    /**
     * @brief trantor 原始行 → "YYYY-MM-DD HH:MM:SS tid LEVEL message"
     *
     * 原始: "YYYYMMDD HH:MM:SS.micros tid LEVEL [func] message - file:line"
     * 去掉 lambda 的 [operator ()] 与末尾源码位置。
     */
    static std::string formatLine(std::string_view raw) {
        if (raw.size() < 17 || raw[8] != ' ') return std::string(raw);
        auto timeEnd = raw.find(' ', 9);
        if (timeEnd == std::string_view::npos || timeEnd <= 15) return std::string(raw);

        std::string line;
        line.reserve(raw.size());
        line.append(raw.substr(0, 4)).append("-")
            .append(raw.substr(4, 2)).append("-")
            .append(raw.substr(6, 2)).append(" ")
            .append(raw.substr(9, 8));

        std::string rest(raw.substr(timeEnd));
        if (auto op = rest.find("[operator ()"); op != std::string::npos) {
            if (auto close = rest.find("] ", op); close != std::string::npos) {
                rest.erase(op, close + 2 - op);
            }
        }
        if (auto loc = rest.rfind(" - "); loc != std::string::npos) {
            auto where = std::string_view(rest).substr(loc + 3);
            if (where.find(".cpp:") != std::string_view::npos ||
                where.find(".hpp:") != std::string_view::npos) {
                rest.erase(loc);
                rest.push_back('\n');
            }
        }
        return line + rest;
    }

    static void close() {
        std::unique_lock lock(state().mutex);
        state().logger.reset();
    }

private:
    struct State {
        std::shared_mutex mutex;
        std::unique_ptr<trantor::AsyncFileLogger> logger;
        std::string dir;
        std::atomic<int> day{0};
        std::atomic<int> retentionDays{Constants::LOG_RETENTION_DAYS};
        std::atomic<bool> console{false};
    };

    static State& state() {
        static State s;
        return s;
    }

    static int toInt(const std::chrono::year_month_day& ymd) {
        return static_cast<int>(ymd.year()) * 10000
             + static_cast<int>(static_cast<unsigned>(ymd.month())) * 100
             + static_cast<int>(static_cast<unsigned>(ymd.day()));
    }

    /** 本地日期 YYYYMMDD（与 setDisplayLocalTime 一致） */
    static int todayInt() {
        std::time_t t = std::time(nullptr);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        return (tm.tm_year + 1900) * 10000 + (tm.tm_mon + 1) * 100 + tm.tm_mday;
    }

    static int shiftDays(int day, int delta) {
        std::chrono::year_month_day ymd{std::chrono::year(day / 10000),
                                        std::chrono::month(static_cast<unsigned>(day % 10000 / 100)),
                                        std::chrono::day(static_cast<unsigned>(day % 100))};
        auto shifted = std::chrono::sys_days(ymd) + std::chrono::days(delta);
        return toInt(std::chrono::year_month_day{shifted});
    }

    static std::unique_ptr<trantor::AsyncFileLogger> openLogger(int day) {
        char date[11];
        std::snprintf(date, sizeof(date), "%04d-%02d-%02d", day / 10000, day % 10000 / 100, day % 100);

        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(state().dir + "/" + FILE_PREFIX + date);
        logger->setFileSizeLimit(FILE_SIZE_LIMIT);
        logger->startLogging();
        return logger;
    }

    /**
     * @brief 跨天切换文件；旧 logger 在锁外析构（析构时 flush）
     */
    static void rotate(int today) {
        std::unique_ptr<trantor::AsyncFileLogger> previous;
        {
            std::unique_lock lock(state().mutex);
            if (state().day.load(std::memory_order_relaxed) == today) return;
            previous = std::move(state().logger);
            state().logger = openLogger(today);
            state().day.store(today, std::memory_order_relaxed);
        }
        previous.reset();
        purgeExpired(state().dir, state().retentionDays.load(std::memory_order_relaxed), today);
    }

    static void output(const char* msg, const uint64_t len) {
        auto line = formatLine(std::string_view(msg, len));

        int today = todayInt();
        if (today != state().day.load(std::memory_order_relaxed)) {
            rotate(today);
        }
        if (state().console.load(std::memory_order_relaxed)) {
            std::fwrite(line.data(), 1, line.size(), stdout);
        }

        std::shared_lock lock(state().mutex);
        if (state().logger) {
            state().logger->output(line.c_str(), line.size());
        }
    }

    static void flush() {
        std::shared_lock lock(state().mutex);
        if (state().logger) {
            state().logger->flush();
        }
    }
};
