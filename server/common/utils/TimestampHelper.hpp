#pragma once

/** 微秒精度的系统时间点 */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/**
 * @brief 本地时间分解（用于 cron 匹配和时间段条件）
 */
struct LocalTime {
    int minute = 0;      // 0-59
    int hour = 0;        // 0-23
    int dayOfMonth = 1;  // 1-31
    int month = 1;       // 1-12
    int dayOfWeek = 0;   // 0-6，0 为周日

    int minuteOfDay() const { return hour * 60 + minute; }
};

/**
 * @brief 时间戳助手
 */
class TimestampHelper {
public:
    static Timestamp now() {
        return std::chrono::time_point_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now());
    }

    static int64_t toMicros(Timestamp ts) {
        return ts.time_since_epoch().count();
    }

    static Timestamp fromMicros(int64_t micros) {
        return Timestamp(std::chrono::microseconds(micros));
    }

    static int64_t toMillis(Timestamp ts) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            ts.time_since_epoch()).count();
    }

    /**
     * @brief UTC ISO-8601，毫秒精度: 2024-01-01T08:00:00.123Z
     */
    static std::string toIso(Timestamp ts) {
        auto ms = std::chrono::floor<std::chrono::milliseconds>(ts);
        auto dp = std::chrono::floor<std::chrono::days>(ms);
        std::chrono::year_month_day ymd{dp};
        std::chrono::hh_mm_ss hms{ms - dp};

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << static_cast<int>(ymd.year()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
            << std::setw(2) << hms.hours().count() << ":"
            << std::setw(2) << hms.minutes().count() << ":"
            << std::setw(2) << hms.seconds().count() << "."
            << std::setw(3) << hms.subseconds().count() << "Z";
        return oss.str();
    }

    static std::string nowIso() {
        return toIso(now());
    }

    /**
     * @brief 转换为本地时间分解
     */
    static LocalTime toLocal(Timestamp ts) {
        std::time_t t = std::chrono::system_clock::to_time_t(
            std::chrono::time_point_cast<std::chrono::system_clock::duration>(ts));
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        LocalTime local;
        local.minute = tm.tm_min;
        local.hour = tm.tm_hour;
        local.dayOfMonth = tm.tm_mday;
        local.month = tm.tm_mon + 1;
        local.dayOfWeek = tm.tm_wday;
        return local;
    }
};
