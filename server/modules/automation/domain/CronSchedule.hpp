#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/StringUtils.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 五段式 cron 表达式：分 时 日 月 周
 *
 * 每段支持 `*`、数字、列表 `a,b`、范围 `a-b`、步长 `*\/n` 与 `a-b/n`。
 * 周字段 0-7，0 和 7 都表示周日。
 * 日与周同时受限时按标准 cron 语义取并集。
 */
class CronSchedule {
public:
    static CronSchedule parse(const std::string& expr) {
        auto fields = StringUtils::split(StringUtils::trim(expr), ' ');
        // split 丢弃空片段，多个空格视为一个分隔符
        if (fields.size() != 5) {
            throw ValidationException("cron 表达式需要 5 段（分 时 日 月 周）: " + expr);
        }

        CronSchedule schedule;
        schedule.expr_ = expr;
        schedule.minutes_ = parseField(fields[0], 0, 59, "minute");
        schedule.hours_ = parseField(fields[1], 0, 23, "hour");
        schedule.daysOfMonth_ = parseField(fields[2], 1, 31, "day-of-month");
        schedule.months_ = parseField(fields[3], 1, 12, "month");
        auto dow = parseField(fields[4], 0, 7, "day-of-week");
        if (dow.test(7)) {
            dow.set(0);
            dow.reset(7);
        }
        schedule.daysOfWeek_ = dow;
        // 以 * 开头（含 */n）的日、周字段不算受限
        schedule.domRestricted_ = !fields[2].starts_with('*');
        schedule.dowRestricted_ = !fields[4].starts_with('*');
        return schedule;
    }

    bool matches(const LocalTime& t) const {
        if (!minutes_.test(t.minute) || !hours_.test(t.hour) || !months_.test(t.month)) {
            return false;
        }
        bool domMatch = daysOfMonth_.test(t.dayOfMonth);
        bool dowMatch = daysOfWeek_.test(t.dayOfWeek);
        if (domRestricted_ && dowRestricted_) {
            return domMatch || dowMatch;
        }
        return domMatch && dowMatch;
    }

    const std::string& expression() const { return expr_; }

private:
    using Bits = std::bitset<64>;

    std::string expr_;
    Bits minutes_, hours_, daysOfMonth_, months_, daysOfWeek_;
    bool domRestricted_ = false;
    bool dowRestricted_ = false;

    static Bits parseField(const std::string& field, int min, int max, const char* name) {
        Bits bits;
        for (const auto& part : StringUtils::split(field, ',')) {
            int step = 1;
            std::string range = part;

            auto slash = part.find('/');
            if (slash != std::string::npos) {
                auto parsedStep = StringUtils::parseInt(part.substr(slash + 1));
                if (!parsedStep || *parsedStep <= 0) {
                    throw ValidationException(std::string("cron ") + name + " 步长无效: " + part);
                }
                step = *parsedStep;
                range = part.substr(0, slash);
            }

            int lo = min;
            int hi = max;
            if (range != "*") {
                auto dash = range.find('-');
                if (dash == std::string::npos) {
                    lo = hi = parseValue(range, min, max, name);
                    // "5/15" 表示从 5 开始每 15 个单位
                    if (slash != std::string::npos) hi = max;
                } else {
                    lo = parseValue(range.substr(0, dash), min, max, name);
                    hi = parseValue(range.substr(dash + 1), min, max, name);
                    if (lo > hi) {
                        throw ValidationException(std::string("cron ") + name + " 范围无效: " + part);
                    }
                }
            }

            for (int v = lo; v <= hi; v += step) {
                bits.set(static_cast<size_t>(v));
            }
        }
        if (bits.none()) {
            throw ValidationException(std::string("cron ") + name + " 字段为空: " + field);
        }
        return bits;
    }

    static int parseValue(const std::string& str, int min, int max, const char* name) {
        auto value = StringUtils::parseInt(str);
        if (!value || *value < min || *value > max) {
            throw ValidationException(std::string("cron ") + name + " 取值超出范围 [" +
                std::to_string(min) + ", " + std::to_string(max) + "]: " + str);
        }
        return *value;
    }
};
