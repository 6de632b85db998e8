#pragma once

#include "AppException.hpp"
#include "JsonHelper.hpp"
#include "TimestampHelper.hpp"

/**
 * @brief 数据库行字段读取（NULL 返回默认值）
 *
 * 时间列统一存 Unix 微秒（BIGINT），JSON 列以 ::text 取出。
 */
class FieldHelper {
public:
    static std::string getString(const drogon::orm::Field& field, const std::string& defaultValue = "") {
        return field.isNull() ? defaultValue : field.as<std::string>();
    }

    static bool getBool(const drogon::orm::Field& field, bool defaultValue = false) {
        return field.isNull() ? defaultValue : field.as<bool>();
    }

    static Timestamp getTimestamp(const drogon::orm::Field& field) {
        return TimestampHelper::fromMicros(field.isNull() ? 0 : field.as<int64_t>());
    }

    static std::optional<Timestamp> getOptionalTimestamp(const drogon::orm::Field& field) {
        if (field.isNull()) return std::nullopt;
        return TimestampHelper::fromMicros(field.as<int64_t>());
    }

    /**
     * @brief JSON 文本列；NULL 或空串视为空对象
     * @throws InternalException 存储内容不是合法 JSON
     */
    static Json::Value getJson(const drogon::orm::Field& field) {
        auto text = getString(field);
        if (text.empty()) return Json::Value(Json::objectValue);
        try {
            return JsonHelper::parse(text);
        } catch (const std::exception& e) {
            throw InternalException(std::string("存储中的 JSON 无法解析: ") + e.what());
        }
    }
};
