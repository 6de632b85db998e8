#pragma once

#include <json/json.h>

#include <stdexcept>

/**
 * @brief jsoncpp 读写封装
 *
 * 存储列、WebSocket 帧和配置片段都走这里，保证紧凑 UTF-8 输出一致
 */
namespace JsonHelper {

inline std::string serialize(const Json::Value& value) {
    static const auto builder = [] {
        Json::StreamWriterBuilder b;
        b["indentation"] = "";
        b["emitUTF8"] = true;
        return b;
    }();
    return Json::writeString(builder, value);
}

/**
 * @throws std::runtime_error 文本不是合法 JSON（附 jsoncpp 的错误位置）
 */
inline Json::Value parse(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value result;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &result, &errs)) {
        throw std::runtime_error("JSON parse error: " + errs);
    }
    return result;
}

inline std::string getString(const Json::Value& obj, const char* key,
                             const std::string& def = "") {
    if (!obj.isObject()) return def;
    const auto& v = obj[key];
    return v.isString() ? v.asString() : def;
}

/**
 * @brief 子对象字段；缺失或不是对象时返回空对象
 */
inline Json::Value getObject(const Json::Value& obj, const char* key) {
    if (obj.isObject() && obj[key].isObject()) return obj[key];
    return Json::Value(Json::objectValue);
}

}  // namespace JsonHelper
