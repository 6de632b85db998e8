#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 错误种类，决定调用方怎么处理
 */
enum class ErrorKind {
    Validation,   // 输入非法，状态未变更
    NotFound,     // 目标 id 不存在
    Storage,      // 持久化失败，必须上报给等待中的调用方
    Integration,  // 协议/连接故障，隔离在单个集成内
    Internal      // 序列化失败或不变量破坏
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:  return "validation";
        case ErrorKind::NotFound:    return "not_found";
        case ErrorKind::Storage:     return "storage";
        case ErrorKind::Integration: return "integration";
        case ErrorKind::Internal:    return "internal";
    }
    return "internal";
}

/**
 * @brief 中枢所有可预期错误的基类
 */
class AppException : public std::runtime_error {
public:
    AppException(int code, const std::string& message, ErrorKind kind)
        : std::runtime_error(message), code_(code), kind_(kind) {}

    int getCode() const { return code_; }
    ErrorKind getKind() const { return kind_; }

    /**
     * @brief {code, kind, message}，WebSocket error 帧的 data
     */
    Json::Value toJson() const {
        Json::Value json;
        json["code"] = code_;
        json["kind"] = errorKindToString(kind_);
        json["message"] = what();
        return json;
    }

private:
    int code_;
    ErrorKind kind_;
};

class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "资源不存在")
        : AppException(ErrorCodes::NOT_FOUND, message, ErrorKind::NotFound) {}
};

class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::VALIDATION_FAILED, message, ErrorKind::Validation) {}
};

/**
 * @brief 存储层失败（数据库不可用、约束冲突等）
 */
class StorageException : public AppException {
public:
    explicit StorageException(const std::string& message = "存储操作失败")
        : AppException(ErrorCodes::STORAGE_ERROR, message, ErrorKind::Storage) {}
};

/**
 * @brief 集成（协议适配器）故障
 */
class IntegrationException : public AppException {
public:
    explicit IntegrationException(const std::string& message = "集成调用失败")
        : AppException(ErrorCodes::INTEGRATION_ERROR, message, ErrorKind::Integration) {}
};

class InternalException : public AppException {
public:
    explicit InternalException(const std::string& message = "内部错误")
        : AppException(ErrorCodes::INTERNAL_ERROR, message, ErrorKind::Internal) {}
};
