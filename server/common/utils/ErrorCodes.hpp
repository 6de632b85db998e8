#pragma once

/**
 * @brief 错误码（出现在 AppException::toJson 与 WebSocket error 帧中）
 *
 * 1xxx 调用方输入问题，重试前需要修正请求；5xxx 中枢自身或外部设备故障
 */
namespace ErrorCodes {

inline constexpr int NOT_FOUND = 1001;
inline constexpr int VALIDATION_FAILED = 1002;
/** WebSocket 客户端发来无法识别的消息 */
inline constexpr int UNSUPPORTED_MESSAGE = 1003;

inline constexpr int INTERNAL_ERROR = 5000;
inline constexpr int STORAGE_ERROR = 5001;
inline constexpr int INTEGRATION_ERROR = 5002;
/** 运行时未启动或正在关闭 */
inline constexpr int HUB_UNAVAILABLE = 5003;
/** WebSocket 客户端读取太慢，未确认数据超限 */
inline constexpr int SLOW_CONSUMER = 5004;

inline constexpr bool isClientError(int code) {
    return code >= 1000 && code < 2000;
}

}  // namespace ErrorCodes
