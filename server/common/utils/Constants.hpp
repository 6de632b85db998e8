#pragma once

/**
 * @brief 全局常量定义
 *
 * 配置项缺省值和运行时内部参数集中在此
 */
namespace Constants {

// ==================== 日志 ====================

/** 日志文件默认保留天数 */
inline constexpr int LOG_RETENTION_DAYS = 14;

// ==================== 事件总线 ====================

/** 事件总线环形缓冲默认容量 */
inline constexpr size_t EVENT_BUS_DEFAULT_CAPACITY = 1024;

/** 事件总线最小容量 */
inline constexpr size_t EVENT_BUS_MIN_CAPACITY = 16;

// ==================== 历史记录 ====================

/** 历史数据默认保留天数 */
inline constexpr int HISTORY_RETENTION_DAYS = 30;

/** 历史清理默认间隔（小时） */
inline constexpr int HISTORY_PURGE_INTERVAL_HOURS = 24;

/** 历史查询默认返回行数上限 */
inline constexpr int HISTORY_QUERY_LIMIT = 1000;

// ==================== 自动化 ====================

/** TimePattern 触发器检查间隔（秒） */
inline constexpr double AUTOMATION_TICK_INTERVAL_SEC = 15.0;

/** Delay 动作最大时长（秒） */
inline constexpr int AUTOMATION_MAX_DELAY_SEC = 3600;

/** 可取消等待的切片长度（秒） */
inline constexpr double CANCEL_CHECK_SLICE_SEC = 0.25;

// ==================== 实时推送 ====================

/** 每个订阅者的出站队列容量 */
inline constexpr size_t LIVE_UPDATE_QUEUE_CAPACITY = 256;

/** WebSocket 连接允许的未确认出站字节上限 */
inline constexpr size_t WS_OUTBOUND_LIMIT_BYTES = 4 * 1024 * 1024;

/** 每发出这么多字节附带一个确认用 Ping */
inline constexpr size_t WS_ACK_INTERVAL_BYTES = 64 * 1024;

// ==================== 集成 ====================

/** 虚拟集成后台任务默认间隔（秒） */
inline constexpr int VIRTUAL_POLL_INTERVAL_SEC = 30;

/** 在线探测默认扫描间隔（秒） */
inline constexpr int PRESENCE_SCAN_INTERVAL_SEC = 60;

/** 在线探测 TCP 连接超时（秒） */
inline constexpr double PRESENCE_CONNECT_TIMEOUT_SEC = 3.0;

/** 关闭时等待集成后台任务退出的上限（秒） */
inline constexpr double INTEGRATION_SHUTDOWN_TIMEOUT_SEC = 5.0;

// ==================== 失败重试策略 ====================

/** 重试基础延迟（秒） */
inline constexpr double RECONNECT_BASE_DELAY_SEC = 2.0;

/** 重试最大延迟（秒）- 5分钟 */
inline constexpr double RECONNECT_MAX_DELAY_SEC = 300.0;

/** 重试抖动比例（±20%） */
inline constexpr double RECONNECT_JITTER_RATIO = 0.2;

// ==================== 查询 ====================

/** 超过该耗时（毫秒）的 SQL 记 WARN */
inline constexpr long long DB_SLOW_QUERY_MS = 500;

/** 非分页查询最大返回行数 */
inline constexpr int MAX_UNPAGED_ROWS = 2000;

}  // namespace Constants
