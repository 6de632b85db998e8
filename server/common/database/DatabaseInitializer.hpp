#pragma once

#include "DatabaseService.hpp"

/**
 * @brief 数据库结构初始化（幂等，可重复执行）
 *
 * 时间字段统一存为 BIGINT 微秒时间戳，避免时区换算并保留事件时间的严格递增
 */
class DatabaseInitializer {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    static Task<> initialize() {
        DatabaseService db;

        LOG_INFO << "[Database] Checking schema...";

        // 抑制 IF NOT EXISTS 产生的 NOTICE（"relation already exists, skipping"）
        co_await db.execSqlCoro("SET client_min_messages = WARNING");

        co_await createTables(db);
        co_await createIndexes(db);

        LOG_INFO << "[Database] Schema initialization completed";
    }

private:
    static Task<> createTables(DatabaseService& db) {
        co_await db.execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS area (
                id VARCHAR(36) PRIMARY KEY,
                name VARCHAR(200) NOT NULL,
                parent_id VARCHAR(36) NULL
            )
        )");

        co_await db.execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS device (
                id VARCHAR(36) PRIMARY KEY,
                name VARCHAR(200) NOT NULL,
                manufacturer VARCHAR(200),
                model VARCHAR(200),
                area_id VARCHAR(36) NULL,
                integration VARCHAR(100) NOT NULL DEFAULT '',
                unique_id VARCHAR(200) NOT NULL DEFAULT ''
            )
        )");

        co_await db.execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS entity (
                id VARCHAR(36) PRIMARY KEY,
                device_id VARCHAR(36) NOT NULL,
                entity_id VARCHAR(255) NOT NULL,
                friendly_name VARCHAR(255) NOT NULL,
                state VARCHAR(20) NOT NULL DEFAULT 'unknown',
                attributes JSONB NOT NULL DEFAULT '{}',
                last_changed BIGINT NOT NULL,
                last_updated BIGINT NOT NULL
            )
        )");

        co_await db.execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS event (
                id VARCHAR(36) PRIMARY KEY,
                event_type VARCHAR(40) NOT NULL,
                entity_id VARCHAR(255) NULL,
                ts BIGINT NOT NULL,
                data JSONB NOT NULL DEFAULT '{}'
            )
        )");

        co_await db.execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS automation (
                id VARCHAR(36) PRIMARY KEY,
                name VARCHAR(200) NOT NULL,
                enabled BOOLEAN NOT NULL DEFAULT TRUE,
                trigger_json JSONB NOT NULL,
                conditions_json JSONB NOT NULL DEFAULT '[]',
                actions_json JSONB NOT NULL DEFAULT '[]',
                last_triggered BIGINT NULL
            )
        )");

        co_await db.execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS entity_history (
                id VARCHAR(36) PRIMARY KEY,
                entity_id VARCHAR(255) NOT NULL,
                state VARCHAR(20) NOT NULL,
                attributes JSONB NOT NULL DEFAULT '{}',
                recorded_at BIGINT NOT NULL
            )
        )");

        LOG_INFO << "[Database] Tables created/verified";
    }

    static Task<> createIndexes(DatabaseService& db) {
        // 实体键全局唯一
        co_await db.execSqlCoro(R"(CREATE UNIQUE INDEX IF NOT EXISTS idx_entity_key ON entity (entity_id))");
        co_await db.execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_entity_device ON entity (device_id))");
        // (integration, unique_id) 去重键，仅对非空 unique_id 生效
        co_await db.execSqlCoro(R"(CREATE UNIQUE INDEX IF NOT EXISTS idx_device_identity ON device (integration, unique_id) WHERE unique_id <> '')");
        co_await db.execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_device_area ON device (area_id))");
        co_await db.execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_area_parent ON area (parent_id))");
        co_await db.execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_event_ts ON event (ts DESC))");
        co_await db.execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_event_entity ON event (entity_id, ts DESC))");
        co_await db.execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_automation_enabled ON automation (enabled))");
        // 历史查询按实体 + 时间范围，清理按时间
        co_await db.execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_history_entity_time ON entity_history (entity_id, recorded_at))");
        co_await db.execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_history_recorded ON entity_history (recorded_at))");

        LOG_INFO << "[Database] Indexes created/verified";
    }
};
