#pragma once

#include "HubStore.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/database/TransactionGuard.hpp"
#include "common/utils/FieldHelper.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief PostgreSQL 存储（Drogon ORM）
 *
 * - 参数统一以 ? 书写，由 DatabaseService 转换为 $N 服务端绑定
 * - 时间字段为 BIGINT 微秒
 * - 可选文本字段以空串传入，经 NULLIF 存为 NULL
 */
class PgStore : public HubStore {
public:
    using Row = drogon::orm::Row;

    // ==================== Entity ====================

    Task<> saveEntity(const Entity& e) override {
        co_await db_.execSqlCoro(R"(
            INSERT INTO entity (id, device_id, entity_id, friendly_name, state, attributes,
                                last_changed, last_updated)
            VALUES (?, ?, ?, ?, ?, ?::jsonb, ?::bigint, ?::bigint)
            ON CONFLICT (id) DO UPDATE SET
                device_id = EXCLUDED.device_id,
                entity_id = EXCLUDED.entity_id,
                friendly_name = EXCLUDED.friendly_name,
                state = EXCLUDED.state,
                attributes = EXCLUDED.attributes,
                last_changed = EXCLUDED.last_changed,
                last_updated = EXCLUDED.last_updated
        )", {
            e.id, e.deviceId, e.entityId, e.friendlyName,
            entityStateToString(e.state),
            JsonHelper::serialize(attributesToJson(e.attributes)),
            std::to_string(TimestampHelper::toMicros(e.lastChanged)),
            std::to_string(TimestampHelper::toMicros(e.lastUpdated))
        });
    }

    Task<std::optional<Entity>> findEntity(const std::string& id) override {
        auto result = co_await db_.execSqlCoro(ENTITY_SELECT + " WHERE id = ?", {id});
        if (result.empty()) co_return std::nullopt;
        co_return rowToEntity(result[0]);
    }

    Task<std::optional<Entity>> findEntityByKey(const std::string& entityId) override {
        auto result = co_await db_.execSqlCoro(ENTITY_SELECT + " WHERE entity_id = ?", {entityId});
        if (result.empty()) co_return std::nullopt;
        co_return rowToEntity(result[0]);
    }

    Task<std::vector<Entity>> listEntities() override {
        auto result = co_await db_.execSqlCoro(ENTITY_SELECT + " ORDER BY entity_id");
        std::vector<Entity> entities;
        for (const auto& row : result) entities.push_back(rowToEntity(row));
        co_return entities;
    }

    Task<std::vector<Entity>> findEntitiesByDeviceIds(const std::vector<std::string>& deviceIds) override {
        std::vector<Entity> entities;
        if (deviceIds.empty()) co_return entities;
        auto result = co_await db_.execSqlCoro(
            ENTITY_SELECT + " WHERE device_id = ANY(?::text[]) ORDER BY entity_id",
            {toPgArray(deviceIds)});
        for (const auto& row : result) entities.push_back(rowToEntity(row));
        co_return entities;
    }

    Task<bool> deleteEntity(const std::string& id) override {
        auto result = co_await db_.execSqlCoro("DELETE FROM entity WHERE id = ?", {id});
        co_return result.affectedRows() > 0;
    }

    // ==================== Device ====================

    Task<> saveDevice(const Device& d) override {
        co_await db_.execSqlCoro(R"(
            INSERT INTO device (id, name, manufacturer, model, area_id, integration, unique_id)
            VALUES (?, ?, NULLIF(?, ''), NULLIF(?, ''), NULLIF(?, ''), ?, ?)
            ON CONFLICT (id) DO UPDATE SET
                name = EXCLUDED.name,
                manufacturer = EXCLUDED.manufacturer,
                model = EXCLUDED.model,
                area_id = EXCLUDED.area_id,
                integration = EXCLUDED.integration,
                unique_id = EXCLUDED.unique_id
        )", {d.id, d.name, d.manufacturer, d.model, d.areaId, d.integration, d.uniqueId});
    }

    Task<std::optional<Device>> findDevice(const std::string& id) override {
        auto result = co_await db_.execSqlCoro(DEVICE_SELECT + " WHERE id = ?", {id});
        if (result.empty()) co_return std::nullopt;
        co_return rowToDevice(result[0]);
    }

    Task<std::optional<Device>> findDeviceByUniqueId(const std::string& integration,
                                                     const std::string& uniqueId) override {
        if (uniqueId.empty()) co_return std::nullopt;
        auto result = co_await db_.execSqlCoro(
            DEVICE_SELECT + " WHERE integration = ? AND unique_id = ?", {integration, uniqueId});
        if (result.empty()) co_return std::nullopt;
        co_return rowToDevice(result[0]);
    }

    Task<std::vector<Device>> listDevices() override {
        auto result = co_await db_.execSqlCoro(DEVICE_SELECT + " ORDER BY name");
        std::vector<Device> devices;
        for (const auto& row : result) devices.push_back(rowToDevice(row));
        co_return devices;
    }

    /**
     * @brief 设备与其实体在同一事务中删除
     */
    Task<bool> deleteDevice(const std::string& id) override {
        auto guard = co_await TransactionGuard::create(db_);
        co_await guard.execSqlCoro("DELETE FROM entity WHERE device_id = ?", {id});
        auto result = co_await guard.execSqlCoro("DELETE FROM device WHERE id = ?", {id});
        co_await guard.commit();
        co_return result.affectedRows() > 0;
    }

    // ==================== Area ====================

    Task<> saveArea(const Area& a) override {
        co_await db_.execSqlCoro(R"(
            INSERT INTO area (id, name, parent_id) VALUES (?, ?, NULLIF(?, ''))
            ON CONFLICT (id) DO UPDATE SET name = EXCLUDED.name, parent_id = EXCLUDED.parent_id
        )", {a.id, a.name, a.parentId});
    }

    Task<std::optional<Area>> findArea(const std::string& id) override {
        auto result = co_await db_.execSqlCoro("SELECT id, name, parent_id FROM area WHERE id = ?", {id});
        if (result.empty()) co_return std::nullopt;
        co_return rowToArea(result[0]);
    }

    Task<std::vector<Area>> listAreas() override {
        auto result = co_await db_.execSqlCoro("SELECT id, name, parent_id FROM area ORDER BY name");
        std::vector<Area> areas;
        for (const auto& row : result) areas.push_back(rowToArea(row));
        co_return areas;
    }

    Task<bool> deleteArea(const std::string& id) override {
        auto result = co_await db_.execSqlCoro("DELETE FROM area WHERE id = ?", {id});
        co_return result.affectedRows() > 0;
    }

    // ==================== Event ====================

    Task<> saveEvent(const Event& e) override {
        co_await db_.execSqlCoro(R"(
            INSERT INTO event (id, event_type, entity_id, ts, data)
            VALUES (?, ?, NULLIF(?, ''), ?::bigint, ?::jsonb)
            ON CONFLICT (id) DO NOTHING
        )", {
            e.id, eventTypeToString(e.type), e.entityId,
            std::to_string(TimestampHelper::toMicros(e.timestamp)),
            JsonHelper::serialize(e.data)
        });
    }

    Task<std::optional<Event>> findEvent(const std::string& id) override {
        auto result = co_await db_.execSqlCoro(EVENT_SELECT + " WHERE id = ?", {id});
        if (result.empty()) co_return std::nullopt;
        co_return rowToEvent(result[0]);
    }

    Task<std::vector<Event>> listRecentEvents(int limit) override {
        auto result = co_await db_.execSqlCoro(
            EVENT_SELECT + " ORDER BY ts DESC LIMIT ?::int", {std::to_string(clampLimit(limit))});
        std::vector<Event> events;
        for (const auto& row : result) events.push_back(rowToEvent(row));
        co_return events;
    }

    Task<std::vector<Event>> listEventsByEntity(const std::string& entityId, int limit) override {
        auto result = co_await db_.execSqlCoro(
            EVENT_SELECT + " WHERE entity_id = ? ORDER BY ts DESC LIMIT ?::int",
            {entityId, std::to_string(clampLimit(limit))});
        std::vector<Event> events;
        for (const auto& row : result) events.push_back(rowToEvent(row));
        co_return events;
    }

    // ==================== Automation ====================

    Task<> saveAutomation(const Automation& a) override {
        Json::Value conditions(Json::arrayValue);
        for (const auto& c : a.conditions) conditions.append(AutomationJson::conditionToJson(c));
        Json::Value actions(Json::arrayValue);
        for (const auto& act : a.actions) actions.append(AutomationJson::actionToJson(act));

        co_await db_.execSqlCoro(R"(
            INSERT INTO automation (id, name, enabled, trigger_json, conditions_json, actions_json,
                                    last_triggered)
            VALUES (?, ?, ?::boolean, ?::jsonb, ?::jsonb, ?::jsonb, NULLIF(?, '')::bigint)
            ON CONFLICT (id) DO UPDATE SET
                name = EXCLUDED.name,
                enabled = EXCLUDED.enabled,
                trigger_json = EXCLUDED.trigger_json,
                conditions_json = EXCLUDED.conditions_json,
                actions_json = EXCLUDED.actions_json,
                last_triggered = EXCLUDED.last_triggered
        )", {
            a.id, a.name, a.enabled ? "true" : "false",
            JsonHelper::serialize(AutomationJson::triggerToJson(a.trigger)),
            JsonHelper::serialize(conditions),
            JsonHelper::serialize(actions),
            a.lastTriggered ? std::to_string(TimestampHelper::toMicros(*a.lastTriggered)) : ""
        });
    }

    Task<std::optional<Automation>> findAutomation(const std::string& id) override {
        auto result = co_await db_.execSqlCoro(AUTOMATION_SELECT + " WHERE id = ?", {id});
        if (result.empty()) co_return std::nullopt;
        co_return rowToAutomation(result[0]);
    }

    Task<std::vector<Automation>> listAutomations() override {
        auto result = co_await db_.execSqlCoro(AUTOMATION_SELECT + " ORDER BY name");
        co_return rowsToAutomations(result);
    }

    Task<std::vector<Automation>> listEnabledAutomations() override {
        auto result = co_await db_.execSqlCoro(AUTOMATION_SELECT + " WHERE enabled = TRUE ORDER BY name");
        co_return rowsToAutomations(result);
    }

    Task<bool> deleteAutomation(const std::string& id) override {
        auto result = co_await db_.execSqlCoro("DELETE FROM automation WHERE id = ?", {id});
        co_return result.affectedRows() > 0;
    }

    // ==================== EntityHistory ====================

    Task<> saveHistory(const EntityHistory& h) override {
        co_await db_.execSqlCoro(R"(
            INSERT INTO entity_history (id, entity_id, state, attributes, recorded_at)
            VALUES (?, ?, ?, ?::jsonb, ?::bigint)
        )", {
            h.id, h.entityId, entityStateToString(h.state),
            JsonHelper::serialize(attributesToJson(h.attributes)),
            std::to_string(TimestampHelper::toMicros(h.recordedAt))
        });
    }

    Task<std::vector<EntityHistory>> listHistory(const std::string& entityId,
                                                 Timestamp from, Timestamp to,
                                                 int limit) override {
        auto result = co_await db_.execSqlCoro(R"(
            SELECT id, entity_id, state, attributes::text AS attributes, recorded_at
            FROM entity_history
            WHERE entity_id = ? AND recorded_at >= ?::bigint AND recorded_at <= ?::bigint
            ORDER BY recorded_at
            LIMIT ?::int
        )", {
            entityId,
            std::to_string(TimestampHelper::toMicros(from)),
            std::to_string(TimestampHelper::toMicros(to)),
            std::to_string(clampLimit(limit))
        });

        std::vector<EntityHistory> rows;
        for (const auto& row : result) {
            EntityHistory h;
            h.id = FieldHelper::getString(row["id"]);
            h.entityId = FieldHelper::getString(row["entity_id"]);
            h.state = entityStateFromString(FieldHelper::getString(row["state"], "unknown"));
            h.attributes = attributesFromJson(FieldHelper::getJson(row["attributes"]));
            h.recordedAt = FieldHelper::getTimestamp(row["recorded_at"]);
            rows.push_back(std::move(h));
        }
        co_return rows;
    }

    Task<uint64_t> purgeHistoryBefore(Timestamp cutoff) override {
        auto result = co_await db_.execSqlCoro(
            "DELETE FROM entity_history WHERE recorded_at < ?::bigint",
            {std::to_string(TimestampHelper::toMicros(cutoff))});
        co_return static_cast<uint64_t>(result.affectedRows());
    }

private:
    DatabaseService db_;

    inline static const std::string ENTITY_SELECT =
        "SELECT id, device_id, entity_id, friendly_name, state, attributes::text AS attributes, "
        "last_changed, last_updated FROM entity";
    inline static const std::string DEVICE_SELECT =
        "SELECT id, name, manufacturer, model, area_id, integration, unique_id FROM device";
    inline static const std::string EVENT_SELECT =
        "SELECT id, event_type, entity_id, ts, data::text AS data FROM event";
    inline static const std::string AUTOMATION_SELECT =
        "SELECT id, name, enabled, trigger_json::text AS trigger_json, "
        "conditions_json::text AS conditions_json, actions_json::text AS actions_json, "
        "last_triggered FROM automation";

    static int clampLimit(int limit) {
        if (limit <= 0) return Constants::MAX_UNPAGED_ROWS;
        return (std::min)(limit, Constants::MAX_UNPAGED_ROWS);
    }

    /** {"a","b"} 形式的 PostgreSQL 数组字面量 */
    static std::string toPgArray(const std::vector<std::string>& values) {
        std::string out = "{";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out += ',';
            out += '"';
            for (char c : values[i]) {
                if (c == '"' || c == '\\') out += '\\';
                out += c;
            }
            out += '"';
        }
        out += '}';
        return out;
    }

    static Entity rowToEntity(const Row& row) {
        Entity e;
        e.id = FieldHelper::getString(row["id"]);
        e.deviceId = FieldHelper::getString(row["device_id"]);
        e.entityId = FieldHelper::getString(row["entity_id"]);
        e.friendlyName = FieldHelper::getString(row["friendly_name"]);
        e.state = entityStateFromString(FieldHelper::getString(row["state"], "unknown"));
        e.attributes = attributesFromJson(FieldHelper::getJson(row["attributes"]));
        e.lastChanged = FieldHelper::getTimestamp(row["last_changed"]);
        e.lastUpdated = FieldHelper::getTimestamp(row["last_updated"]);
        return e;
    }

    static Device rowToDevice(const Row& row) {
        Device d;
        d.id = FieldHelper::getString(row["id"]);
        d.name = FieldHelper::getString(row["name"]);
        d.manufacturer = FieldHelper::getString(row["manufacturer"]);
        d.model = FieldHelper::getString(row["model"]);
        d.areaId = FieldHelper::getString(row["area_id"]);
        d.integration = FieldHelper::getString(row["integration"]);
        d.uniqueId = FieldHelper::getString(row["unique_id"]);
        return d;
    }

    static Area rowToArea(const Row& row) {
        Area a;
        a.id = FieldHelper::getString(row["id"]);
        a.name = FieldHelper::getString(row["name"]);
        a.parentId = FieldHelper::getString(row["parent_id"]);
        return a;
    }

    static Event rowToEvent(const Row& row) {
        Event e;
        e.id = FieldHelper::getString(row["id"]);
        e.type = eventTypeFromString(FieldHelper::getString(row["event_type"], "custom"));
        e.entityId = FieldHelper::getString(row["entity_id"]);
        e.timestamp = FieldHelper::getTimestamp(row["ts"]);
        e.data = FieldHelper::getJson(row["data"]);
        return e;
    }

    static Automation rowToAutomation(const Row& row) {
        Json::Value json;
        json["id"] = FieldHelper::getString(row["id"]);
        json["name"] = FieldHelper::getString(row["name"]);
        json["enabled"] = FieldHelper::getBool(row["enabled"], true);
        json["trigger"] = FieldHelper::getJson(row["trigger_json"]);
        json["conditions"] = FieldHelper::getJson(row["conditions_json"]);
        json["actions"] = FieldHelper::getJson(row["actions_json"]);

        auto automation = Automation::fromJson(json);
        automation.lastTriggered = FieldHelper::getOptionalTimestamp(row["last_triggered"]);
        return automation;
    }

    static std::vector<Automation> rowsToAutomations(const drogon::orm::Result& result) {
        std::vector<Automation> automations;
        for (const auto& row : result) {
            try {
                automations.push_back(rowToAutomation(row));
            } catch (const AppException& e) {
                LOG_ERROR << "[PgStore] Skipping unreadable automation "
                          << FieldHelper::getString(row["id"]) << ": " << e.what();
            }
        }
        return automations;
    }
};
