#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 把 ? 占位符改写为 PostgreSQL 的 $1, $2, ...
 *
 * 参数由 libpq 在服务端绑定，SQL 文本里不出现任何值
 */
inline std::string toParameterized(const std::string& sql, size_t paramCount) {
    std::string result;
    result.reserve(sql.size() + paramCount * 2);
    size_t next = 1;
    for (char c : sql) {
        if (c == '?' && next <= paramCount) {
            result += '$';
            result += std::to_string(next++);
        } else {
            result += c;
        }
    }
    return result;
}

/**
 * @brief 在 DbClient 或 Transaction 上执行带参数的 SQL
 *
 * ORM 异常统一转为 StorageException；超过阈值的查询记 WARN
 */
template<typename Executor>
drogon::Task<drogon::orm::Result> runBoundSql(Executor& executor, const std::string& sql,
                                              const std::vector<std::string>& params) {
    auto started = std::chrono::steady_clock::now();
    std::string failure;
    try {
        std::optional<drogon::orm::Result> result;
        if (params.empty()) {
            result = co_await executor.execSqlCoro(sql);
        } else {
            auto binder = executor << toParameterized(sql, params.size());
            for (const auto& p : params) {
                binder << p;
            }
            result = co_await drogon::orm::internal::SqlAwaiter(std::move(binder));
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        if (elapsed >= Constants::DB_SLOW_QUERY_MS) {
            LOG_WARN << "[Database] Slow query (" << elapsed << " ms): " << sql.substr(0, 120);
        }
        co_return std::move(*result);
    } catch (const drogon::orm::DrogonDbException& e) {
        failure = e.base().what();
    }

    LOG_ERROR << "[Database] Query failed: " << failure;
    throw StorageException("数据库操作失败: " + failure);
}

/**
 * @brief PostgreSQL 访问入口（Drogon DbClient 连接池）
 *
 * 使用哪个 db_clients 项由 configure() 决定，启动时由 ConfigManager 设置
 */
class DatabaseService {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    using Result = drogon::orm::Result;
    using Transaction = drogon::orm::Transaction;
    template<typename T = void> using Task = drogon::Task<T>;

    static void configure(const std::string& clientName, bool fast) {
        clientName_ = clientName;
        fast_ = fast;
    }

    static const std::string& clientName() { return clientName_; }

    /**
     * @return 配置中没有该客户端时为 nullptr
     */
    DbClientPtr getClient() const {
        return fast_ ? drogon::app().getFastDbClient(clientName_)
                     : drogon::app().getDbClient(clientName_);
    }

    Task<void> ping() {
        co_await execSqlCoro("SELECT 1");
    }

    Task<Result> execSqlCoro(const std::string& sql,
                             const std::vector<std::string>& params = {}) {
        auto client = requireClient();
        co_return co_await runBoundSql(*client, sql, params);
    }

    Task<std::shared_ptr<Transaction>> newTransactionCoro() {
        auto client = requireClient();
        std::string failure;
        try {
            co_return co_await client->newTransactionCoro();
        } catch (const drogon::orm::DrogonDbException& e) {
            failure = e.base().what();
        }
        throw StorageException("无法开启事务: " + failure);
    }

private:
    inline static std::string clientName_ = "default";
    inline static bool fast_ = false;

    DbClientPtr requireClient() const {
        auto client = getClient();
        if (!client) {
            throw StorageException("数据库客户端不可用: " + clientName_);
        }
        return client;
    }
};
