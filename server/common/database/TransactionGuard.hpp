#pragma once

#include "DatabaseService.hpp"

/**
 * @brief RAII 事务：未提交就析构时自动回滚
 *
 * @code
 * auto tx = co_await TransactionGuard::create(db);
 * co_await tx.execSqlCoro("DELETE FROM entity WHERE device_id = ?", {id});
 * co_await tx.execSqlCoro("DELETE FROM device WHERE id = ?", {id});
 * co_await tx.commit();
 * @endcode
 */
class TransactionGuard {
public:
    using Transaction = drogon::orm::Transaction;
    using Result = drogon::orm::Result;
    template<typename T = void> using Task = drogon::Task<T>;

    enum class Phase { Open, Committed, RolledBack };

    static Task<TransactionGuard> create(DatabaseService& db) {
        co_return TransactionGuard(co_await db.newTransactionCoro());
    }

    TransactionGuard(TransactionGuard&& other) noexcept
        : tx_(std::move(other.tx_)), phase_(std::exchange(other.phase_, Phase::Committed)) {}

    TransactionGuard& operator=(TransactionGuard&&) = delete;
    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    ~TransactionGuard() {
        if (phase_ != Phase::Open || !tx_) return;
        LOG_WARN << "[Database] Transaction dropped without commit, rolling back";
        try {
            tx_->rollback();
        } catch (const std::exception& e) {
            LOG_ERROR << "[Database] Rollback failed: " << e.what();
        }
    }

    Task<Result> execSqlCoro(const std::string& sql, const std::vector<std::string>& params = {}) {
        requireOpen();
        co_return co_await runBoundSql(*tx_, sql, params);
    }

    /**
     * @brief 提交并等待 PostgreSQL 确认
     *
     * Drogon 在 Transaction 析构时发送 COMMIT，结果经 setCommitCallback 回传；
     * 协程挂起到回调触发，调用方之后发布的事件一定对应已落盘的数据。
     */
    Task<void> commit() {
        requireOpen();

        struct CommitAwaiter : drogon::CallbackAwaiter<bool> {
            std::shared_ptr<Transaction> tx;
            explicit CommitAwaiter(std::shared_ptr<Transaction> t) : tx(std::move(t)) {}

            void await_suspend(std::coroutine_handle<> handle) {
                tx->setCommitCallback([this, handle](bool ok) {
                    setValue(ok);
                    handle.resume();
                });
                tx.reset();
            }
        };

        phase_ = Phase::Committed;
        bool ok = co_await CommitAwaiter(std::move(tx_));
        if (!ok) {
            throw StorageException("事务提交失败");
        }
    }

    void rollback() {
        if (phase_ == Phase::RolledBack) return;
        requireOpen();
        tx_->rollback();
        phase_ = Phase::RolledBack;
    }

    Phase phase() const { return phase_; }

private:
    std::shared_ptr<Transaction> tx_;
    Phase phase_ = Phase::Open;

    explicit TransactionGuard(std::shared_ptr<Transaction> tx) : tx_(std::move(tx)) {}

    void requireOpen() const {
        if (phase_ == Phase::Committed) throw StorageException("事务已提交");
        if (phase_ == Phase::RolledBack) throw StorageException("事务已回滚");
    }
};
