#pragma once

#include "common/utils/Constants.hpp"

/**
 * @brief 集成生命周期状态
 *
 * Disabled  配置中未启用
 * Pending   已构造，尚未 setup
 * Ready     setup 成功，后台任务未启动（或没有后台任务）
 * Running   后台任务运行中
 * Retrying  上一轮扫描失败，退避等待中
 * Failed    setup 失败，不再启动
 * Stopped   已 teardown
 */
enum class IntegrationState {
    Disabled,
    Pending,
    Ready,
    Running,
    Retrying,
    Failed,
    Stopped
};

inline std::string integrationStateToString(IntegrationState state) {
    switch (state) {
        case IntegrationState::Disabled: return "disabled";
        case IntegrationState::Pending:  return "pending";
        case IntegrationState::Ready:    return "ready";
        case IntegrationState::Running:  return "running";
        case IntegrationState::Retrying: return "retrying";
        case IntegrationState::Failed:   return "failed";
        case IntegrationState::Stopped:  return "stopped";
    }
    return "stopped";
}

/**
 * @brief 指数退避重试策略
 *
 * - 基础延迟 2 秒，指数增长
 * - 最大延迟 5 分钟（300 秒），无最大重试限制
 * - ±20% 随机抖动防止雷群效应
 * - 可再以调用方给定的上限截断（集成的轮询间隔）
 */
class ReconnectPolicy {
public:
    /**
     * @brief 获取当前重试的延迟时间（秒）
     * @param cap 额外上限，<= 0 表示不限制
     */
    double getDelay(double cap = 0) const {
        double delay = Constants::RECONNECT_BASE_DELAY_SEC
            * std::pow(2.0, static_cast<double>((std::min)(attempts_, 16)));
        delay = (std::min)(delay, Constants::RECONNECT_MAX_DELAY_SEC);

        // ±20% 随机抖动
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(
            -Constants::RECONNECT_JITTER_RATIO, Constants::RECONNECT_JITTER_RATIO);
        delay *= (1.0 + dist(rng));

        delay = (std::max)(delay, Constants::RECONNECT_BASE_DELAY_SEC);
        if (cap > 0) delay = (std::min)(delay, cap);
        return delay;
    }

    void recordAttempt() { ++attempts_; }

    void reset() { attempts_ = 0; }

    int attempts() const { return attempts_; }

private:
    int attempts_ = 0;
};

/**
 * @brief 集成状态机
 *
 * 每个集成持有一个实例，所有状态转换集中在此。
 *
 * 状态转换表：
 *   Pending →[setupOk]→ Ready →[started]→ Running
 *   Pending →[setupFailed]→ Failed
 *   Running →[scanFailed]→ Retrying →[scanOk]→ Running
 *   Any →[stopped]→ Stopped
 */
class IntegrationStateMachine {
public:
    IntegrationState state() const { return state_; }
    std::string stateString() const { return integrationStateToString(state_); }

    void onDisabled() {
        transition(IntegrationState::Disabled, "disabled");
    }

    void onSetupOk() {
        transition(IntegrationState::Ready, "setupOk");
    }

    void onSetupFailed(const std::string& reason) {
        lastError_ = reason;
        transition(IntegrationState::Failed, "setupFailed");
    }

    void onStarted() {
        transition(IntegrationState::Running, "started");
    }

    void onScanOk() {
        ++scans_;
        consecutiveFailures_ = 0;
        retry_.reset();
        transition(IntegrationState::Running, "scanOk");
    }

    /**
     * @brief 一轮扫描失败
     * @return 下一次重试前的等待秒数
     */
    double onScanFailed(const std::string& reason, double cap) {
        ++consecutiveFailures_;
        lastError_ = reason;
        double delay = retry_.getDelay(cap);
        retry_.recordAttempt();
        transition(IntegrationState::Retrying, "scanFailed");
        return delay;
    }

    void onStopped() {
        transition(IntegrationState::Stopped, "stopped");
        retry_.reset();
    }

    bool wasSetUp() const {
        return state_ == IntegrationState::Ready || state_ == IntegrationState::Running
            || state_ == IntegrationState::Retrying;
    }

    bool isRunning() const {
        return state_ == IntegrationState::Ready || state_ == IntegrationState::Running
            || state_ == IntegrationState::Retrying;
    }

    const std::string& lastError() const { return lastError_; }
    int consecutiveFailures() const { return consecutiveFailures_; }
    uint64_t scans() const { return scans_; }

    Json::Value toJson() const {
        Json::Value json;
        json["state"] = stateString();
        json["last_error"] = lastError_.empty() ? Json::Value(Json::nullValue) : Json::Value(lastError_);
        json["consecutive_failures"] = consecutiveFailures_;
        json["scans"] = static_cast<Json::UInt64>(scans_);
        return json;
    }

private:
    IntegrationState state_ = IntegrationState::Pending;
    ReconnectPolicy retry_;
    std::string lastError_;
    int consecutiveFailures_ = 0;
    uint64_t scans_ = 0;

    void transition(IntegrationState newState, const char* event) {
        if (state_ != newState) {
            LOG_DEBUG << "IntegrationFSM: " << integrationStateToString(state_)
                      << " →[" << event << "]→ " << integrationStateToString(newState);
            state_ = newState;
        }
    }
};
