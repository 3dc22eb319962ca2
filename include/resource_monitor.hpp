#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace codebox {

/**
 * @brief 一次执行的状态
 * Running → {Completed | TimedOut | MemoryExceeded | Crashed} → Terminated
 */
enum class run_state {
    RUNNING,

    /**
     * @brief worker 在超出任何限制之前自行正常退出
     */
    COMPLETED,

    /**
     * @brief 运行时间达到 timeout_seconds
     */
    TIMED_OUT,

    /**
     * @brief 采样到的内存达到 max_memory_mb
     */
    MEMORY_EXCEEDED,

    /**
     * @brief worker 自行异常退出（非零退出码、被信号杀死、没有执行报告）
     */
    CRASHED,

    /**
     * @brief 最终状态，worker 已经回收
     */
    TERMINATED
};

const char *get_state_name(run_state state);

/**
 * @brief 资源监控的一次采样
 */
struct resource_sample {
    /**
     * @brief 从 worker 启动开始经过的时间
     */
    std::chrono::steady_clock::duration elapsed;

    /**
     * @brief 采样时 worker 进程组的内存占用（单位为字节）
     */
    int64_t memory_bytes = 0;
};

/**
 * @brief 资源监控的状态机
 * 不直接操作进程：supervisor 按固定的间隔采样后调用 observe，
 * 若返回 TIMED_OUT 或 MEMORY_EXCEEDED 则由 supervisor 强制终止 worker。
 *
 * 同一次采样中时间与内存同时超限时，只有时间阈值在更早的采样中被越过才判定为
 * TIMED_OUT，否则判定为 MEMORY_EXCEEDED。
 */
struct resource_monitor {
    resource_monitor(std::chrono::steady_clock::duration time_limit, int64_t memory_limit_bytes);

    /**
     * @brief 处理一次采样
     * 只有 RUNNING 状态下的采样会被处理，之后的采样只更新峰值内存。
     * @return 处理后的状态
     */
    run_state observe(const resource_sample &sample);

    /**
     * @brief worker 自行退出
     * 已经判定超限的执行不会被改写。
     * @param abnormal 是否异常退出
     * @return 处理后的状态
     */
    run_state worker_exited(bool abnormal);

    /**
     * @brief 内核替 supervisor 执行了限制
     * 比如 worker 因为 RLIMIT_CPU 收到 SIGXCPU，或者被 cgroup 的 OOM killer 杀死
     * @param reason TIMED_OUT 或 MEMORY_EXCEEDED
     * @return 处理后的状态
     */
    run_state limit_enforced(run_state reason);

    /**
     * @brief worker 被回收，进入最终状态
     * outcome() 仍然保留终止前的结论
     */
    void terminate();

    /**
     * @brief 是否需要强制终止 worker
     */
    bool should_kill() const;

    run_state state() const;

    /**
     * @brief 进入 TERMINATED 之前的结论
     */
    run_state outcome() const;

    /**
     * @brief 记录 worker 回收时内核报告的内存峰值
     */
    void record_peak(int64_t memory_bytes);

    int64_t peak_memory() const;

    /**
     * @brief 已处理的采样次数
     */
    std::size_t samples() const;

private:
    std::chrono::steady_clock::duration time_limit_;
    int64_t memory_limit_;
    run_state state_ = run_state::RUNNING;
    run_state outcome_ = run_state::RUNNING;
    std::size_t samples_ = 0;
    std::optional<std::size_t> time_crossed_at;
    std::optional<std::size_t> memory_crossed_at;
    int64_t peak = 0;
};

}  // namespace codebox
