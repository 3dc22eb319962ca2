#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "common/messages.hpp"
#include "resource_monitor.hpp"
#include "worker.hpp"

namespace codebox {

/**
 * @brief worker 退出后继续读取管道的最长时间
 * worker 的派生进程可能仍持有管道的写端，不能无限等待 EOF。
 */
const std::chrono::milliseconds KILL_DELAY(100);

struct supervisor_options {
    /**
     * @brief 本次执行的唯一标识，用于命名 cgroup 和日志
     */
    std::string run_id;

    worker_options worker;

    std::chrono::steady_clock::duration time_limit;

    int64_t memory_limit_bytes = 0;

    std::chrono::milliseconds poll_interval{50};

    std::size_t output_limit = 0;

    std::size_t report_limit = 0;

    bool use_cgroup = false;
};

/**
 * @brief 一次执行的原始记录，由 supervise 产生，交给 assemble_result 解释
 */
struct run_record {
    /**
     * @brief 资源监控的结论：COMPLETED、TIMED_OUT、MEMORY_EXCEEDED 或 CRASHED
     */
    run_state outcome = run_state::CRASHED;

    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief worker 的执行报告，worker 没有写出报告或报告无法解析时为空
     */
    std::optional<message::worker_report> report;

    /**
     * @brief worker 的退出原因，如 "terminated by signal 9 (Killed)"
     */
    std::string exit_description;

    /**
     * @brief 从启动 worker 到回收 worker 经过的时间（单位为秒）
     */
    double elapsed_seconds = 0;

    /**
     * @brief 内存占用峰值（单位为字节）
     */
    int64_t peak_memory_bytes = 0;
};

/**
 * @brief 启动 worker 执行一个请求，并监控直到 worker 退出或被强制终止
 *
 * 单线程的事件循环，每一轮：
 * 1. 在 poll 中最多等待 min(采样间隔, 剩余时间)，读取 stdout、stderr、报告管道，写入请求；
 * 2. 尝试回收 worker；
 * 3. 若 worker 仍然存活，则采样运行时间和内存交给 resource_monitor，超限时杀死整个进程组。
 *
 * 用户代码的任何失败都体现在 run_record 中，不会抛出异常。
 * @throw internal_error 当无法启动 worker 时
 * @throw std::system_error 当管道、信号等系统调用失败时
 */
run_record supervise(const supervisor_options &opt, const message::worker_request &request);

}  // namespace codebox
