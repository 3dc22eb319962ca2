#pragma once

#include <sys/resource.h>
#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include "common/io_utils.hpp"

namespace codebox {

/**
 * @brief 启动 worker 进程所需的参数
 */
struct worker_options {
    /**
     * @brief worker 可执行文件的路径
     */
    std::filesystem::path executable;

    /**
     * @brief worker 的工作目录，必须已经存在
     */
    std::filesystem::path work_dir;

    /**
     * @brief 时间限制（单位为秒），用于设置 RLIMIT_CPU
     */
    int timeout_seconds = 0;

    /**
     * @brief 虚拟地址空间上限（单位为字节），0 表示不限制
     */
    int64_t address_space_bytes = 0;

    /**
     * @brief 文件大小上限（单位为字节），0 表示不限制
     */
    std::size_t file_limit = 0;

    /**
     * @brief 进程数上限，0 表示不限制
     */
    std::size_t nproc_limit = 0;
};

/**
 * @brief worker 退出时的信息
 */
struct worker_exit {
    /**
     * @brief wait4 返回的状态
     */
    int status = 0;

    /**
     * @brief wait4 返回的资源使用情况
     */
    struct rusage usage {};

    bool exited() const;
    int exit_code() const;
    bool signaled() const;
    int term_signal() const;

    /**
     * @brief worker 是否以 0 退出
     */
    bool normal() const;

    /**
     * @brief 内核统计的最大常驻内存（单位为字节）
     */
    int64_t max_rss_bytes() const;

    /**
     * @brief 退出原因，用于日志和错误信息
     */
    std::string describe() const;
};

/**
 * @brief 一个 worker 进程
 *
 * 构造时 fork 并 exec worker 可执行文件，子进程：
 * 1. 调用 setsid，成为新会话和进程组的组长，以便一次性杀死所有派生进程；
 *    并成为 child subreaper，收养用户代码派生的孤儿进程；
 * 2. 清空环境变量，只保留 PATH；
 * 3. 设置 RLIMIT_AS、RLIMIT_CPU、RLIMIT_FSIZE、RLIMIT_CORE 等兜底限制；
 * 4. 切换到独立的工作目录。
 *
 * fork 之后、exec 之前子进程只调用 async-signal-safe 的函数，因为父进程可能是多线程的。
 * exec 失败时子进程通过 close-on-exec 的状态管道通知父进程，构造函数抛出 internal_error。
 *
 * 析构时若 worker 尚未回收，则强制杀死并回收，保证不会留下僵尸进程。
 */
struct worker_process {
    explicit worker_process(const worker_options &opt);
    ~worker_process();

    worker_process(const worker_process &) = delete;
    worker_process &operator=(const worker_process &) = delete;

    pid_t pid() const;

    /**
     * @brief 向 worker 的整个进程组发送 SIGKILL
     * 进程组已经不存在时不视为错误
     */
    void kill_group();

    /**
     * @brief worker 是否已经退出
     * 不回收 worker：僵尸进程仍然占用 pid，因此在回收之前进程组号和会话号不会被其他进程复用，
     * 清理派生进程时不会误杀其他执行中的进程。
     */
    bool exited();

    /**
     * @brief 阻塞直到 worker 退出并回收
     */
    worker_exit reap();

    /**
     * @brief supervisor 持有的管道端
     */
    scoped_fd stdout_fd;
    scoped_fd stderr_fd;
    scoped_fd request_fd;
    scoped_fd report_fd;

private:
    pid_t pid_ = -1;
    bool reaped_ = false;
};

/**
 * @brief 让当前进程成为 child subreaper
 * worker 退出后，它的孤儿进程由执行引擎收养，而不是 init，
 * 执行引擎因此能够找到并清理这些进程。
 */
void become_subreaper();

/**
 * @brief 杀死并回收被执行引擎收养的孤儿进程
 * 执行引擎的子进程中除了存活的 worker 以外都是孤儿。worker 存活期间会收养自己的孤儿，
 * 因此这里只会清理 worker 已经退出的执行留下的进程，不会影响正在执行的用户代码。
 * @return 清理的进程数
 */
std::size_t reap_adopted_orphans();

}  // namespace codebox
