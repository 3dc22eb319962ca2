#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <sys/types.h>

struct cgroup;
struct cgroup_controller;

namespace codebox {

struct cgroup_exception : public std::exception {
    cgroup_exception(const std::string &cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(const std::string &cgroup_op, int err);
private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 * 这里只使用 memory 资源管控器：对 cgroup 中的任务可用内存做出限制，
 * 并且自动生成任务占用内存资源报告
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, int64_t value);

    int64_t get_value_int64(const std::string &name);

    std::string get_value_string(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放内存以确保没有内存泄漏
 */
struct cgroup_guard {
    /**
     * @brief 构造函数，调用 libcgroup 的创建函数
     * @param cgroup_name cgroup 的内核名称
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 在内核中创建这个 cgroup
     * 这里将 add_controller 函数、add_value 函数添加的数据也写入内核中。
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief 创建一个新的 controller
     * @param name 控制器的名称，如 "memory"
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 从 cgroup 中获得指定的 controller
     * 必须是 add_controller 已添加过的或者根据 get_cgroup 从内核中获得的已有的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * @brief 从内核中读入 cgroup 的所有信息。
     */
    void get_cgroup();

    /**
     * @brief 将指定的进程移入本 cgroup
     * 子进程在 exec 之前不能调用 libcgroup，因此由父进程负责移入
     */
    void attach_task_pid(pid_t pid);

    /**
     * @brief 从内核中删除这个 cgroup。
     * 所有的进程都会被移入上一层的 cgroup。所有的子 cgroup 都会被删除。
     */
    void delete_cgroup();

    static void init();

private:
    struct cgroup *cg;
};

/**
 * @brief 一次执行专用的 memory cgroup
 * 构造时在内核中创建，析构时杀死残留进程并删除。
 * 子进程通过 setsid 逃出进程组后仍然留在 cgroup 中，因此 cgroup 模式下的
 * 内存统计和强制终止都能覆盖所有派生进程。
 */
struct run_cgroup {
    /**
     * @param name cgroup 名称，如 "codebox/run_<uuid>"
     * @param memory_limit_bytes 内核强制的内存上限，超过时由内核 OOM killer 杀死进程
     */
    run_cgroup(std::string name, int64_t memory_limit_bytes);

    ~run_cgroup();

    run_cgroup(const run_cgroup &) = delete;
    run_cgroup &operator=(const run_cgroup &) = delete;

    void attach(pid_t pid);

    /**
     * @brief 向 cgroup 中的所有进程发送 SIGKILL
     */
    void kill_tasks();

    /**
     * @brief 当前的内存占用（memory.usage_in_bytes）
     */
    int64_t memory_usage();

    /**
     * @brief 内存占用峰值（memory.max_usage_in_bytes）
     */
    int64_t max_memory_usage();

    /**
     * @brief 内核 OOM killer 是否杀死过本 cgroup 中的进程
     */
    bool oom_killed();

    const std::string &name() const;

private:
    std::string name_;
};

}  // namespace codebox
