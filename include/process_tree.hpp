#pragma once

#include <sys/types.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codebox {

/**
 * @brief /proc/<pid>/stat 中我们关心的字段
 */
struct proc_stat {
    pid_t pid = 0;
    char state = '?';
    pid_t ppid = 0;
    pid_t pgrp = 0;
    pid_t session = 0;

    /**
     * @brief 进程的启动时间（单位为 clock tick），与 pid 一起唯一确定一个进程
     */
    uint64_t start_time = 0;

    /**
     * @brief 常驻内存页数
     */
    int64_t rss_pages = 0;

    /**
     * @brief 进程是否已经退出、只是尚未被父进程回收
     */
    bool zombie() const;
};

/**
 * @brief 解析 /proc/<pid>/stat 的一行内容
 * 进程名可能包含空格和括号
 * @return 格式不正确时返回 std::nullopt
 */
std::optional<proc_stat> parse_proc_stat(const std::string &line);

/**
 * @brief 读取 proc_root 下所有进程的状态
 * 进程可能在遍历过程中退出，读取失败的进程直接跳过
 */
std::vector<proc_stat> scan_processes(const std::string &proc_root = "/proc");

/**
 * @brief worker 及其所有派生进程
 *
 * 用户代码可以调用 setsid 或 setpgid 离开 worker 的会话和进程组，因此除了进程组和会话之外，
 * 还沿着父进程关系追踪 worker 的所有后代，并记住见过的每一个进程。
 * worker 被设置为 child subreaper，它存活期间所有的孤儿进程都会被 worker 收养，
 * 不会脱离父进程关系。
 *
 * 每个成员通过 (pid, start_time) 标识，pid 被复用后不会误认为成员。
 */
struct process_tree {
    explicit process_tree(pid_t root, std::string proc_root = "/proc");

    /**
     * @brief 扫描一次进程表，记录新出现的成员
     * @return 当前存活的成员（不包括僵尸进程）
     */
    std::vector<proc_stat> refresh();

    /**
     * @brief 杀死所有存活的成员，直到一次扫描中不再发现存活的成员为止
     * 成员可能在扫描与杀死之间 fork，因此需要多轮
     * @return 发送 SIGKILL 的次数
     */
    std::size_t kill_all();

    /**
     * @brief 曾经见过的成员，pid 到启动时间的映射
     */
    const std::map<pid_t, uint64_t> &tracked() const;

    pid_t root() const;

private:
    pid_t root_;
    std::string proc_root;
    std::map<pid_t, uint64_t> tracked_;
};

}  // namespace codebox
