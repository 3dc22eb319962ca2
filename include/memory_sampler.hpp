#pragma once

#include <cstdint>

namespace codebox {

struct run_cgroup;
struct process_tree;

/**
 * @brief 统计 worker 及其派生进程的内存占用
 */
struct memory_sampler {
    virtual ~memory_sampler() = default;

    /**
     * @brief 采样一次当前的内存占用
     * @return 单位为字节
     */
    virtual int64_t sample() = 0;
};

/**
 * @brief 通过 /proc 统计 worker 及其所有派生进程的 RSS 之和
 * 派生进程的范围由 process_tree 决定，包括调用 setsid 离开了 worker 会话的进程。
 */
struct process_tree_sampler : public memory_sampler {
    explicit process_tree_sampler(process_tree &tree);

    int64_t sample() override;

private:
    process_tree &tree;
    long page_size;
};

/**
 * @brief 读取 cgroup 的 memory.usage_in_bytes
 */
struct cgroup_sampler : public memory_sampler {
    explicit cgroup_sampler(run_cgroup &cg);

    int64_t sample() override;

private:
    run_cgroup &cg;
};

}  // namespace codebox
