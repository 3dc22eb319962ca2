#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace codebox {

struct admission_gate;

/**
 * @brief 一个运行名额，析构时归还
 */
struct admission_permit {
    admission_permit(admission_permit &&other) noexcept;
    admission_permit(const admission_permit &) = delete;
    ~admission_permit();

    admission_permit &operator=(admission_permit &&) = delete;
    admission_permit &operator=(const admission_permit &) = delete;

private:
    friend struct admission_gate;
    explicit admission_permit(admission_gate *gate);

    admission_gate *gate;
};

/**
 * @brief 限制同时运行的 worker 数量的计数信号量
 * 由 executor 持有并显式传递，不是全局单例。
 * 每个 worker 都有时间限制，因此 acquire 的等待时间是有界的。
 */
struct admission_gate {
    explicit admission_gate(std::size_t capacity);

    /**
     * @brief 获取一个运行名额，没有空闲名额时阻塞等待
     */
    admission_permit acquire();

    /**
     * @brief 尝试获取一个运行名额
     * @return 没有空闲名额时返回 std::nullopt
     */
    std::optional<admission_permit> try_acquire();

    /**
     * @brief 正在使用的名额数
     */
    std::size_t in_use() const;

    std::size_t capacity() const;

    /**
     * @brief 是否没有空闲名额
     */
    bool saturated() const;

private:
    friend struct admission_permit;
    void release();

    const std::size_t capacity_;
    std::size_t used = 0;
    mutable std::mutex mut;
    std::condition_variable cv;
};

}  // namespace codebox
