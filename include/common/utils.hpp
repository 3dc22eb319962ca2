#pragma once

#include <chrono>
#include <string>

namespace codebox {

bool is_number(const std::string &s);

/**
 * @brief 计时器
 * 使用单调时钟，保证一次执行中的输出捕获、资源采样、终止决策都基于同一个时钟。
 */
struct elapsed_time {
    using clock = std::chrono::steady_clock;

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(clock::now() - start);
    }

    /**
     * @brief 经过的秒数
     */
    double seconds() const;

private:
    clock::time_point start;
};

}  // namespace codebox
