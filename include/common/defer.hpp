#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = codebox::scoped_guard() + [&]

namespace codebox {

/**
 * @brief 在作用域结束时执行清理函数
 * 配合 defer 宏使用，用于在执行完成（包括抛出异常）后清理 worker 的临时目录等资源。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace codebox
