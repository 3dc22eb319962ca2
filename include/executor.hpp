#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <vector>
#include "admission.hpp"
#include "monitor/monitor.hpp"
#include "request.hpp"
#include "result.hpp"

namespace codebox {

/**
 * @brief 执行引擎的入口
 * 校验请求、获取运行名额、为每个请求启动一个新的 worker 并组装结果。
 * 可以被多个线程并发调用，同时运行的 worker 数量由 admission_gate 限制。
 */
struct executor {
    /**
     * @param concurrency 同时运行的 worker 数量上限
     */
    explicit executor(std::size_t concurrency);

    /**
     * @brief 注册监控
     * 必须在第一次执行之前注册完成，之后不再修改，因此并发执行时不需要加锁
     */
    void register_monitor(std::unique_ptr<monitor> &&m);

    /**
     * @brief 执行一个 JSON 格式的原始请求
     * @throw validation_error 当请求不合法时，此时不会分配任何执行资源
     * @throw internal_error 当执行引擎自身出错时
     */
    execution_result execute(const nlohmann::json &body);

    /**
     * @brief 校验并执行原始请求
     * @throw validation_error 当请求不合法时，此时不会分配任何执行资源
     * @throw internal_error 当执行引擎自身出错时
     */
    execution_result execute(const raw_request &raw);

    /**
     * @brief 执行已校验的请求
     * 用户代码的任何失败都体现在返回值中
     * @throw internal_error 当执行引擎自身出错时
     */
    execution_result run(const execution_request &request);

    /**
     * @brief 请求允许的时间、内存和代码长度范围
     */
    nlohmann::json limits() const;

    /**
     * @brief 执行引擎当前能否接受新的请求
     */
    nlohmann::json health() const;

    const admission_gate &gate() const;

private:
    void call_monitor(const std::string &run_id, const std::function<void(monitor &)> &callback);

    admission_gate gate_;
    std::vector<std::unique_ptr<monitor>> monitors;
};

}  // namespace codebox
