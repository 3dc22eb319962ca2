#pragma once

#include <string>
#include "request.hpp"
#include "result.hpp"

namespace codebox {

/**
 * @brief 执行监控行为
 * 所有方法默认什么也不做，实现可以只关心其中一部分。
 * 监控抛出的异常会被 executor 捕获并记录，不会影响执行结果。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报一个请求已经通过校验并获得运行名额，即将启动 worker
     * @param run_id 本次执行的唯一标识
     * @param request 已校验的请求
     */
    virtual void start_execution(const std::string &run_id, const execution_request &request);

    /**
     * @brief 监控上报一次执行已经结束
     * @param run_id 本次执行的唯一标识
     * @param request 已校验的请求
     * @param result 执行结果
     */
    virtual void end_execution(const std::string &run_id, const execution_request &request, const execution_result &result);

    /**
     * @brief 监控上报执行引擎的内部错误或拒绝的请求
     * @param message 错误信息
     */
    virtual void report_error(const std::string &message);
};

}  // namespace codebox
