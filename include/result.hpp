#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "request.hpp"
#include "supervisor.hpp"

namespace codebox {

/**
 * @brief 一次执行的最终结果，每个通过校验的请求恰好产生一个
 * 用户代码的任何失败都表示为 success = false 的结果，而不是异常。
 */
struct execution_result {
    bool success = false;

    /**
     * @brief 捕获的标准输出，没有输出时为空字符串
     * 不能命名为 stdout，stdout 是 <cstdio> 中的宏
     */
    std::string stdout_data;

    std::string stderr_data;

    /**
     * @brief 失败类型，成功时为空
     */
    std::optional<error_kind> error;

    /**
     * @brief 失败原因，成功时为空。用户代码抛出异常时为完整的 traceback
     */
    std::optional<std::string> error_message;

    /**
     * @brief 用户代码抛出的异常类名，如 "ValueError"
     */
    std::optional<std::string> exception_type;

    /**
     * @brief 执行时间（单位为秒），包含解释器的启动时间
     */
    double execution_time = 0;

    /**
     * @brief 内存占用峰值（单位为 MB）
     */
    double memory_used_mb = 0;

    /**
     * @brief 执行结束后的变量快照
     * 只有请求了 capture_bindings 且 worker 自行正常结束时才存在
     */
    std::optional<nlohmann::json> captured_bindings;

    /**
     * @brief 被截断的输出流："stdout"、"stderr"
     */
    std::vector<std::string> output_truncated;
};

/**
 * @brief 根据资源监控的结论和 worker 的报告生成执行结果
 * @param request 已校验的请求，提供超时、内存限制等错误信息中的参数
 * @param record supervise 产生的执行记录
 */
execution_result assemble_result(const execution_request &request, const run_record &record);

void to_json(nlohmann::json &j, const execution_result &result);

}  // namespace codebox
