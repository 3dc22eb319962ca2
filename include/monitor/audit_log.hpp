#pragma once

#include "monitor/monitor.hpp"

namespace codebox {

/**
 * @brief 通过 glog 记录每一次执行的审计日志
 * 记录执行标识、代码长度、限制、结果、时间和内存，不记录代码内容和输出。
 */
struct audit_log : public monitor {
    void start_execution(const std::string &run_id, const execution_request &request) override;

    void end_execution(const std::string &run_id, const execution_request &request, const execution_result &result) override;

    void report_error(const std::string &message) override;
};

}  // namespace codebox
