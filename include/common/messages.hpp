#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>

/**
 * 执行引擎（supervisor）与 worker 进程之间的通信协议
 *
 * worker 进程的文件描述符布局：
 * 0: /dev/null
 * 1: 用户代码的 stdout 管道
 * 2: 用户代码的 stderr 管道
 * 3: worker_request 管道，worker 读到 EOF 为止
 * 4: worker_report 管道，worker 写入一个 JSON 文档后退出
 */
namespace codebox::message {

const int REQUEST_FD = 3;
const int REPORT_FD = 4;

/**
 * @brief worker 读取的请求的最大字节数，超出部分丢弃，被截断的请求无法解析
 */
const std::size_t MAX_REQUEST_SIZE = 64 << 20;

/**
 * @brief worker 的退出码
 */
enum exit_codes {
    E_SUCCESS = 0,

    /**
     * @brief worker 自身出错，比如请求格式错误、解释器无法启动
     */
    E_INTERNAL_ERROR = 2
};

/**
 * @brief supervisor 发送给 worker 的执行请求
 */
struct worker_request {
    /**
     * @brief 用户代码
     */
    std::string code;

    /**
     * @brief 合并后的初始变量，必须是 JSON object
     */
    nlohmann::json bindings = nlohmann::json::object();

    /**
     * @brief 是否在执行结束后返回变量快照
     */
    bool capture = false;
};

/**
 * @brief worker 返回给 supervisor 的执行报告
 */
struct worker_report {
    /**
     * @brief 用户代码是否正常执行完成
     */
    bool ok = false;

    /**
     * @brief 失败类型："syntax"、"runtime"、"memory"
     */
    std::string kind;

    /**
     * @brief 用户代码抛出的异常类名，如 "ValueError"
     */
    std::string exception_type;

    /**
     * @brief str(exception)
     */
    std::string message;

    /**
     * @brief 完整的 traceback 文本
     */
    std::string traceback;

    /**
     * @brief 执行结束后的变量快照（仅在请求 capture 时存在）
     */
    std::optional<nlohmann::json> bindings;
};

void to_json(nlohmann::json &j, const worker_request &request);
void from_json(const nlohmann::json &j, worker_request &request);

void to_json(nlohmann::json &j, const worker_report &report);
void from_json(const nlohmann::json &j, worker_report &report);

/**
 * @brief 解析 worker 写回的报告
 * @return 报告格式错误或者被截断时返回 std::nullopt
 */
std::optional<worker_report> parse_worker_report(const std::string &text);

}  // namespace codebox::message
