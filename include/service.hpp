#pragma once

#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "executor.hpp"

namespace codebox {

/**
 * @brief 基于行的 JSON 协议服务
 *
 * 每行一个请求：{"id": any, "op": "execute"|"limits"|"health", ...请求字段}，
 * op 缺省为 execute。每个请求对应一行响应：
 * {"id": ..., "success": true, "data": {...}} 或
 * {"id": ..., "success": false, "error": {"type": ..., "message": ..., "constraint": ...}}
 *
 * execute 请求交给服务线程执行，因此响应可能乱序，调用者需要根据 id 对应。
 * limits、health 请求直接在读取线程中回答。
 */
struct service {
    /**
     * @param exec 执行引擎
     * @param in 请求流
     * @param out 响应流
     * @param threads 服务线程数
     */
    service(executor &exec, std::istream &in, std::ostream &out, std::size_t threads);

    /**
     * @brief 读取并处理请求直到输入流结束，等待所有已接受的请求处理完成后返回
     */
    void serve();

    /**
     * @brief 同步处理一个请求
     * @return 响应
     */
    nlohmann::json handle(const nlohmann::json &message);

    static nlohmann::json success_response(const nlohmann::json &id, nlohmann::json data);

    static nlohmann::json error_response(const nlohmann::json &id, const std::string &type, const std::string &message,
                                         const std::optional<std::string> &constraint = std::nullopt);

private:
    void respond(const nlohmann::json &response);

    executor &exec;
    std::istream &in;
    std::ostream &out;
    std::size_t threads;
    std::mutex out_mutex;
};

}  // namespace codebox
