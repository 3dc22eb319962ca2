#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "bindings.hpp"
#include "common/messages.hpp"

namespace codebox {

/**
 * @brief 调用者提交的原始请求，字段尚未校验
 * 字段名与外部 JSON 接口一致：code、timeout、max_memory_mb、globals、locals、capture_locals
 */
struct raw_request {
    std::string code;

    /**
     * @brief 时间限制（单位为秒），未提供时使用默认值
     */
    std::optional<long long> timeout;

    /**
     * @brief 内存限制（单位为 MB），未提供时使用默认值
     */
    std::optional<long long> max_memory_mb;

    /**
     * @brief 模块级变量，null 表示未提供
     */
    nlohmann::json globals;

    /**
     * @brief 局部变量，null 表示未提供
     */
    nlohmann::json locals;

    bool capture_locals = false;
};

/**
 * @brief 已经通过校验的执行请求
 * 只能由 validate_request 构造，构造后不再修改，且只会被一个 worker 消费一次。
 */
struct execution_request {
    std::string code;

    int timeout_seconds = 0;

    int max_memory_mb = 0;

    binding_store input_bindings;

    bool capture_bindings = false;

    /**
     * @brief 构造发送给 worker 的消息
     */
    message::worker_request to_worker_request() const;
};

/**
 * @brief 校验请求
 * 纯函数，没有副作用。必须在分配任何执行资源之前调用。
 * @return 补全默认值后的请求
 * @throw validation_error 违反任何一个约束时
 */
execution_request validate_request(const raw_request &raw);

/**
 * @brief 从 JSON 请求体解析原始请求
 * 缺失或为 null 的字段使用默认值。
 * @throw validation_error 当字段类型不符合时
 */
raw_request parse_raw_request(const nlohmann::json &body);

}  // namespace codebox
