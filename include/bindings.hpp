#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace codebox {

/**
 * @brief 变量绑定
 * 保存传入用户代码执行上下文的具名变量，以及执行后捕获的变量。
 *
 * 调用者可以同时提供两组变量：模块级变量（globals）与局部变量（locals），
 * 执行时两组变量合并成同一个上下文，名字冲突时局部变量优先。
 * 变量值为任意 JSON 值。
 */
struct binding_store {
    /**
     * @brief 设置模块级变量
     * @throw validation_error 当变量名不合法时
     */
    void set_module(const std::string &name, nlohmann::json value);

    /**
     * @brief 设置局部变量
     * @throw validation_error 当变量名不合法时
     */
    void set_local(const std::string &name, nlohmann::json value);

    const nlohmann::json &module_bindings() const;

    const nlohmann::json &local_bindings() const;

    /**
     * @brief 合并两组变量得到执行上下文的初始状态
     * @return JSON object，局部变量覆盖同名的模块级变量
     */
    nlohmann::json merged() const;

    bool empty() const;

    /**
     * @brief 从请求的 globals、locals 字段构造
     * 两个参数都可以为 null，表示没有提供。
     * @throw validation_error 当字段不是 object 或者变量名不合法时
     */
    static binding_store from_json(const nlohmann::json &globals, const nlohmann::json &locals);

    /**
     * @brief 变量名是否允许作为输入
     * 不允许空名字、包含 NUL 的名字和以 "__" 开头的名字（会覆盖解释器的内部变量，如 __builtins__）
     */
    static bool is_valid_name(const std::string &name);

    /**
     * @brief 过滤 worker 返回的变量快照
     * 去掉以 "__" 开头的内部变量。
     * @return JSON object；快照不是 object 时返回空 object
     */
    static nlohmann::json filter_captured(const nlohmann::json &snapshot);

private:
    nlohmann::json module = nlohmann::json::object();
    nlohmann::json local = nlohmann::json::object();
};

}  // namespace codebox
