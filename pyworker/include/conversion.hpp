#pragma once

#include <nlohmann/json.hpp>
#include "python.hpp"

namespace codebox::python {

/**
 * @brief 变量快照的最大嵌套深度，更深的值用 repr 表示
 */
const int MAX_DEPTH = 32;

/**
 * @brief 将 JSON 转换为 Python 对象
 * null→None, bool→bool, 整数→int, 浮点数→float, 字符串→str, 数组→list, 对象→dict
 * @throw python_error 当创建对象失败时
 */
py_ref from_json(const nlohmann::json &value);

/**
 * @brief 将 Python 对象转换为 JSON
 * 不能用 JSON 表示的值（超出 64 位的整数、非有限浮点数、其他类型的对象）用 repr 表示。
 * dict 的键会被转换为字符串。
 * @param depth 当前的嵌套深度
 */
nlohmann::json to_json(PyObject *obj, int depth = 0);

/**
 * @brief 是否需要出现在变量快照中
 * 跳过以 __ 开头的名字、模块、类、函数以及其他可调用对象
 */
bool is_capturable(const std::string &name, PyObject *value);

/**
 * @brief 生成命名空间的变量快照
 * @param dict 用户代码执行时使用的命名空间
 */
nlohmann::json snapshot(PyObject *dict);

}  // namespace codebox::python
