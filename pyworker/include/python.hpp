#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include <stdexcept>
#include <string>

namespace codebox::python {

/**
 * @brief 持有一个 PyObject 的强引用，析构时释放
 */
struct py_ref {
    py_ref();

    /**
     * @brief 接管一个新引用（比如 Python C API 返回的 New reference）
     */
    explicit py_ref(PyObject *obj);

    py_ref(py_ref &&other) noexcept;
    py_ref(const py_ref &) = delete;
    ~py_ref();

    py_ref &operator=(py_ref &&other) noexcept;
    py_ref &operator=(const py_ref &) = delete;

    /**
     * @brief 从借用的引用（Borrowed reference）创建，增加引用计数
     */
    static py_ref borrow(PyObject *obj);

    PyObject *get() const;

    /**
     * @brief 放弃所有权，返回新引用
     */
    PyObject *release();

    explicit operator bool() const;

private:
    PyObject *obj;
};

/**
 * @brief worker 自身调用 Python C API 失败
 * 与用户代码抛出的异常无关，这类错误会使 worker 以 E_INTERNAL_ERROR 退出
 */
struct python_error : public std::runtime_error {
    explicit python_error(const std::string &message);
};

/**
 * @brief 检查 Python C API 的返回值，返回空指针时抛出 python_error
 * @param obj Python C API 返回的新引用
 * @param what 调用的描述，用于错误信息
 */
py_ref ensure(PyObject *obj, const char *what);

/**
 * @brief 取出并清除当前的 Python 异常，转换为描述字符串
 */
std::string fetch_error_string();

/**
 * @brief 计算 repr(obj)，失败时返回占位字符串
 */
std::string safe_repr(PyObject *obj);

/**
 * @brief 嵌入的 CPython 解释器
 * 以隔离模式启动：忽略 PYTHON* 环境变量，不加载用户 site-packages，
 * 标准流不缓冲，并固定哈希种子以保证相同代码的输出相同。
 */
struct interpreter {
    /**
     * @param program_name argv[0]
     * @throw python_error 当解释器无法启动时
     */
    explicit interpreter(const char *program_name);
    ~interpreter();

    interpreter(const interpreter &) = delete;
    interpreter &operator=(const interpreter &) = delete;

    /**
     * @brief 关闭解释器，等待非守护线程结束并刷新标准流
     * @return Py_FinalizeEx 的返回值，刷新标准流失败时为 -1
     */
    int finalize();

private:
    bool finalized = false;
};

}  // namespace codebox::python
