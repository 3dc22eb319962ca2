#pragma once

#include "common/messages.hpp"
#include "python.hpp"

namespace codebox::python {

/**
 * @brief 在新的命名空间中编译并执行用户代码
 * 解释器必须已经初始化。
 *
 * 命名空间同时作为 globals 和 locals，预先放入 __builtins__、__name__ 以及请求中的初始变量。
 * 用户代码抛出的异常不会传播出来，而是记录在返回的报告中：
 * 1. 编译失败（SyntaxError 及其子类）的 kind 为 "syntax"；
 * 2. MemoryError 的 kind 为 "memory"；
 * 3. 其他异常的 kind 为 "runtime"。SystemExit(0) 和 SystemExit(None) 视为正常结束。
 * 未捕获异常的 traceback 会像解释器一样写入 sys.stderr。
 *
 * @throw python_error 当创建命名空间或转换初始变量失败时
 */
message::worker_report run_snippet(const message::worker_request &request);

}  // namespace codebox::python
