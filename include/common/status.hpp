#pragma once

namespace codebox {

/**
 * @brief 表示一次执行失败的原因
 * 只有 VALIDATION_ERROR 会以异常的形式抛出，其余的都作为
 * execution_result 的一部分正常返回给调用者。
 */
enum class error_kind {
    /**
     * @brief 请求不合法
     * 不会创建 worker，校验时立即抛出 validation_error。
     */
    VALIDATION_ERROR = 0,

    /**
     * @brief 用户代码在运行时抛出了异常
     * error_message 中保存完整的 traceback。
     */
    SNIPPET_RUNTIME_ERROR = 1,

    /**
     * @brief 用户代码无法通过语法分析
     * 在执行任何代码之前发生。
     */
    SNIPPET_SYNTAX_ERROR = 2,

    /**
     * @brief 运行时间超过 timeout_seconds，被强制终止
     */
    TIMEOUT = 3,

    /**
     * @brief 内存超过 max_memory_mb
     * 包括被监控器强制终止，以及用户代码因为分配失败抛出 MemoryError 的情况。
     */
    MEMORY_LIMIT_EXCEEDED = 4,

    /**
     * @brief worker 进程异常退出
     * 比如被信号杀死、没有返回执行报告，与用户代码本身的逻辑无关。
     */
    WORKER_CRASHED = 5
};

/**
 * @brief 错误类型对外展示的名称，如 "Timeout"
 */
const char *get_display_message(error_kind kind);

}  // namespace codebox
