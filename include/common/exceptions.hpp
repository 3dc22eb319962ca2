#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace codebox {

struct codebox_exception : std::exception {
    codebox_exception();
    explicit codebox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const codebox_exception &ex);

    template <typename T>
    codebox_exception operator<<(const T &t) const {
        return codebox_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 比如无法创建 worker 进程、无法创建管道。这类错误与用户代码无关，
 * 会直接抛给调用者，而不是包装成 execution_result。
 */
struct internal_error : public codebox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 请求校验失败时违反的约束
 */
enum class constraint {
    CODE_EMPTY,
    CODE_TOO_LONG,
    CODE_NOT_UTF8,
    TIMEOUT_OUT_OF_RANGE,
    MEMORY_OUT_OF_RANGE,
    INVALID_BINDING,
    BINDINGS_TOO_LARGE,
    INVALID_FIELD
};

const char *get_constraint_name(constraint c);

/**
 * @brief 表示请求不合法
 * 在分配任何执行资源（进程、管道、目录）之前抛出，
 * 因此不合法的请求永远不会到达 worker。
 */
struct validation_error : public codebox_exception {
    validation_error(constraint violated, const std::string &message);

    constraint violated;
};

}  // namespace codebox
