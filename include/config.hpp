#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace codebox {

/**
 * @brief 请求允许的时间限制范围（单位为秒）
 */
const int MIN_TIMEOUT_SECONDS = 1;
const int MAX_TIMEOUT_SECONDS = 300;
const int DEFAULT_TIMEOUT_SECONDS = 30;

/**
 * @brief 请求允许的内存限制范围（单位为 MB）
 */
const int MIN_MEMORY_MB = 64;
const int MAX_MEMORY_MB = 2048;
const int DEFAULT_MEMORY_MB = 512;

/**
 * @brief 用户代码的最大长度（单位为字符）
 */
const std::size_t MAX_CODE_LENGTH = 50000;

/**
 * @brief 输入变量序列化后的最大字节数
 * 必须小于 message::MAX_REQUEST_SIZE 减去代码的最大字节数，否则 worker 收到的请求会被截断
 */
const std::size_t MAX_BINDINGS_SIZE = 16 << 20;

/**
 * @brief worker 可执行文件 codebox-python 的路径
 * @defaultValue 假设 codebox 和 codebox-python 在同一个文件夹
 */
extern std::filesystem::path WORKER_PATH;

/**
 * @brief 用户代码运行的根目录
 * 每次执行都会在 RUN_DIR 下创建一个以 uuid 命名的空目录作为工作目录，
 * 执行结束后删除，避免不同执行之间通过文件共享状态。
 *
 * RUN_DIR
 * ├── 0f8fad5b-d9cb-469f-a165-70867728950e // 一次执行的工作目录
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 资源监控的采样间隔（单位为毫秒）
 * 超时的检测误差不超过一个采样间隔。
 */
extern int POLL_INTERVAL_MS;

/**
 * @brief stdout、stderr 各自最多保留的字节数
 * 超出部分会被丢弃并在末尾追加截断标记。
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief worker 执行报告的最大字节数
 */
extern std::size_t REPORT_LIMIT;

/**
 * @brief 在 max_memory_mb 之上额外允许的虚拟地址空间（单位为 MB）
 * RLIMIT_AS 只是兜底：解释器映射的虚拟内存远多于实际使用的内存，
 * 真正的内存限制由资源监控对常驻内存的采样来保证。
 */
extern int ADDRESS_SPACE_HEADROOM_MB;

/**
 * @brief 用户代码创建文件的大小上限（单位为字节）
 */
extern std::size_t FILE_LIMIT;

/**
 * @brief 用户代码可以同时存在的进程数，0 表示不限制
 * 注意 RLIMIT_NPROC 按用户统计，只有以独立用户运行时才应开启。
 */
extern std::size_t NPROC_LIMIT;

/**
 * @brief 同时运行的 worker 数量上限
 */
extern std::size_t MAX_CONCURRENCY;

/**
 * @brief 是否使用 cgroup 统计内存、清理进程
 * 需要 root 权限以及 cgroup v1 的 memory、cpuacct 控制器。
 */
extern bool USE_CGROUP;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，执行结束后不会删除工作目录，以便手动检查用户代码产生的文件。
 */
extern bool DEBUG;

}  // namespace codebox
