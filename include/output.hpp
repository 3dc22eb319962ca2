#pragma once

#include <cstddef>
#include <string>

namespace codebox {

/**
 * @brief 有上限的输出缓冲区
 * 超过上限的数据会被读出并丢弃，但仍然统计字节数，
 * 以便在截断时给出明确的截断标记，而不是静默地丢掉输出。
 */
struct stream_buffer {
    explicit stream_buffer(std::size_t limit);

    void append(const char *data, std::size_t size);

    /**
     * @brief 是否发生了截断
     */
    bool truncated() const;

    /**
     * @brief worker 实际写出的总字节数
     */
    std::size_t bytes_read() const;

    /**
     * @brief 保留下来的字节数
     */
    std::size_t bytes_kept() const;

    /**
     * @brief 返回保留的内容
     * 若发生了截断，内容会退回到 UTF-8 字符边界，并在末尾追加截断标记
     */
    std::string str() const;

private:
    std::size_t limit;
    std::size_t total = 0;
    std::string data;
};

/**
 * @brief 生成截断标记
 */
std::string truncation_marker(std::size_t omitted);

/**
 * @brief 输出捕获
 * 持续读取 worker 的 stdout、stderr 管道，保证 worker 被强制终止前输出的内容不会丢失。
 */
struct output_capturer {
    explicit output_capturer(std::size_t limit);

    stream_buffer out;
    stream_buffer err;

    /**
     * @brief 读取非阻塞管道中当前可读的所有数据
     * @param fd 管道读端，必须为非阻塞模式
     * @param buf 存放数据的缓冲区
     * @return 读到 EOF 时返回 false
     * @throw std::system_error 当读取失败时
     */
    static bool drain(int fd, stream_buffer &buf);
};

}  // namespace codebox
