#pragma once

#include <filesystem>
#include <string>

namespace codebox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 统计 UTF-8 字符串中的字符（码点）个数
 * 调用前需确保字符串是合法的 UTF-8
 */
size_t utf8_length(const std::string &string);

/**
 * @brief 找到不超过 pos 的最近的 UTF-8 字符边界
 * 截断输出时使用，避免把一个多字节字符截成两半
 */
size_t utf8_floor_boundary(const std::string &string, size_t pos);

/**
 * @brief 字符串是否只由空白字符组成，空白字符的范围与 Python 的 str.isspace 相同
 * 调用前需确保字符串是合法的 UTF-8，空字符串返回 true
 */
bool utf8_is_blank(const std::string &string);

/**
 * @brief 管理一个文件描述符，析构时关闭
 */
struct scoped_fd {
    scoped_fd();
    explicit scoped_fd(int fd);
    scoped_fd(scoped_fd &&);
    scoped_fd(const scoped_fd &) = delete;
    ~scoped_fd();

    scoped_fd &operator=(scoped_fd &&);
    scoped_fd &operator=(const scoped_fd &) = delete;

    int get() const;

    /**
     * @brief 关闭文件描述符
     * @throw std::system_error 当 close 失败时
     */
    void close();

    explicit operator bool() const;

private:
    int fd;
};

/**
 * @brief 创建一对 close-on-exec 的管道
 * 并发执行时其他线程 fork 出的 worker 不会继承这些管道。
 * @param read_end 读端
 * @param write_end 写端
 */
void make_pipe(scoped_fd &read_end, scoped_fd &write_end);

/**
 * @brief 将文件描述符设置为非阻塞模式
 */
void set_nonblocking(int fd);

/**
 * @brief 阻塞地读取文件描述符直到 EOF
 * @param limit 最多保留的字节数，超出的部分读出后丢弃
 */
std::string read_all(int fd, size_t limit);

/**
 * @brief 阻塞地将全部数据写入文件描述符
 * @throw std::system_error 当写入失败时
 */
void write_all(int fd, const std::string &data);

}  // namespace codebox
