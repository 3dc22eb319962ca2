#include "common/io_utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <unistd.h>
#include <fstream>
#include <system_error>

namespace codebox {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    if (!fin) throw system_error(errno, generic_category(), fmt::format("unable to open '{}'", path.string()));
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  //U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

size_t utf8_length(const string &string) {
    size_t length = 0;
    for (unsigned char c : string)
        if ((c & 0xC0) != 0x80) ++length;
    return length;
}

size_t utf8_floor_boundary(const string &string, size_t pos) {
    if (pos >= string.size()) return string.size();
    // 跳过后续字节 10bbbbbb，回到字符的首字节
    while (pos > 0 && ((unsigned char)string[pos] & 0xC0) == 0x80) --pos;
    return pos;
}

static bool is_space_code_point(char32_t c) {
    switch (c) {
        case 0x20:
        case 0x85:
        case 0xA0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            // \t \n \v \f \r、信息分隔符 U+001C..U+001F、U+2000..U+200A
            return (0x09 <= c && c <= 0x0D) || (0x1C <= c && c <= 0x1F) || (0x2000 <= c && c <= 0x200A);
    }
}

bool utf8_is_blank(const string &string) {
    for (size_t i = 0; i < string.size();) {
        unsigned char c = string[i];
        char32_t code;
        size_t n;
        if (c < 0x80) code = c, n = 0;
        else if ((c & 0xE0) == 0xC0) code = c & 0x1F, n = 1;
        else if ((c & 0xF0) == 0xE0) code = c & 0x0F, n = 2;
        else code = c & 0x07, n = 3;
        for (size_t j = 1; j <= n && i + j < string.size(); ++j)
            code = (code << 6) | ((unsigned char)string[i + j] & 0x3F);
        if (!is_space_code_point(code)) return false;
        i += n + 1;
    }
    return true;
}

scoped_fd::scoped_fd() : fd(-1) {}

scoped_fd::scoped_fd(int fd) : fd(fd) {}

scoped_fd::scoped_fd(scoped_fd &&other) : fd(other.fd) {
    other.fd = -1;
}

scoped_fd::~scoped_fd() {
    if (fd >= 0) ::close(fd);
}

scoped_fd &scoped_fd::operator=(scoped_fd &&other) {
    if (this != &other) {
        if (fd >= 0) ::close(fd);
        fd = other.fd;
        other.fd = -1;
    }
    return *this;
}

int scoped_fd::get() const {
    return fd;
}

void scoped_fd::close() {
    if (fd < 0) return;
    int old = fd;
    fd = -1;
    if (::close(old) != 0)
        throw system_error(errno, system_category(), fmt::format("closing fd {}", old));
}

scoped_fd::operator bool() const {
    return fd >= 0;
}

void make_pipe(scoped_fd &read_end, scoped_fd &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating pipe");
    read_end = scoped_fd(fds[0]);
    write_end = scoped_fd(fds[1]);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1)
        throw system_error(errno, system_category(), "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw system_error(errno, system_category(), "fcntl, setting flags");
}

string read_all(int fd, size_t limit) {
    string result;
    char buf[4096];
    while (true) {
        ssize_t nread = read(fd, buf, sizeof(buf));
        if (nread == -1) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), fmt::format("reading fd {}", fd));
        }
        if (nread == 0) break;
        if (result.size() < limit)
            result.append(buf, min((size_t)nread, limit - result.size()));
    }
    return result;
}

void write_all(int fd, const string &data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n == -1) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), fmt::format("writing fd {}", fd));
        }
        written += n;
    }
}

}  // namespace codebox
