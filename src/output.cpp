#include "output.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <unistd.h>
#include <algorithm>
#include <system_error>
#include "common/io_utils.hpp"

namespace codebox {
using namespace std;

const int BUF_SIZE = 4096;

stream_buffer::stream_buffer(size_t limit) : limit(limit) {}

void stream_buffer::append(const char *buf, size_t size) {
    total += size;
    if (data.size() < limit)
        data.append(buf, min(size, limit - data.size()));
}

bool stream_buffer::truncated() const {
    return total > data.size();
}

size_t stream_buffer::bytes_read() const {
    return total;
}

size_t stream_buffer::bytes_kept() const {
    return data.size();
}

string stream_buffer::str() const {
    if (!truncated()) return data;
    size_t kept = data.size();
    if (kept > 0) {
        // 截断处可能正好位于一个多字节字符的中间，丢弃不完整的字符
        size_t last = utf8_floor_boundary(data, kept - 1);
        unsigned char lead = data[last];
        size_t width = lead < 0x80 ? 1 : (lead & 0xE0) == 0xC0 ? 2 : (lead & 0xF0) == 0xE0 ? 3 : 4;
        if (last + width > kept) kept = last;
    }
    return data.substr(0, kept) + truncation_marker(total - kept);
}

string truncation_marker(size_t omitted) {
    return fmt::format("\n[output truncated: {} bytes omitted]\n", omitted);
}

output_capturer::output_capturer(size_t limit) : out(limit), err(limit) {}

bool output_capturer::drain(int fd, stream_buffer &buf) {
    char chunk[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, chunk, BUF_SIZE);
        if (nread > 0) {
            buf.append(chunk, nread);
            continue;
        }
        if (nread == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        throw system_error(errno, system_category(), fmt::format("copying data fd {}", fd));
    }
}

}  // namespace codebox
