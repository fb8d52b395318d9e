#include "framed_stdio_client.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

namespace hubsync {
namespace hub {

namespace {

int64_t elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

FramedStdioClient::FramedStdioClient() : stdin_write_(-1), stdout_read_(-1) {}

void FramedStdioClient::set_handles(int stdin_write, int stdout_read) {
    stdin_write_ = stdin_write;
    stdout_read_ = stdout_read;
    error_.clear();
}

bool FramedStdioClient::write_frame(const uint8_t *data, size_t len, int timeout_ms) {
    error_.clear();
    if (len > kMaxFrameSize) {
        error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    const uint32_t len32 = static_cast<uint32_t>(len);
    uint8_t header[4];
    header[0] = static_cast<uint8_t>(len32 & 0xFF);
    header[1] = static_cast<uint8_t>((len32 >> 8) & 0xFF);
    header[2] = static_cast<uint8_t>((len32 >> 16) & 0xFF);
    header[3] = static_cast<uint8_t>((len32 >> 24) & 0xFF);

    if (!write_exact(header, sizeof(header), timeout_ms)) {
        return false;
    }
    return len == 0 || write_exact(data, len, timeout_ms);
}

bool FramedStdioClient::read_frame(std::vector<uint8_t> &out, int timeout_ms) {
    error_.clear();

    uint8_t header[4];
    if (!read_exact(header, sizeof(header), timeout_ms)) {
        if (error_.empty()) {
            error_ = "EOF reading frame length";
        }
        return false;
    }

    const uint32_t len = static_cast<uint32_t>(header[0]) | (static_cast<uint32_t>(header[1]) << 8) |
                         (static_cast<uint32_t>(header[2]) << 16) | (static_cast<uint32_t>(header[3]) << 24);
    if (len > kMaxFrameSize) {
        error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    out.resize(len);
    if (len > 0 && !read_exact(out.data(), len, timeout_ms)) {
        if (error_.empty()) {
            error_ = "EOF reading frame payload";
        }
        return false;
    }
    return true;
}

bool FramedStdioClient::wait_for_data(int timeout_ms) {
    error_.clear();
    if (stdout_read_ < 0) {
        error_ = "Bridge stdout is closed";
        return false;
    }

    struct pollfd pfd;
    pfd.fd = stdout_read_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = 0;
    do {
        result = poll(&pfd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        error_ = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (result == 0) {
        return false;
    }
    // POLLHUP with pending bytes still reports POLLIN; a bare hangup means EOF
    if ((pfd.revents & POLLIN) != 0) {
        return true;
    }
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
        error_ = "Bridge closed its stdout";
    }
    return false;
}

bool FramedStdioClient::write_exact(const uint8_t *buf, size_t n, int timeout_ms) {
    if (stdin_write_ < 0) {
        error_ = "Bridge stdin is closed";
        return false;
    }

    size_t total = 0;
    const auto start = std::chrono::steady_clock::now();

    while (total < n) {
        if (timeout_ms >= 0 && elapsed_ms_since(start) >= timeout_ms) {
            error_ = "Timeout writing frame";
            return false;
        }

        ssize_t w = write(stdin_write_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            error_ = errno == EPIPE ? "Broken pipe (bridge terminated)" : "Write failed: " + std::string(strerror(errno));
            return false;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool FramedStdioClient::read_exact(uint8_t *buf, size_t n, int timeout_ms) {
    if (stdout_read_ < 0) {
        error_ = "Bridge stdout is closed";
        return false;
    }

    size_t total = 0;
    const auto start = std::chrono::steady_clock::now();

    while (total < n) {
        if (timeout_ms >= 0) {
            const int64_t elapsed = elapsed_ms_since(start);
            if (elapsed >= timeout_ms) {
                error_ = "Timeout reading frame";
                return false;
            }
            if (!wait_for_data(static_cast<int>(timeout_ms - elapsed))) {
                if (error_.empty()) {
                    error_ = "Timeout waiting for data chunk";
                }
                return false;
            }
        }

        ssize_t r = read(stdout_read_, buf + total, n - total);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "Read failed: " + std::string(strerror(errno));
            return false;
        }
        if (r == 0) {
            return false;  // EOF
        }
        total += static_cast<size_t>(r);
    }
    return true;
}

void FramedStdioClient::close_stdin() {
    if (stdin_write_ >= 0) {
        close(stdin_write_);
        stdin_write_ = -1;
    }
}

void FramedStdioClient::close_stdout() {
    if (stdout_read_ >= 0) {
        close(stdout_read_);
        stdout_read_ = -1;
    }
}

}  // namespace hub
}  // namespace hubsync
