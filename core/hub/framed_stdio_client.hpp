#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hubsync {
namespace hub {

// Maximum frame size: 1 MiB. A full device enumeration of a large hub stays well below this.
constexpr uint32_t kMaxFrameSize = 1024u * 1024u;

// FramedStdioClient exchanges length-prefixed frames with a bridge child process
// over its stdin/stdout. Frame layout: uint32_le length + payload bytes.
// The descriptors are owned by BridgeProcess; this class never closes them unless asked.
class FramedStdioClient {
public:
    FramedStdioClient();
    ~FramedStdioClient() = default;

    FramedStdioClient(const FramedStdioClient &) = delete;
    FramedStdioClient &operator=(const FramedStdioClient &) = delete;

    // stdin_write / stdout_read are from the parent's point of view
    void set_handles(int stdin_write, int stdout_read);

    // timeout_ms < 0 blocks without limit
    bool write_frame(const uint8_t *data, size_t len, int timeout_ms = -1);
    bool read_frame(std::vector<uint8_t> &out, int timeout_ms = -1);

    // true if stdout has data; false on timeout (error_ empty) or failure (error_ set)
    bool wait_for_data(int timeout_ms);

    // Signals EOF to the bridge
    void close_stdin();
    void close_stdout();

    bool is_open() const { return stdin_write_ >= 0 && stdout_read_ >= 0; }
    const std::string &last_error() const { return error_; }

private:
    int stdin_write_;
    int stdout_read_;
    std::string error_;

    bool read_exact(uint8_t *buf, size_t n, int timeout_ms);
    bool write_exact(const uint8_t *buf, size_t n, int timeout_ms);
};

}  // namespace hub
}  // namespace hubsync
