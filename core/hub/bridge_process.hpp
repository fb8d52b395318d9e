#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

#include "framed_stdio_client.hpp"

namespace hubsync {
namespace hub {

// BridgeProcess owns one hub bridge child process:
// - spawn with stdin/stdout redirected to pipes (stderr is inherited)
// - liveness check
// - shutdown sequence: EOF -> wait -> SIGKILL
class BridgeProcess {
public:
    BridgeProcess(const std::string &session_name, const std::string &executable_path,
                  const std::vector<std::string> &args = {}, int shutdown_timeout_ms = 2000);
    ~BridgeProcess();

    BridgeProcess(const BridgeProcess &) = delete;
    BridgeProcess &operator=(const BridgeProcess &) = delete;

    bool spawn();
    bool is_running() const;

    // Safe to call repeatedly and on a process that never started
    void shutdown();

    FramedStdioClient &client() { return client_; }

    const std::string &session_name() const { return session_name_; }
    const std::string &last_error() const { return error_; }
    pid_t pid() const { return pid_; }

private:
    std::string session_name_;
    std::string executable_path_;
    std::vector<std::string> args_;
    int shutdown_timeout_ms_;
    std::string error_;

    FramedStdioClient client_;

    pid_t pid_;
    int stdin_write_fd_;
    int stdout_read_fd_;

    bool wait_for_exit(int timeout_ms);
    void force_terminate();
    void close_pipes();
};

}  // namespace hub
}  // namespace hubsync
