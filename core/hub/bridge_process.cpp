#include "bridge_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <thread>

#include "logging/logger.hpp"

namespace hubsync {
namespace hub {

namespace {

// A bridge that dies mid-write must surface as EPIPE, not terminate the runtime
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

BridgeProcess::BridgeProcess(const std::string &session_name, const std::string &executable_path,
                             const std::vector<std::string> &args, int shutdown_timeout_ms)
    : session_name_(session_name),
      executable_path_(executable_path),
      args_(args),
      shutdown_timeout_ms_(shutdown_timeout_ms),
      pid_(-1),
      stdin_write_fd_(-1),
      stdout_read_fd_(-1) {}

BridgeProcess::~BridgeProcess() { shutdown(); }

bool BridgeProcess::spawn() {
    error_.clear();
    if (pid_ > 0) {
        error_ = "Bridge process already spawned (PID=" + std::to_string(pid_) + ")";
        return false;
    }

    LOG_INFO("[" << session_name_ << "] Spawning bridge: " << executable_path_);

    std::error_code ec;
    if (!std::filesystem::exists(executable_path_, ec)) {
        error_ = "Executable not found: " + executable_path_;
        LOG_ERROR("[" << session_name_ << "] " << error_);
        return false;
    }

    ignore_sigpipe_once();

    int stdin_pipe[2];
    int stdout_pipe[2];

    if (pipe(stdin_pipe) < 0) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe(stdout_pipe) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return false;
    }

    // Build argv before fork; only async-signal-safe calls are allowed in the child
    const std::string abs_path = std::filesystem::absolute(executable_path_, ec).string();
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(abs_path.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_ = fork();
    if (pid_ < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        pid_ = -1;
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    if (pid_ == 0) {
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);

        execv(abs_path.c_str(), argv.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    stdin_write_fd_ = stdin_pipe[1];
    stdout_read_fd_ = stdout_pipe[0];
    fcntl(stdin_write_fd_, F_SETFD, FD_CLOEXEC);
    fcntl(stdout_read_fd_, F_SETFD, FD_CLOEXEC);

    client_.set_handles(stdin_write_fd_, stdout_read_fd_);

    LOG_INFO("[" << session_name_ << "] Bridge spawned (PID=" << pid_ << ")");
    return true;
}

bool BridgeProcess::is_running() const {
    if (pid_ <= 0) {
        return false;
    }
    // waitpid(WNOHANG) would reap; kill(0) only probes. A zombie still counts as
    // running here, but its closed stdout is detected by the framed client.
    return kill(pid_, 0) == 0;
}

void BridgeProcess::shutdown() {
    if (pid_ <= 0) {
        close_pipes();
        return;
    }

    LOG_DEBUG("[" << session_name_ << "] Shutting down bridge (PID=" << pid_ << ")");

    client_.close_stdin();
    stdin_write_fd_ = -1;

    if (wait_for_exit(shutdown_timeout_ms_)) {
        LOG_DEBUG("[" << session_name_ << "] Clean shutdown");
    } else {
        LOG_WARN("[" << session_name_ << "] Bridge did not exit within " << shutdown_timeout_ms_
                     << "ms, forcing termination");
        force_terminate();
        if (!wait_for_exit(500)) {
            LOG_ERROR("[" << session_name_ << "] Failed to reap bridge process " << pid_);
            pid_ = -1;
        }
    }

    close_pipes();
}

bool BridgeProcess::wait_for_exit(int timeout_ms) {
    if (pid_ <= 0) {
        return true;
    }

    const auto start = std::chrono::steady_clock::now();
    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            pid_ = -1;
            return true;
        }
        if (result == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void BridgeProcess::force_terminate() {
    if (pid_ > 0) {
        kill(pid_, SIGKILL);
    }
}

void BridgeProcess::close_pipes() {
    client_.close_stdin();
    client_.close_stdout();
    stdin_write_fd_ = -1;
    stdout_read_fd_ = -1;
}

}  // namespace hub
}  // namespace hubsync
