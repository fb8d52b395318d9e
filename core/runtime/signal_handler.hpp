#pragma once

#include <atomic>

namespace hubsync {
namespace runtime {

// Converts SIGINT/SIGTERM into a flag the main loop polls
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Test hook
    static void reset() { shutdown_requested_.store(false); }

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace hubsync
