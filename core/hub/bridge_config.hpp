#pragma once

#include <string>
#include <vector>

namespace hubsync {
namespace hub {

struct BridgeConfig {
    std::string command;             // Path to the hub bridge executable
    std::vector<std::string> args;   // Command-line arguments (hub address, credentials file, ...)
    int timeout_ms = 1000;           // Default request timeout when a call does not pass its own
    int hello_timeout_ms = 5000;     // Handshake timeout after spawn
    int command_timeout_ms = 2000;   // Default timeout for device writes
    int shutdown_timeout_ms = 2000;  // Grace period between stdin EOF and SIGKILL
};

}  // namespace hub
}  // namespace hubsync
