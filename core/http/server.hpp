#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "events/event_types.hpp"
#include "runtime/config.hpp"

namespace hubsync {

namespace sync {
class Coordinator;
}
namespace events {
class EventEmitter;
}

namespace http {

/**
 * @brief HTTP server exposing the sync coordinator over REST + SSE
 *
 * An adapter layer: every handler delegates to Coordinator, which is thread-safe.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 */
class HttpServer {
public:
    /**
     * @param config HTTP configuration (bind address, port, CORS, pool size)
     * @param coordinator Sync coordinator serving reads, queries and commands
     * @param event_emitter Event emitter for SSE streaming (nullptr disables /v0/events)
     * @param command_timeout_ms Default timeout for device writes
     * @param runtime_name Instance name reported by /v0/runtime/status
     */
    HttpServer(const runtime::HttpConfig &config, sync::Coordinator &coordinator,
               std::shared_ptr<events::EventEmitter> event_emitter, int command_timeout_ms,
               const std::string &runtime_name = "");

    ~HttpServer();

    // Binds and starts the server thread. Returns false with error on failure.
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

    // "event: <type>\nid: <n>\ndata: <json>\n\n"
    static std::string format_sse_event(const events::Event &event);

private:
    runtime::HttpConfig config_;
    int port_ = 0;
    int command_timeout_ms_;
    std::string runtime_name_;
    std::chrono::steady_clock::time_point start_time_;

    sync::Coordinator &coordinator_;
    std::shared_ptr<events::EventEmitter> event_emitter_;

    // SSE client tracking
    std::atomic<int> sse_client_count_{0};
    static constexpr int MAX_SSE_CLIENTS = 32;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void install_cors();
    void install_error_handlers();
    void setup_routes();

    // Device handlers (handlers/device_handlers.cpp)
    void handle_get_devices(const httplib::Request &req, httplib::Response &res);
    void handle_get_device(const httplib::Request &req, httplib::Response &res);
    void handle_get_device_info(const httplib::Request &req, httplib::Response &res);
    void handle_post_device_query(const httplib::Request &req, httplib::Response &res);

    // Control handlers (handlers/control_handlers.cpp)
    void handle_post_device_state(const httplib::Request &req, httplib::Response &res);
    void handle_post_refresh(const httplib::Request &req, httplib::Response &res);

    // System handlers (handlers/system_handlers.cpp)
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);

    // SSE (handlers/event_handlers.cpp)
    void handle_get_events(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace hubsync
