#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "events/event_emitter.hpp"
#include "logging/logger.hpp"

namespace hubsync {
namespace http {

namespace {
constexpr time_t kSocketTimeoutSec = 5;
constexpr int kStatusNoContent = 204;
constexpr int kStatusInternal = 500;
constexpr const char *kAllowMethods = "GET, POST, OPTIONS";
constexpr const char *kAllowHeaders = "Content-Type";

// Allowlist entries are exact origins, "*" or one-wildcard patterns such as "http://*.lan"
bool origin_matches(const std::string &pattern, const std::string &origin) {
    const auto star = pattern.find('*');
    if (star == std::string::npos) {
        return pattern == origin;
    }
    const size_t head = star;
    const size_t tail = pattern.size() - star - 1;
    return origin.size() >= head + tail && origin.compare(0, head, pattern, 0, head) == 0 &&
           origin.compare(origin.size() - tail, tail, pattern, star + 1, tail) == 0;
}

// Value for Access-Control-Allow-Origin, empty when the origin is not allowed
std::string allowed_origin(const std::vector<std::string> &allowlist, const std::string &origin) {
    auto it = std::find_if(allowlist.begin(), allowlist.end(),
                           [&origin](const std::string &pattern) { return origin_matches(pattern, origin); });
    if (it == allowlist.end()) {
        return "";
    }
    return *it == "*" ? "*" : origin;
}

void send_error(httplib::Response &res, StatusCode code, const std::string &message) {
    res.set_content(make_error_response(code, message).dump(), "application/json");
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, sync::Coordinator &coordinator,
                       std::shared_ptr<events::EventEmitter> event_emitter, int command_timeout_ms,
                       const std::string &runtime_name)
    : config_(config),
      command_timeout_ms_(command_timeout_ms),
      runtime_name_(runtime_name),
      start_time_(std::chrono::steady_clock::now()),
      coordinator_(coordinator),
      event_emitter_(std::move(event_emitter)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kSocketTimeoutSec, 0);
    server_->set_write_timeout(kSocketTimeoutSec, 0);

    // Each SSE client pins one worker for the life of its stream
    const int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    install_cors();
    install_error_handlers();
    setup_routes();

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() { server_->listen_after_bind(); });

    LOG_INFO("[HTTP] Listening on " << config_.bind << ":" << port_ << " (" << pool_size << " workers)");
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    server_->stop();
    if (server_thread_->joinable()) {
        server_thread_->join();
    }
    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::install_cors() {
    server_->set_post_routing_handler([allowlist = config_.cors_allowed_origins,
                                       credentials = config_.cors_allow_credentials](const httplib::Request &req,
                                                                                     httplib::Response &res) {
        if (!req.has_header("Origin")) {
            return;
        }
        const std::string value = allowed_origin(allowlist, req.get_header_value("Origin"));
        if (value.empty()) {
            return;
        }
        res.set_header("Access-Control-Allow-Origin", value);
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
        if (credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });
}

void HttpServer::install_error_handlers() {
    // Handlers that already produced a JSON body keep it
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }
        switch (res.status) {
            case 404:
                send_error(res, StatusCode::NOT_FOUND, "Route not found: " + req.method + " " + req.path);
                break;
            case 400:
                send_error(res, StatusCode::INVALID_ARGUMENT, "Bad request");
                break;
            default:
                send_error(res, StatusCode::INTERNAL, "Internal server error");
                break;
        }
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string what;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            what = e.what();
        } catch (...) {
            what = "Unknown exception";
        }
        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " threw: " << what);
        res.status = kStatusInternal;
        send_error(res, StatusCode::INTERNAL, what);
    });
}

void HttpServer::setup_routes() {
    using Handler = void (HttpServer::*)(const httplib::Request &, httplib::Response &);
    struct Route {
        bool post;
        const char *pattern;
        Handler handler;
    };

    const Route routes[] = {
        {false, "/v0/devices", &HttpServer::handle_get_devices},
        {false, R"(/v0/devices/([^/]+)/info)", &HttpServer::handle_get_device_info},
        {true, R"(/v0/devices/([^/]+)/query)", &HttpServer::handle_post_device_query},
        {true, R"(/v0/devices/([^/]+)/state)", &HttpServer::handle_post_device_state},
        {false, R"(/v0/devices/([^/]+))", &HttpServer::handle_get_device},
        {true, "/v0/refresh", &HttpServer::handle_post_refresh},
        {false, "/v0/runtime/status", &HttpServer::handle_get_runtime_status},
        {false, "/v0/events", &HttpServer::handle_get_events},
    };

    for (const auto &route : routes) {
        auto bound = [this, handler = route.handler](const httplib::Request &req, httplib::Response &res) {
            (this->*handler)(req, res);
        };
        if (route.post) {
            server_->Post(route.pattern, bound);
        } else {
            server_->Get(route.pattern, bound);
        }
        LOG_DEBUG("[HTTP] Route " << (route.post ? "POST " : "GET  ") << route.pattern);
    }

    // CORS preflight
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
    });
}

}  // namespace http
}  // namespace hubsync
