#include <chrono>

#include "../../sync/coordinator.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace hubsync {
namespace http {

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_time_).count();

    const auto last_sync = coordinator_.last_sync_result();
    nlohmann::json last_sync_json = {{"success", last_sync.success}, {"attempts", last_sync.attempts}};
    if (!last_sync.success && !last_sync.error_message.empty()) {
        last_sync_json["error"] = last_sync.error_message;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"name", runtime_name_},
                               {"uptime_seconds", uptime},
                               {"available", coordinator_.available()},
                               {"device_count", coordinator_.device_count()},
                               {"generation", coordinator_.store_generation()},
                               {"polling_interval_ms", coordinator_.polling_config().interval_ms},
                               {"last_sync", last_sync_json},
                               {"push_enabled", coordinator_.push_enabled()},
                               {"push_listener", encode_listener_snapshot(coordinator_.listener_snapshot())}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace hubsync
