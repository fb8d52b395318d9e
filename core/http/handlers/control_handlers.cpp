#include "../../logging/logger.hpp"
#include "../../sync/coordinator.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace hubsync {
namespace http {

//=============================================================================
// POST /v0/devices/{id}/state
//=============================================================================
void HttpServer::handle_post_device_state(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_device_id(req, device_id)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
        return;
    }

    nlohmann::json request_json;
    try {
        request_json = nlohmann::json::parse(req.body);
    } catch (const std::exception &e) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what()));
        return;
    }

    hub::DeviceCommand command;
    std::string error;
    if (!decode_state_request(request_json, command, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    int timeout_ms = 0;
    if (!parse_timeout_param(req, timeout_ms, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    auto result = coordinator_.set_device_state(device_id, command, timeout_ms > 0 ? timeout_ms : command_timeout_ms_);
    if (!result.success) {
        StatusCode status = status_from_bridge(result.status_code);
        if (status == StatusCode::OK) {
            status = StatusCode::INTERNAL;
        }

        LOG_ERROR("[HTTP] Command failed: " << result.error_message << " (Code: " << result.status_code
                                            << "), returning " << status_code_to_http(status));
        nlohmann::json response = make_error_response(status, result.error_message);
        if (result.hub_code != 0) {
            response["hub_code"] = result.hub_code;
            response["hub_msg"] = result.hub_msg;
        }
        send_json(res, status, response);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"device_id", device_id},
                               {"idx", command.idx},
                               {"changed", result.changed},
                               {"refresh_requested", result.changed}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/refresh
//=============================================================================
void HttpServer::handle_post_refresh(const httplib::Request &, httplib::Response &res) {
    coordinator_.request_refresh();

    nlohmann::json response = {{"status", make_status(StatusCode::OK, "refresh scheduled")}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace hubsync
