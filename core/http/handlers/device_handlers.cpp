#include "../../logging/logger.hpp"
#include "../../sync/coordinator.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace hubsync {
namespace http {

//=============================================================================
// GET /v0/devices
//=============================================================================
void HttpServer::handle_get_devices(const httplib::Request &, httplib::Response &res) {
    nlohmann::json devices_json = nlohmann::json::array();
    for (const auto &device : coordinator_.get_devices()) {
        devices_json.push_back(encode_device(device));
    }

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"available", coordinator_.available()}, {"msg", devices_json}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/devices/{id}
//=============================================================================
void HttpServer::handle_get_device(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_device_id(req, device_id)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
        return;
    }

    auto device = coordinator_.get_device(device_id);
    if (!device) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(StatusCode::NOT_FOUND, "Device not found: " + device_id));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"device", encode_device(*device)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/devices/{id}/info
//=============================================================================
void HttpServer::handle_get_device_info(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_device_id(req, device_id)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
        return;
    }

    auto info = coordinator_.get_device_info(device_id);
    if (!info) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(StatusCode::NOT_FOUND, "Device not found: " + device_id));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"info", encode_device_info(*info)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/devices/{id}/query
//=============================================================================
void HttpServer::handle_post_device_query(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_device_id(req, device_id)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
        return;
    }

    int timeout_ms = 0;
    std::string error;
    if (!parse_timeout_param(req, timeout_ms, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    auto result = coordinator_.get_device_data(device_id, timeout_ms);
    if (!result.success) {
        StatusCode status = status_from_bridge(result.status_code);
        if (status == StatusCode::OK) {
            status = StatusCode::INTERNAL;
        }
        send_json(res, status, make_error_response(status, result.error_message));
        return;
    }

    nlohmann::json devices_json = nlohmann::json::array();
    for (const auto &device : result.devices) {
        devices_json.push_back(encode_device(device));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"devices", devices_json}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace hubsync
