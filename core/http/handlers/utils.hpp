#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"
#include "bridge.pb.h"

namespace hubsync {
namespace http {

// Helper: Parse the device id from regex matches
inline bool parse_device_id(const httplib::Request &req, std::string &device_id) {
    if (req.matches.size() >= 2) {
        device_id = req.matches[1].str();
        return !device_id.empty();
    }
    return false;
}

// Helper: Optional ?timeout_ms= query parameter (0 when absent)
inline bool parse_timeout_param(const httplib::Request &req, int &timeout_ms, std::string &error) {
    timeout_ms = 0;
    if (!req.has_param("timeout_ms")) {
        return true;
    }
    try {
        timeout_ms = std::stoi(req.get_param_value("timeout_ms"));
    } catch (const std::exception &) {
        error = "timeout_ms must be an integer";
        return false;
    }
    if (timeout_ms < 0) {
        error = "timeout_ms must be non-negative";
        return false;
    }
    return true;
}

// Helper: Map a bridge status code to the HTTP status model
inline StatusCode status_from_bridge(bridge::v1::Status_Code code) {
    switch (code) {
        case bridge::v1::Status_Code_CODE_OK:
            return StatusCode::OK;
        case bridge::v1::Status_Code_CODE_INVALID_ARGUMENT:
            return StatusCode::INVALID_ARGUMENT;
        case bridge::v1::Status_Code_CODE_NOT_FOUND:
            return StatusCode::NOT_FOUND;
        case bridge::v1::Status_Code_CODE_FAILED_PRECONDITION:
            return StatusCode::FAILED_PRECONDITION;
        case bridge::v1::Status_Code_CODE_UNAVAILABLE:
            return StatusCode::UNAVAILABLE;
        case bridge::v1::Status_Code_CODE_DEADLINE_EXCEEDED:
            return StatusCode::DEADLINE_EXCEEDED;
        default:
            return StatusCode::INTERNAL;
    }
}

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

}  // namespace http
}  // namespace hubsync
