#include "bridge_session.hpp"

#include <chrono>

#include "logging/logger.hpp"

namespace hubsync {
namespace hub {

namespace {
constexpr const char *kProtocolVersion = "v1";
constexpr const char *kClientName = "hubsync-runtime";
constexpr const char *kClientVersion = "0.1.0";
constexpr int kPollSliceMs = 50;
}  // namespace

BridgeSession::BridgeSession(const std::string &session_name, const BridgeConfig &config)
    : config_(config), process_(session_name, config.command, config.args, config.shutdown_timeout_ms) {}

BridgeSession::~BridgeSession() { close(); }

bool BridgeSession::open() {
    close();
    error_.clear();
    last_status_code_ = bridge::v1::Status_Code_CODE_OK;
    next_request_id_ = 1;

    if (!process_.spawn()) {
        return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE, process_.last_error());
    }
    healthy_.store(true, std::memory_order_release);

    bridge::v1::Request request;
    auto *hello = request.mutable_hello();
    hello->set_protocol_version(kProtocolVersion);
    hello->set_client_name(kClientName);
    hello->set_client_version(kClientVersion);

    bridge::v1::Response response;
    if (!call(request, response, config_.hello_timeout_ms)) {
        LOG_ERROR("[" << session_name() << "] Hello handshake failed: " << error_);
        close();
        return false;
    }
    if (!response.has_hello()) {
        close();
        return fail(bridge::v1::Status_Code_CODE_INTERNAL, "Response missing hello field");
    }

    hello_ = response.hello();
    LOG_INFO("[" << session_name() << "] Connected to " << hello_.bridge_name() << " v" << hello_.bridge_version()
                 << (hello_.hub_id().empty() ? "" : " (hub " + hello_.hub_id() + ")"));
    return true;
}

void BridgeSession::close() {
    healthy_.store(false, std::memory_order_release);
    process_.shutdown();
}

bool BridgeSession::call(bridge::v1::Request &request, bridge::v1::Response &response, int timeout_ms) {
    if (!is_healthy()) {
        return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE, "Bridge session not healthy");
    }

    const uint64_t request_id = next_request_id_++;
    request.set_request_id(request_id);

    std::string serialized;
    if (!request.SerializeToString(&serialized)) {
        return fail(bridge::v1::Status_Code_CODE_INTERNAL, "Failed to serialize request");
    }

    if (!process_.client().write_frame(reinterpret_cast<const uint8_t *>(serialized.data()), serialized.size(),
                                       timeout_ms)) {
        healthy_.store(false, std::memory_order_release);
        return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE,
                    "Failed to write request: " + process_.client().last_error());
    }

    const auto start = std::chrono::steady_clock::now();
    while (true) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
        if (elapsed >= timeout_ms) {
            // A late reply would be read as the answer to the next request
            healthy_.store(false, std::memory_order_release);
            return fail(bridge::v1::Status_Code_CODE_DEADLINE_EXCEEDED,
                        "Timeout waiting for response (" + std::to_string(timeout_ms) + "ms)");
        }

        if (!read_response(response, static_cast<int>(timeout_ms - elapsed))) {
            return false;
        }

        // Stream frames (request_id 0) can interleave with a subscribe acknowledgement
        if (response.request_id() == 0 && response.has_state_update()) {
            LOG_DEBUG("[" << session_name() << "] Skipping stream frame while awaiting response " << request_id);
            continue;
        }

        if (response.request_id() != request_id) {
            healthy_.store(false, std::memory_order_release);
            return fail(bridge::v1::Status_Code_CODE_INTERNAL,
                        "Response request_id mismatch (expected " + std::to_string(request_id) + ", got " +
                            std::to_string(response.request_id()) + ")");
        }
        break;
    }

    last_status_code_ = response.status().code();
    if (last_status_code_ != bridge::v1::Status_Code_CODE_OK) {
        error_ = "Bridge returned error: " + response.status().message();
        return false;
    }

    error_.clear();
    return true;
}

bool BridgeSession::next_frame(bridge::v1::Response &response, int wait_ms, bool &received) {
    received = false;
    if (!is_healthy()) {
        return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE, "Bridge session not healthy");
    }

    if (!process_.client().wait_for_data(wait_ms)) {
        if (!process_.client().last_error().empty()) {
            healthy_.store(false, std::memory_order_release);
            return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE, process_.client().last_error());
        }
        if (!process_.is_running()) {
            healthy_.store(false, std::memory_order_release);
            return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE, "Bridge process exited");
        }
        return true;
    }

    if (!read_response(response, config_.timeout_ms)) {
        return false;
    }

    last_status_code_ = response.status().code();
    if (last_status_code_ != bridge::v1::Status_Code_CODE_OK) {
        healthy_.store(false, std::memory_order_release);
        error_ = "Bridge stream error: " + response.status().message();
        return false;
    }

    received = true;
    return true;
}

bool BridgeSession::read_response(bridge::v1::Response &response, int timeout_ms) {
    const auto start = std::chrono::steady_clock::now();

    while (true) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
        if (elapsed >= timeout_ms) {
            healthy_.store(false, std::memory_order_release);
            return fail(bridge::v1::Status_Code_CODE_DEADLINE_EXCEEDED,
                        "Timeout waiting for response (" + std::to_string(timeout_ms) + "ms)");
        }

        const int remaining = static_cast<int>(timeout_ms - elapsed);
        if (process_.client().wait_for_data(remaining > kPollSliceMs ? kPollSliceMs : remaining)) {
            std::vector<uint8_t> frame;
            if (!process_.client().read_frame(frame, remaining)) {
                healthy_.store(false, std::memory_order_release);
                return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE,
                            "Failed to read response: " + process_.client().last_error());
            }
            if (!response.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
                healthy_.store(false, std::memory_order_release);
                return fail(bridge::v1::Status_Code_CODE_INTERNAL, "Failed to parse response protobuf");
            }
            return true;
        }

        if (!process_.client().last_error().empty()) {
            healthy_.store(false, std::memory_order_release);
            return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE,
                        "Failed waiting for response: " + process_.client().last_error());
        }
        if (!process_.is_running()) {
            healthy_.store(false, std::memory_order_release);
            return fail(bridge::v1::Status_Code_CODE_UNAVAILABLE, "Bridge process died while waiting for response");
        }
    }
}

bool BridgeSession::fail(bridge::v1::Status_Code code, const std::string &message) {
    last_status_code_ = code;
    error_ = message;
    return false;
}

}  // namespace hub
}  // namespace hubsync
