#include <type_traits>

#include "../../events/event_emitter.hpp"
#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace hubsync {
namespace http {

namespace {
constexpr int kPopTimeoutMs = 1000;
constexpr int kKeepaliveTicks = 15;
constexpr size_t kSseQueueSize = 100;
}  // namespace

//=============================================================================
// GET /v0/events (SSE - Server-Sent Events)
//=============================================================================
void HttpServer::handle_get_events(const httplib::Request &req, httplib::Response &res) {
    if (!event_emitter_) {
        send_json(res, StatusCode::UNAVAILABLE,
                  make_error_response(StatusCode::UNAVAILABLE, "Event streaming not enabled"));
        return;
    }

    int current_clients = sse_client_count_.load();
    if (current_clients >= MAX_SSE_CLIENTS) {
        LOG_WARN("[SSE] Client rejected: max clients (" << MAX_SSE_CLIENTS << ") reached");
        send_json(res, StatusCode::UNAVAILABLE, make_error_response(StatusCode::UNAVAILABLE, "Too many SSE clients"));
        return;
    }

    events::EventFilter filter;
    if (req.has_param("device_id")) {
        filter.device_id = req.get_param_value("device_id");
    }
    if (req.has_param("channel")) {
        filter.channel = req.get_param_value("channel");
    }

    std::string client_name = "sse-" + std::to_string(current_clients + 1);
    std::shared_ptr<events::Subscription> subscription(
        event_emitter_->subscribe(filter, kSseQueueSize, client_name).release());

    if (!subscription) {
        LOG_ERROR("[SSE] Failed to create subscription");
        send_json(res, StatusCode::UNAVAILABLE,
                  make_error_response(StatusCode::UNAVAILABLE, "Failed to subscribe to events"));
        return;
    }

    sse_client_count_++;

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");  // Disable nginx buffering

    auto keepalive_counter = std::make_shared<int>(0);

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, subscription, client_name, keepalive_counter](size_t, httplib::DataSink &sink) {
            if (!running_.load()) {
                return false;
            }

            auto event_opt = subscription->pop(kPopTimeoutMs);
            if (event_opt) {
                std::string sse_data = format_sse_event(*event_opt);
                if (!sink.write(sse_data.c_str(), sse_data.size())) {
                    LOG_WARN("[SSE] Write failed for " << client_name);
                    return false;
                }
                *keepalive_counter = 0;
            } else if (++(*keepalive_counter) >= kKeepaliveTicks) {
                std::string keepalive = ": keepalive\n\n";
                if (!sink.write(keepalive.c_str(), keepalive.size())) {
                    LOG_WARN("[SSE] Keep-alive failed for " << client_name);
                    return false;
                }
                *keepalive_counter = 0;
            }

            return true;
        },
        [this](bool) { sse_client_count_--; });
}

std::string HttpServer::format_sse_event(const events::Event &event) {
    std::string result;

    std::visit(
        [&result](auto &&e) {
            using T = std::decay_t<decltype(e)>;

            nlohmann::json data;

            if constexpr (std::is_same_v<T, events::ChannelUpdateEvent>) {
                result = "event: channel_update\n";
                data["device_id"] = e.device_id;
                data["channel"] = e.channel;
                data["value"] = nlohmann::json::parse(e.value_json, nullptr, false);
                if (data["value"].is_discarded()) {
                    data["value"] = nullptr;
                }
                data["source"] = e.source;
            } else if constexpr (std::is_same_v<T, events::SnapshotEvent>) {
                result = "event: snapshot\n";
                data["device_count"] = e.device_count;
                data["reason"] = e.reason;
            } else if constexpr (std::is_same_v<T, events::AvailabilityEvent>) {
                result = "event: availability\n";
                data["available"] = e.available;
            }

            result += "id: " + std::to_string(e.event_id) + "\n";
            data["timestamp_ms"] = e.timestamp_ms;
            result += "data: " + data.dump() + "\n\n";
        },
        event);

    return result;
}

}  // namespace http
}  // namespace hubsync
