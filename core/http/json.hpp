#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "bridge.pb.h"
#include "hub/i_hub_client.hpp"
#include "state/device_info.hpp"
#include "sync/push_listener.hpp"

namespace hubsync {
namespace http {

/**
 * @brief JSON encoding of hub data
 *
 * Channel values are opaque: google.protobuf.Value maps one-to-one onto JSON
 * (null, number, string, bool, object, array). Integral numbers are emitted as
 * JSON integers so hub values like 0/1 round-trip unchanged.
 */
nlohmann::json encode_value(const google::protobuf::Value &value);
nlohmann::json encode_channel(const bridge::v1::Channel &channel);
nlohmann::json encode_device(const bridge::v1::Device &device);
nlohmann::json encode_device_info(const state::DeviceInfo &info);
nlohmann::json encode_listener_snapshot(const sync::PushListener::Snapshot &snapshot);

// Decode functions for incoming requests
bool decode_value(const nlohmann::json &json, google::protobuf::Value &value, std::string &error);

// {"idx": "L1", "val": 1, "type": "0x81"} ("type" optional)
bool decode_state_request(const nlohmann::json &json, hub::DeviceCommand &command, std::string &error);

}  // namespace http
}  // namespace hubsync
