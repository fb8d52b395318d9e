#include "json.hpp"

#include <cmath>
#include <cstdint>

namespace hubsync {
namespace http {

namespace {
constexpr int kMaxDecodeDepth = 32;

// 2^53: largest range where every integer is exact in a double
constexpr double kMaxExactInteger = 9007199254740992.0;

bool decode_value_at(const nlohmann::json &json, google::protobuf::Value &value, std::string &error, int depth) {
    if (depth > kMaxDecodeDepth) {
        error = "Value nested too deeply";
        return false;
    }

    if (json.is_null()) {
        value.set_null_value(google::protobuf::NULL_VALUE);
    } else if (json.is_boolean()) {
        value.set_bool_value(json.get<bool>());
    } else if (json.is_number()) {
        value.set_number_value(json.get<double>());
    } else if (json.is_string()) {
        value.set_string_value(json.get<std::string>());
    } else if (json.is_array()) {
        auto *list = value.mutable_list_value();
        for (const auto &item : json) {
            if (!decode_value_at(item, *list->add_values(), error, depth + 1)) {
                return false;
            }
        }
    } else if (json.is_object()) {
        auto *fields = value.mutable_struct_value()->mutable_fields();
        for (auto it = json.begin(); it != json.end(); ++it) {
            if (!decode_value_at(it.value(), (*fields)[it.key()], error, depth + 1)) {
                return false;
            }
        }
    } else {
        error = "Unsupported JSON value";
        return false;
    }
    return true;
}
}  // namespace

nlohmann::json encode_value(const google::protobuf::Value &value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kNumberValue: {
            const double number = value.number_value();
            if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) <= kMaxExactInteger) {
                return static_cast<int64_t>(number);
            }
            if (!std::isfinite(number)) {
                return nullptr;
            }
            return number;
        }
        case google::protobuf::Value::kStringValue:
            return value.string_value();
        case google::protobuf::Value::kBoolValue:
            return value.bool_value();
        case google::protobuf::Value::kStructValue: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto &field : value.struct_value().fields()) {
                object[field.first] = encode_value(field.second);
            }
            return object;
        }
        case google::protobuf::Value::kListValue: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto &item : value.list_value().values()) {
                array.push_back(encode_value(item));
            }
            return array;
        }
        case google::protobuf::Value::kNullValue:
        case google::protobuf::Value::KIND_NOT_SET:
            break;
    }
    return nullptr;
}

nlohmann::json encode_channel(const bridge::v1::Channel &channel) {
    nlohmann::json json = {{"v", encode_value(channel.v())}};
    if (!channel.name().empty()) {
        json["name"] = channel.name();
    }
    if (!channel.type().empty()) {
        json["type"] = channel.type();
    }
    return json;
}

nlohmann::json encode_device(const bridge::v1::Device &device) {
    nlohmann::json data = nlohmann::json::object();
    for (const auto &entry : device.data()) {
        data[entry.first] = encode_channel(entry.second);
    }

    return {{"me", device.me()},         {"devtype", device.devtype()}, {"agt", device.agt()},
            {"name", device.name()},     {"epver", device.epver()},     {"data", data}};
}

nlohmann::json encode_device_info(const state::DeviceInfo &info) {
    nlohmann::json channels = nlohmann::json::array();
    for (const auto &channel : info.channels) {
        channels.push_back(
            {{"idx", channel.idx}, {"name", channel.display_name}, {"composite_id", channel.composite_id}});
    }

    return {{"device_id", info.device_id},   {"name", info.name},
            {"model", info.model},           {"hub_id", info.hub_id},
            {"sw_version", info.sw_version}, {"manufacturer", info.manufacturer},
            {"channels", channels}};
}

nlohmann::json encode_listener_snapshot(const sync::PushListener::Snapshot &snapshot) {
    nlohmann::json json = {{"state", sync::state_to_string(snapshot.state)},
                           {"running", snapshot.running},
                           {"retry_count", snapshot.retry_count},
                           {"max_retries", snapshot.max_retries},
                           {"last_backoff_ms", snapshot.last_backoff_ms},
                           {"reconnect_count", snapshot.reconnect_count},
                           {"events_received", snapshot.events_received},
                           {"events_dropped", snapshot.events_dropped},
                           {"give_up_count", snapshot.give_up_count}};
    if (!snapshot.last_error.empty()) {
        json["last_error"] = snapshot.last_error;
    }
    return json;
}

bool decode_value(const nlohmann::json &json, google::protobuf::Value &value, std::string &error) {
    value.Clear();
    return decode_value_at(json, value, error, 0);
}

bool decode_state_request(const nlohmann::json &json, hub::DeviceCommand &command, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    auto idx_it = json.find("idx");
    if (idx_it == json.end() || !idx_it->is_string() || idx_it->get<std::string>().empty()) {
        error = "Missing or invalid 'idx' (channel key)";
        return false;
    }

    auto val_it = json.find("val");
    if (val_it == json.end()) {
        error = "Missing 'val'";
        return false;
    }

    auto type_it = json.find("type");
    if (type_it != json.end() && !type_it->is_string()) {
        error = "'type' must be a string";
        return false;
    }

    command.idx = idx_it->get<std::string>();
    command.type = type_it != json.end() ? type_it->get<std::string>() : std::string();
    if (!decode_value(*val_it, command.val, error)) {
        error = "Invalid 'val': " + error;
        return false;
    }
    return true;
}

}  // namespace http
}  // namespace hubsync
