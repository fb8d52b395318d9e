#include "device_info.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace hubsync {
namespace state {

const char *const kManufacturer = "LifeSmart";

namespace {

constexpr const char *kNamePlaceholder = "{$EPN}";

std::string trim(const std::string &s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

void append_slug(std::string &out, const std::string &part) {
    for (unsigned char c : part) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            out.push_back('_');
        }
    }
}

}  // namespace

std::string composite_id(const std::string &devtype, const std::string &agt, const std::string &me,
                         const std::string &idx) {
    std::string id;
    id.reserve(devtype.size() + agt.size() + me.size() + idx.size() + 3);
    append_slug(id, devtype);
    id.push_back('_');
    append_slug(id, agt);
    id.push_back('_');
    append_slug(id, me);
    id.push_back('_');
    append_slug(id, idx);
    return id;
}

std::string clean_channel_name(const std::string &raw_name, const std::string &idx) {
    std::string name = raw_name;
    const std::string placeholder(kNamePlaceholder);
    for (auto pos = name.find(placeholder); pos != std::string::npos; pos = name.find(placeholder, pos)) {
        name.erase(pos, placeholder.size());
    }
    name = trim(name);
    return name.empty() ? idx : name;
}

DeviceInfo make_device_info(const bridge::v1::Device &device) {
    DeviceInfo info;
    info.device_id = device.me();
    info.name = device.name();
    info.model = device.devtype();
    info.hub_id = device.agt();
    info.sw_version = device.epver();
    info.manufacturer = kManufacturer;

    // protobuf maps have no stable iteration order
    std::map<std::string, const bridge::v1::Channel *> ordered;
    for (const auto &entry : device.data()) {
        ordered.emplace(entry.first, &entry.second);
    }

    for (const auto &entry : ordered) {
        ChannelInfo channel;
        channel.idx = entry.first;
        const std::string channel_name = clean_channel_name(entry.second->name(), entry.first);
        channel.display_name = device.name().empty() ? channel_name : trim(device.name() + " " + channel_name);
        channel.composite_id = composite_id(device.devtype(), device.agt(), device.me(), entry.first);
        info.channels.push_back(std::move(channel));
    }
    return info;
}

}  // namespace state
}  // namespace hubsync
