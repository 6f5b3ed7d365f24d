#include "discovery/configured_device.h"

#include "discovery/ssdp.h"

#include <utility>

namespace discovery {
namespace {

// "host" or "host:port"
void splitHostPort(const std::string& value, std::string& host, uint16_t& port) {
    host = value;
    port = 0;
    auto colon = value.rfind(':');
    if (colon == std::string::npos || colon + 1 >= value.size()) {
        return;
    }
    std::string portText = value.substr(colon + 1);
    for (char c : portText) {
        if (c < '0' || c > '9') {
            return;
        }
    }
    if (portText.size() > 5) {
        return;
    }
    int parsed = std::stoi(portText);
    if (parsed <= 0 || parsed > 65535) {
        return;
    }
    host = value.substr(0, colon);
    port = static_cast<uint16_t>(parsed);
}

}  // namespace

bool deviceFromConfig(const DeviceConfigEntry& entry, devices::Device& out, std::string& error) {
    auto protocol = devices::parseProtocolKind(entry.type);
    if (!protocol) {
        error = "unknown device type '" + entry.type + "'";
        return false;
    }

    devices::Device device;
    device.protocol = *protocol;
    device.friendlyName = entry.deviceName;
    device.discoveryMethod = entry.discoveryMethod.empty() ? "config" : entry.discoveryMethod;
    device.pinned = true;
    device.group = entry.group;
    device.zone = entry.zone;

    if (*protocol == devices::ProtocolKind::Dlna) {
        auto url = parseHttpUrl(entry.actionUrl);
        if (!url) {
            error = "invalid action_url '" + entry.actionUrl + "'";
            return false;
        }
        device.controlUrl = entry.actionUrl;
        device.port = url->port;
        uint16_t hostPort = 0;
        splitHostPort(entry.hostname, device.hostname, hostPort);
        if (device.hostname.empty()) {
            device.hostname = url->host;
        }
    } else {
        splitHostPort(entry.hostname, device.hostname, device.port);
    }

    if (device.hostname.empty()) {
        error = "missing hostname";
        return false;
    }
    device.id = device.hostname;
    if (device.friendlyName.empty()) {
        device.friendlyName = device.hostname;
    }

    out = std::move(device);
    return true;
}

}  // namespace discovery
