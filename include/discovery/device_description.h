#pragma once

#include <optional>
#include <string>

namespace discovery {

struct DeviceDescription {
    std::string friendlyName;
    std::string manufacturer;
    std::string modelName;
    std::string udn;
    std::string deviceType;
    std::string avTransportControlUrl;  // absolute
};

// Parses a UPnP device description document. Returns nullopt (with error set)
// when the document has no AVTransport service with a controlURL.
std::optional<DeviceDescription> parseDeviceDescription(const std::string& xml,
                                                        const std::string& location,
                                                        std::string& error);

}  // namespace discovery
