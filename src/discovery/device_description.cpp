#include "discovery/device_description.h"

#include "core/daemon_constants.h"
#include "core/xml_text.h"
#include "discovery/ssdp.h"

namespace discovery {

std::optional<DeviceDescription> parseDeviceDescription(const std::string& xml,
                                                        const std::string& location,
                                                        std::string& error) {
    if (xml.find("<root") == std::string::npos && xml.find(":root") == std::string::npos) {
        error = "not a UPnP device description";
        return std::nullopt;
    }

    DeviceDescription desc;
    desc.friendlyName = xml_text::findElementText(xml, "friendlyName").value_or("");
    desc.manufacturer = xml_text::findElementText(xml, "manufacturer").value_or("");
    desc.modelName = xml_text::findElementText(xml, "modelName").value_or("");
    desc.udn = xml_text::findElementText(xml, "UDN").value_or("");
    desc.deviceType = xml_text::findElementText(xml, "deviceType").value_or("");

    // Embedded devices list their services too; the first AVTransport wins
    for (const auto& service : xml_text::findElementBlocks(xml, "service")) {
        auto serviceType = xml_text::findElementText(service, "serviceType");
        if (!serviceType ||
            serviceType->find(DaemonConstants::AVTRANSPORT_MARKER) == std::string::npos) {
            continue;
        }
        auto controlUrl = xml_text::findElementText(service, "controlURL");
        if (!controlUrl || controlUrl->empty()) {
            continue;
        }
        desc.avTransportControlUrl = resolveUrl(location, *controlUrl);
        break;
    }

    if (desc.avTransportControlUrl.empty()) {
        error = "no AVTransport service in description";
        return std::nullopt;
    }
    return desc;
}

}  // namespace discovery
