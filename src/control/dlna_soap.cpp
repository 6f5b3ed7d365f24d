#include "control/dlna_soap.h"

#include "core/daemon_constants.h"
#include "core/xml_text.h"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <sstream>

namespace dlna_soap {
namespace {

constexpr const char* kDlnaProtocolInfo =
    "http-get:*:video/mp4:DLNA.ORG_PN=AVC_MP4_BL_CIF15_AAC_520;DLNA.ORG_OP=01;DLNA.ORG_CI=0;"
    "DLNA.ORG_FLAGS=01500000000000000000000000000000";

bool parseNonNegative(const std::string& text, int& out) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    out = std::stoi(text);
    return true;
}

}  // namespace

std::string buildEnvelope(const std::string& action, const Arguments& args) {
    std::ostringstream oss;
    oss << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        << "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        << "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        << "<s:Body>"
        << "<u:" << action << " xmlns:u=\"" << DaemonConstants::UPNP_AVTRANSPORT_SERVICE << "\">"
        << "<InstanceID>0</InstanceID>";
    for (const auto& [name, value] : args) {
        oss << "<" << name << ">" << xml_text::escape(value) << "</" << name << ">";
    }
    oss << "</u:" << action << ">"
        << "</s:Body>"
        << "</s:Envelope>";
    return oss.str();
}

std::string soapActionHeader(const std::string& action) {
    return std::string("\"") + DaemonConstants::UPNP_AVTRANSPORT_SERVICE + "#" + action + "\"";
}

std::string buildDidlMetadata(const std::string& url, const std::string& title) {
    std::ostringstream oss;
    oss << "<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\" "
        << "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
        << "xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\">"
        << "<item id=\"0\" parentID=\"-1\" restricted=\"1\">"
        << "<dc:title>" << xml_text::escape(title) << "</dc:title>"
        << "<upnp:class>object.item.videoItem</upnp:class>"
        << "<res protocolInfo=\"" << kDlnaProtocolInfo << "\">" << xml_text::escape(url)
        << "</res>"
        << "</item>"
        << "</DIDL-Lite>";
    return oss.str();
}

std::optional<TransportInfo> parseTransportInfo(const std::string& responseBody) {
    auto state = xml_text::findElementText(responseBody, "CurrentTransportState");
    if (!state) {
        return std::nullopt;
    }
    TransportInfo info;
    info.state = parseTransportState(*state);
    info.status = xml_text::findElementText(responseBody, "CurrentTransportStatus").value_or("");
    return info;
}

std::optional<PositionInfo> parsePositionInfo(const std::string& responseBody) {
    auto relTime = xml_text::findElementText(responseBody, "RelTime");
    auto duration = xml_text::findElementText(responseBody, "TrackDuration");
    if (!relTime && !duration) {
        return std::nullopt;
    }
    PositionInfo info;
    info.trackUri = xml_text::findElementText(responseBody, "TrackURI").value_or("");
    if (relTime) {
        info.positionSeconds = parseClockTime(*relTime);
    }
    if (duration) {
        info.durationSeconds = parseClockTime(*duration);
    }
    return info;
}

std::optional<std::string> parseFault(const std::string& responseBody) {
    if (responseBody.find("Fault") == std::string::npos) {
        return std::nullopt;
    }
    if (auto description = xml_text::findElementText(responseBody, "errorDescription")) {
        auto code = xml_text::findElementText(responseBody, "errorCode");
        return code ? *description + " (UPnP " + *code + ")" : *description;
    }
    if (auto faultString = xml_text::findElementText(responseBody, "faultstring")) {
        return *faultString;
    }
    return std::string("SOAP fault");
}

TransportState parseTransportState(const std::string& value) {
    if (value == "PLAYING") {
        return TransportState::Playing;
    }
    if (value == "STOPPED") {
        return TransportState::Stopped;
    }
    if (value == "PAUSED_PLAYBACK" || value == "PAUSED_RECORDING") {
        return TransportState::Paused;
    }
    if (value == "TRANSITIONING") {
        return TransportState::Transitioning;
    }
    if (value == "NO_MEDIA_PRESENT") {
        return TransportState::NoMediaPresent;
    }
    return TransportState::Unknown;
}

const char* transportStateToString(TransportState state) {
    switch (state) {
    case TransportState::Stopped:
        return "STOPPED";
    case TransportState::Playing:
        return "PLAYING";
    case TransportState::Paused:
        return "PAUSED_PLAYBACK";
    case TransportState::Transitioning:
        return "TRANSITIONING";
    case TransportState::NoMediaPresent:
        return "NO_MEDIA_PRESENT";
    case TransportState::Unknown:
    default:
        return "UNKNOWN";
    }
}

std::optional<int> parseClockTime(const std::string& text) {
    std::string value = text;
    auto dot = value.find('.');
    if (dot != std::string::npos) {
        value.erase(dot);
    }

    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    if (parts.empty() || parts.size() > 3) {
        return std::nullopt;
    }

    // Leading field is unbounded up to six digits; the ones after it are minutes or seconds
    constexpr size_t kMaxLeadingDigits = 6;
    if (parts.front().size() > kMaxLeadingDigits) {
        return std::nullopt;
    }
    int64_t total = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        int n = 0;
        if (!parseNonNegative(parts[i], n)) {
            return std::nullopt;
        }
        if (i > 0 && n > 59) {
            return std::nullopt;
        }
        total = total * 60 + n;
    }
    if (total > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(total);
}

std::string formatClockTime(int seconds) {
    if (seconds < 0) {
        seconds = 0;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", seconds / 3600, (seconds % 3600) / 60,
                  seconds % 60);
    return buf;
}

}  // namespace dlna_soap
