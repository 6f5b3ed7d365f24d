#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

// SOAP framing for the UPnP AVTransport:1 service
namespace dlna_soap {

using Arguments = std::vector<std::pair<std::string, std::string>>;

enum class TransportState { Stopped, Playing, Paused, Transitioning, NoMediaPresent, Unknown };

struct TransportInfo {
    TransportState state = TransportState::Unknown;
    std::string status;  // CurrentTransportStatus, e.g. "OK" / "ERROR_OCCURRED"
};

struct PositionInfo {
    std::string trackUri;
    std::optional<int> positionSeconds;
    std::optional<int> durationSeconds;
};

// Envelope for action with InstanceID=0 followed by args, values XML-escaped.
std::string buildEnvelope(const std::string& action, const Arguments& args);

// Value of the SOAPAction header, quotes included.
std::string soapActionHeader(const std::string& action);

// DIDL-Lite item describing the stream, unescaped (buildEnvelope escapes it).
std::string buildDidlMetadata(const std::string& url, const std::string& title);

std::optional<TransportInfo> parseTransportInfo(const std::string& responseBody);
std::optional<PositionInfo> parsePositionInfo(const std::string& responseBody);

// faultstring / UPnP errorDescription of a SOAP fault, if the body carries one.
std::optional<std::string> parseFault(const std::string& responseBody);

TransportState parseTransportState(const std::string& value);
const char* transportStateToString(TransportState state);

// Accepts "HH:MM:SS", "H:MM:SS.fff", "MM:SS" and "SS"; rejects "NOT_IMPLEMENTED", garbage,
// minute or second fields above 59 and values that do not fit an int.
std::optional<int> parseClockTime(const std::string& text);
std::string formatClockTime(int seconds);

}  // namespace dlna_soap
