#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace discovery {

// One unicast reply to an M-SEARCH. Header names are stored lower-cased.
struct SsdpResponse {
    std::map<std::string, std::string> headers;
    std::string sourceHost;
    uint16_t sourcePort = 0;

    std::string header(const std::string& lowerName) const;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string path;  // always starts with '/'
};

std::string buildMSearchRequest(const std::string& searchTarget, int mxSeconds);

// Returns nullopt for anything that is not an "HTTP/1.x 200" header block
// with well-formed "Name: value" lines.
std::optional<SsdpResponse> parseSsdpResponse(const std::string& datagram);

// ST (or NT) names the AVTransport service or a media renderer carrying it.
bool advertisesRenderer(const SsdpResponse& response);

// "uuid:..." taken from USN, or "dlna_<host>_<port>" when USN has none.
std::string deviceIdentity(const SsdpResponse& response, const std::string& host, uint16_t port);

std::optional<ParsedUrl> parseHttpUrl(const std::string& url);

// Resolves a (possibly relative) URL from a device description against its LOCATION.
std::string resolveUrl(const std::string& base, const std::string& reference);

}  // namespace discovery
