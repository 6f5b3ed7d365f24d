#include "discovery/ssdp.h"

#include "core/daemon_constants.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace discovery {
namespace {

std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        start++;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return text.substr(start, end - start);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

}  // namespace

std::string SsdpResponse::header(const std::string& lowerName) const {
    auto it = headers.find(lowerName);
    return it == headers.end() ? std::string() : it->second;
}

std::string buildMSearchRequest(const std::string& searchTarget, int mxSeconds) {
    std::ostringstream out;
    out << "M-SEARCH * HTTP/1.1\r\n"
        << "HOST: " << DaemonConstants::SSDP_MULTICAST_ADDRESS << ":" << DaemonConstants::SSDP_PORT
        << "\r\n"
        << "MAN: \"ssdp:discover\"\r\n"
        << "MX: " << std::max(1, mxSeconds) << "\r\n"
        << "ST: " << searchTarget << "\r\n"
        << "\r\n";
    return out.str();
}

std::optional<SsdpResponse> parseSsdpResponse(const std::string& datagram) {
    std::istringstream stream(datagram);
    std::string line;
    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    line = trim(line);
    // "HTTP/1.1 200 OK"
    if (!line.starts_with("HTTP/1.")) {
        return std::nullopt;
    }
    size_t space = line.find(' ');
    if (space == std::string::npos || line.compare(space + 1, 3, "200") != 0) {
        return std::nullopt;
    }

    SsdpResponse response;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::nullopt;
        }
        std::string name = toLower(trim(line.substr(0, colon)));
        response.headers[name] = trim(line.substr(colon + 1));
    }

    if (response.headers.empty()) {
        return std::nullopt;
    }
    return response;
}

bool advertisesRenderer(const SsdpResponse& response) {
    std::string target = response.header("st");
    if (target.empty()) {
        target = response.header("nt");
    }
    return containsIgnoreCase(target, DaemonConstants::AVTRANSPORT_MARKER);
}

std::string deviceIdentity(const SsdpResponse& response, const std::string& host, uint16_t port) {
    std::string usn = response.header("usn");
    if (toLower(usn).starts_with("uuid:")) {
        size_t end = usn.find("::");
        return end == std::string::npos ? usn : usn.substr(0, end);
    }
    return "dlna_" + host + "_" + std::to_string(port);
}

std::optional<ParsedUrl> parseHttpUrl(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, schemeEnd));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return std::nullopt;
    }

    size_t hostStart = schemeEnd + 3;
    size_t pathStart = url.find('/', hostStart);
    std::string authority =
        url.substr(hostStart, pathStart == std::string::npos ? std::string::npos
                                                             : pathStart - hostStart);
    parsed.path = pathStart == std::string::npos ? "/" : url.substr(pathStart);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        if (portText.empty() || portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        int port = std::stoi(portText);
        if (port <= 0 || port > 65535) {
            return std::nullopt;
        }
        parsed.port = static_cast<uint16_t>(port);
        parsed.host = authority.substr(0, colon);
    } else {
        parsed.host = authority;
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    }

    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

std::string resolveUrl(const std::string& base, const std::string& reference) {
    if (reference.find("://") != std::string::npos) {
        return reference;
    }
    auto parsed = parseHttpUrl(base);
    if (!parsed) {
        return reference;
    }
    std::string origin = parsed->scheme + "://" + parsed->host + ":" + std::to_string(parsed->port);
    if (reference.starts_with("/")) {
        return origin + reference;
    }
    std::string directory = parsed->path.substr(0, parsed->path.rfind('/') + 1);
    return origin + directory + reference;
}

}  // namespace discovery
