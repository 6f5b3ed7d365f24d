#include "streaming/http_range.h"

#include "core/daemon_constants.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace streaming {
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

bool parseUnsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 19) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    out = value;
    return true;
}

}  // namespace

RangeResult parseRangeHeader(const std::string& value, uint64_t fileSize) {
    RangeResult result;
    std::string rangeSet = trim(value);
    if (rangeSet.empty()) {
        return result;
    }

    result.kind = RangeKind::Ignored;
    if (!toLower(rangeSet).starts_with("bytes=")) {
        return result;
    }
    rangeSet = trim(rangeSet.substr(6));
    if (rangeSet.find(',') != std::string::npos) {
        // Multiple ranges are answered with the full body
        return result;
    }

    size_t dash = rangeSet.find('-');
    if (dash == std::string::npos) {
        return result;
    }
    std::string first = trim(rangeSet.substr(0, dash));
    std::string last = trim(rangeSet.substr(dash + 1));

    if (first.empty()) {
        // Suffix range: last N bytes
        uint64_t suffix = 0;
        if (!parseUnsigned(last, suffix)) {
            return result;
        }
        if (suffix == 0 || fileSize == 0) {
            result.kind = RangeKind::Unsatisfiable;
            return result;
        }
        suffix = std::min(suffix, fileSize);
        result.kind = RangeKind::Satisfiable;
        result.range = {fileSize - suffix, fileSize - 1};
        return result;
    }

    uint64_t start = 0;
    if (!parseUnsigned(first, start)) {
        return result;
    }
    uint64_t end = fileSize == 0 ? 0 : fileSize - 1;
    if (!last.empty()) {
        if (!parseUnsigned(last, end) || end < start) {
            return result;
        }
    }
    if (start >= fileSize) {
        result.kind = RangeKind::Unsatisfiable;
        return result;
    }
    result.kind = RangeKind::Satisfiable;
    result.range = {start, std::min(end, fileSize - 1)};
    return result;
}

std::string RequestHead::header(const std::string& lowerName) const {
    auto it = headers.find(lowerName);
    return it == headers.end() ? std::string() : it->second;
}

std::optional<RequestHead> parseRequestHead(const std::string& head) {
    std::istringstream stream(head);
    std::string line;
    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    line = trim(line);

    RequestHead request;
    std::istringstream requestLine(line);
    std::string extra;
    if (!(requestLine >> request.method >> request.target >> request.version) ||
        (requestLine >> extra)) {
        return std::nullopt;
    }
    if (!request.version.starts_with("HTTP/1.") || request.target.empty() ||
        request.target[0] != '/') {
        return std::nullopt;
    }

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::nullopt;
        }
        request.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return request;
}

std::optional<std::string> sessionIdFromTarget(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    const std::string prefix = DaemonConstants::STREAM_PATH_PREFIX;
    if (!path.starts_with(prefix)) {
        return std::nullopt;
    }
    std::string rest = path.substr(prefix.size());
    size_t slash = rest.find('/');
    std::string id = rest.substr(0, slash);
    if (id.empty() || id.find("..") != std::string::npos) {
        return std::nullopt;
    }
    return id;
}

std::string contentTypeForPath(const std::string& path) {
    static const std::map<std::string, std::string> kTypes = {
        {"mp4", "video/mp4"},       {"m4v", "video/mp4"},       {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},     {"avi", "video/x-msvideo"}, {"mov", "video/quicktime"},
        {"ts", "video/mp2t"},       {"mpg", "video/mpeg"},      {"mpeg", "video/mpeg"},
        {"mp3", "audio/mpeg"},      {"jpg", "image/jpeg"},      {"png", "image/png"},
    };
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }
    auto it = kTypes.find(toLower(path.substr(dot + 1)));
    return it == kTypes.end() ? "application/octet-stream" : it->second;
}

std::string formatHttpDate(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return buffer;
}

}  // namespace streaming
