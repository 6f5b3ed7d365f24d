#pragma once

#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>

namespace streaming {

// Inclusive byte range within a file.
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const {
        return end - start + 1;
    }
};

enum class RangeKind {
    None,            // no Range header: full body
    Ignored,         // syntactically unusable or multi-range: full body
    Satisfiable,     // 206
    Unsatisfiable,   // 416
};

struct RangeResult {
    RangeKind kind = RangeKind::None;
    ByteRange range;
};

RangeResult parseRangeHeader(const std::string& value, uint64_t fileSize);

struct RequestHead {
    std::string method;
    std::string target;
    std::string version;
    std::map<std::string, std::string> headers;  // lower-cased names

    std::string header(const std::string& lowerName) const;
};

// Parses the request line and headers (everything before the blank line).
std::optional<RequestHead> parseRequestHead(const std::string& head);

// "/stream/<id>/<file>" -> "<id>"; nullopt for anything else.
std::optional<std::string> sessionIdFromTarget(const std::string& target);

std::string contentTypeForPath(const std::string& path);

// RFC 1123, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string formatHttpDate(std::time_t time);

}  // namespace streaming
