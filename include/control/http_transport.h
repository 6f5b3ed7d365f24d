#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace control {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{5000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

enum class TransportFailure {
    None,
    ConnectionFailed,  // refused, unresolvable host, reset before a response
    Timeout,
    Other,             // malformed URL, local resource errors
};

struct TransportResult {
    TransportFailure failure = TransportFailure::None;
    std::string message;
    int nativeCode = 0;  // CURLcode for the curl transport

    bool ok() const {
        return failure == TransportFailure::None;
    }
    bool isTransient() const {
        return failure == TransportFailure::ConnectionFailed || failure == TransportFailure::Timeout;
    }
};

// Blocking HTTP client seam. A non-2xx status is a successful transfer; callers inspect it.
class HttpTransport {
   public:
    virtual ~HttpTransport() = default;
    virtual TransportResult perform(const HttpRequest& request, HttpResponse& response) = 0;
};

// libcurl easy-handle transport; one handle per request so it is safe from any thread.
class CurlHttpTransport : public HttpTransport {
   public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    TransportResult perform(const HttpRequest& request, HttpResponse& response) override;
};

const char* transportFailureToString(TransportFailure failure);

}  // namespace control
