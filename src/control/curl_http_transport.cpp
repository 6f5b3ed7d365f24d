#include "control/http_transport.h"

#include "logging/logger.h"

#include <curl/curl.h>
#include <mutex>

namespace control {
namespace {

std::once_flag g_curlInitOnce;

size_t writeBody(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

TransportFailure classify(CURLcode code) {
    switch (code) {
    case CURLE_OK:
        return TransportFailure::None;
    case CURLE_OPERATION_TIMEDOUT:
        return TransportFailure::Timeout;
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_GOT_NOTHING:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
        return TransportFailure::ConnectionFailed;
    default:
        return TransportFailure::Other;
    }
}

}  // namespace

const char* transportFailureToString(TransportFailure failure) {
    switch (failure) {
    case TransportFailure::ConnectionFailed:
        return "connection_failed";
    case TransportFailure::Timeout:
        return "timeout";
    case TransportFailure::Other:
        return "other";
    case TransportFailure::None:
    default:
        return "none";
    }
}

CurlHttpTransport::CurlHttpTransport() {
    std::call_once(g_curlInitOnce, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("[HTTP] curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

CurlHttpTransport::~CurlHttpTransport() = default;

TransportResult CurlHttpTransport::perform(const HttpRequest& request, HttpResponse& response) {
    TransportResult result;
    response = HttpResponse{};

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.failure = TransportFailure::Other;
        result.message = "curl_easy_init failed";
        return result;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        headers = curl_slist_append(headers, line.c_str());
    }
    // Some renderers reject "Expect: 100-continue" on SOAP posts
    headers = curl_slist_append(headers, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    } else {
        result.failure = classify(rc);
        result.message = curl_easy_strerror(rc);
        result.nativeCode = static_cast<int>(rc);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

}  // namespace control
