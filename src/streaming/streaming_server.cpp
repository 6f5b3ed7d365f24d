#include "streaming/streaming_server.h"

#include "logging/logger.h"
#include "streaming/http_range.h"

#include <arpa/inet.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace streaming {
namespace {

constexpr size_t kMaxHeadBytes = 16 * 1024;
constexpr size_t kChunkBytes = 64 * 1024;
constexpr int kAcceptPollMs = 200;
constexpr int kReceiveTimeoutSeconds = 10;

const char* reasonPhrase(int status) {
    switch (status) {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 416:
        return "Range Not Satisfiable";
    default:
        return "Internal Server Error";
    }
}

bool sendAll(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::send(fd, data, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

void sendSimple(int fd, int status, const std::string& extraHeaders = "") {
    std::string body = std::string(reasonPhrase(status)) + "\n";
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << reasonPhrase(status) << "\r\n";
    oss << "Content-Type: text/plain\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << extraHeaders;
    oss << "Connection: close\r\n\r\n";
    oss << body;
    const auto resp = oss.str();
    sendAll(fd, resp.data(), resp.size());
}

bool readHead(int fd, std::string& head) {
    char buffer[2048];
    while (head.size() < kMaxHeadBytes) {
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        head.append(buffer, static_cast<size_t>(n));
        size_t end = head.find("\r\n\r\n");
        if (end != std::string::npos) {
            head.resize(end + 2);
            return true;
        }
    }
    return false;
}

class FileGuard {
   public:
    explicit FileGuard(int fd) : fd_(fd) {}
    ~FileGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileGuard(const FileGuard&) = delete;
    FileGuard& operator=(const FileGuard&) = delete;

    int get() const {
        return fd_;
    }

   private:
    int fd_;
};

}  // namespace

StreamingServer::StreamingServer(StreamingSessionRegistry& registry, ServerOptions options)
    : registry_(registry), options_(std::move(options)) {}

StreamingServer::~StreamingServer() {
    stop();
}

std::string StreamingServer::detectAdvertiseHost() {
    ifaddrs* addrs = nullptr;
    if (::getifaddrs(&addrs) != 0) {
        LOG_ONCE(WARN, "[Streaming] getifaddrs failed: {}, advertising loopback",
                 std::strerror(errno));
        return "127.0.0.1";
    }
    std::string host = "127.0.0.1";
    for (ifaddrs* it = addrs; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        auto* addr = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if ((ntohl(addr->sin_addr.s_addr) >> 24) == 127) {
            continue;
        }
        char buffer[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer));
        host = buffer;
        break;
    }
    ::freeifaddrs(addrs);
    return host;
}

bool StreamingServer::bindPort(uint16_t port, std::string& error) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = std::string("socket: ") + std::strerror(errno);
        return false;
    }
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (options_.bindAddress.empty()) {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, options_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        error = "Invalid bind address: " + options_.bindAddress;
        ::close(fd);
        return false;
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind " + std::to_string(port) + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (::listen(fd, 16) < 0) {
        error = std::string("listen: ") + std::strerror(errno);
        ::close(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = port;
    }
    listenFd_ = fd;
    return true;
}

bool StreamingServer::start(std::string& error) {
    if (running_.load(std::memory_order_acquire)) {
        return true;
    }

    bool bound = false;
    if (options_.port != 0) {
        bound = bindPort(options_.port, error);
    } else if (options_.portRangeStart == 0) {
        bound = bindPort(0, error);
    } else {
        for (uint32_t port = options_.portRangeStart; port <= options_.portRangeEnd; ++port) {
            if (bindPort(static_cast<uint16_t>(port), error)) {
                bound = true;
                break;
            }
        }
        if (!bound) {
            error = "no free port in " + std::to_string(options_.portRangeStart) + "-" +
                    std::to_string(options_.portRangeEnd) + " (" + error + ")";
        }
    }
    if (!bound) {
        LOG_ERROR("[Streaming] Failed to start: {}", error);
        return false;
    }

    running_.store(true, std::memory_order_release);
    acceptThread_ = std::thread(&StreamingServer::acceptLoop, this);
    LOG_INFO("[Streaming] Listening on {}:{}", options_.bindAddress, boundPort_);
    return true;
}

void StreamingServer::stop() {
    bool wasRunning = running_.exchange(false);
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }
    reapWorkers(true);
    if (wasRunning) {
        LOG_INFO("[Streaming] Stopped");
    }
}

void StreamingServer::reapWorkers(bool joinAll) {
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (joinAll || it->done->load(std::memory_order_acquire)) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void StreamingServer::acceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
        pollfd pfd{};
        pfd.fd = listenFd_;
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, kAcceptPollMs);
        reapWorkers(false);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[Streaming] poll failed: {}", std::strerror(errno));
            break;
        }
        if (ret == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_in peer{};
        socklen_t peerLen = sizeof(peer);
        int cfd = ::accept(listenFd_, reinterpret_cast<sockaddr*>(&peer), &peerLen);
        if (cfd < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                LOG_EVERY_N(WARN, 100, "[Streaming] accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        timeval tv{};
        tv.tv_sec = kReceiveTimeoutSeconds;
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        char host[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &peer.sin_addr, host, sizeof(host));
        std::string client = std::string(host) + ":" + std::to_string(ntohs(peer.sin_port));

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers_.push_back({std::thread([this, cfd, client, done]() {
                                handleConnection(cfd, client);
                                ::close(cfd);
                                done->store(true, std::memory_order_release);
                            }),
                            done});
    }
}

void StreamingServer::handleConnection(int fd, const std::string& client) {
    std::string rawHead;
    if (!readHead(fd, rawHead)) {
        sendSimple(fd, 400);
        return;
    }
    auto request = parseRequestHead(rawHead);
    if (!request) {
        sendSimple(fd, 400);
        return;
    }
    if (request->method != "GET" && request->method != "HEAD") {
        sendSimple(fd, 405, "Allow: GET, HEAD\r\n");
        return;
    }
    const bool headOnly = request->method == "HEAD";

    auto sessionId = sessionIdFromTarget(request->target);
    std::optional<StreamingSession> session;
    if (sessionId) {
        session = registry_.resolveServable(*sessionId);
    }
    if (!session) {
        LOG_DEBUG("[Streaming] 404 {} from {}", request->target, client);
        sendSimple(fd, 404);
        return;
    }

    FileGuard file(::open(session->contentRef.c_str(), O_RDONLY | O_CLOEXEC));
    struct stat st {};
    if (file.get() < 0 || ::fstat(file.get(), &st) != 0 || !S_ISREG(st.st_mode)) {
        LOG_WARN("[Streaming] Session {} content unavailable: {}", session->sessionId,
                 session->contentRef);
        sendSimple(fd, 404);
        return;
    }
    const uint64_t fileSize = static_cast<uint64_t>(st.st_size);

    auto range = parseRangeHeader(request->header("range"), fileSize);
    if (range.kind == RangeKind::Unsatisfiable) {
        sendSimple(fd, 416, "Content-Range: bytes */" + std::to_string(fileSize) + "\r\n");
        return;
    }

    int status = 200;
    uint64_t start = 0;
    uint64_t length = fileSize;
    if (range.kind == RangeKind::Satisfiable) {
        status = 206;
        start = range.range.start;
        length = range.range.length();
    }

    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << reasonPhrase(status) << "\r\n";
    oss << "Content-Type: " << contentTypeForPath(session->contentRef) << "\r\n";
    oss << "Content-Length: " << length << "\r\n";
    if (status == 206) {
        oss << "Content-Range: bytes " << range.range.start << "-" << range.range.end << "/"
            << fileSize << "\r\n";
    }
    oss << "Accept-Ranges: bytes\r\n";
    oss << "Last-Modified: " << formatHttpDate(st.st_mtime) << "\r\n";
    oss << "transferMode.dlna.org: Streaming\r\n";
    oss << "contentFeatures.dlna.org: DLNA.ORG_OP=01;DLNA.ORG_CI=0;DLNA.ORG_FLAGS="
           "01700000000000000000000000000000\r\n";
    oss << "Connection: close\r\n\r\n";
    const auto header = oss.str();

    registry_.recordConnectionOpened(session->sessionId, client);
    uint64_t sent = 0;
    if (sendAll(fd, header.data(), header.size()) && !headOnly) {
        std::vector<char> buffer(kChunkBytes);
        uint64_t offset = start;
        while (sent < length && running_.load(std::memory_order_acquire)) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), length - sent));
            ssize_t n = ::pread(file.get(), buffer.data(), want, static_cast<off_t>(offset));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                LOG_WARN("[Streaming] Read error on {}: {}", session->contentRef,
                         n < 0 ? std::strerror(errno) : "unexpected end of file");
                break;
            }
            if (!sendAll(fd, buffer.data(), static_cast<size_t>(n))) {
                // Renderers routinely drop connections while seeking
                LOG_DEBUG("[Streaming] Client {} closed session {}", client, session->sessionId);
                break;
            }
            sent += static_cast<uint64_t>(n);
            offset += static_cast<uint64_t>(n);
        }
    }
    registry_.recordConnectionClosed(session->sessionId, sent);
}

}  // namespace streaming
