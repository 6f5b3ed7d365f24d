#include "core/daemon_constants.h"
#include "discovery/ssdp_socket.h"
#include "logging/logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace discovery {
namespace {

constexpr size_t kMaxDatagramBytes = 8192;

std::string errnoMessage(const std::string& prefix) {
    return prefix + ": " + std::strerror(errno);
}

class SocketGuard {
   public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const {
        return fd_;
    }

   private:
    int fd_;
};

}  // namespace

UdpSsdpSocket::UdpSsdpSocket(int multicastTtl, std::string interfaceAddress)
    : multicastTtl_(multicastTtl), interfaceAddress_(std::move(interfaceAddress)) {}

bool UdpSsdpSocket::search(const std::string& request, std::chrono::milliseconds window,
                           std::vector<SsdpDatagram>& replies, std::string& error) {
    SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (sock.get() < 0) {
        error = errnoMessage("socket");
        return false;
    }

    int reuse = 1;
    ::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    unsigned char ttl = static_cast<unsigned char>(multicastTtl_ > 0 ? multicastTtl_ : 1);
    if (::setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) != 0) {
        error = errnoMessage("setsockopt(IP_MULTICAST_TTL)");
        return false;
    }

    if (!interfaceAddress_.empty()) {
        in_addr iface{};
        if (::inet_pton(AF_INET, interfaceAddress_.c_str(), &iface) != 1) {
            error = "Invalid interface address: " + interfaceAddress_;
            return false;
        }
        if (::setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) != 0) {
            error = errnoMessage("setsockopt(IP_MULTICAST_IF)");
            return false;
        }
    }

    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(DaemonConstants::SSDP_PORT);
    ::inet_pton(AF_INET, DaemonConstants::SSDP_MULTICAST_ADDRESS, &group.sin_addr);

    ssize_t sent = ::sendto(sock.get(), request.data(), request.size(), 0,
                            reinterpret_cast<sockaddr*>(&group), sizeof(group));
    if (sent < 0 || static_cast<size_t>(sent) != request.size()) {
        error = errnoMessage("sendto");
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + window;
    char buffer[kMaxDatagramBytes];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("[SSDP] poll failed ({}), ending search window early", std::strerror(errno));
            break;
        }
        if (ret == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_in src{};
        socklen_t srcLen = sizeof(src);
        ssize_t n = ::recvfrom(sock.get(), buffer, sizeof(buffer), 0,
                               reinterpret_cast<sockaddr*>(&src), &srcLen);
        if (n <= 0) {
            continue;
        }

        char host[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &src.sin_addr, host, sizeof(host));

        SsdpDatagram datagram;
        datagram.payload.assign(buffer, static_cast<size_t>(n));
        datagram.sourceHost = host;
        datagram.sourcePort = ntohs(src.sin_port);
        replies.push_back(std::move(datagram));
    }
    return true;
}

}  // namespace discovery
