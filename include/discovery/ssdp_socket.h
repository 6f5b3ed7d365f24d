#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace discovery {

struct SsdpDatagram {
    std::string payload;
    std::string sourceHost;
    uint16_t sourcePort = 0;
};

// Sends one M-SEARCH and collects unicast replies for a bounded window.
class SsdpSocket {
   public:
    virtual ~SsdpSocket() = default;

    // Returns false (with error set) only when the socket could not be set up or the
    // request could not be sent. An empty reply list is a successful search.
    virtual bool search(const std::string& request, std::chrono::milliseconds window,
                        std::vector<SsdpDatagram>& replies, std::string& error) = 0;
};

// IPv4 UDP socket; opened per search and closed before returning.
class UdpSsdpSocket : public SsdpSocket {
   public:
    explicit UdpSsdpSocket(int multicastTtl = 4, std::string interfaceAddress = "");

    bool search(const std::string& request, std::chrono::milliseconds window,
                std::vector<SsdpDatagram>& replies, std::string& error) override;

   private:
    int multicastTtl_;
    std::string interfaceAddress_;
};

}  // namespace discovery
