#ifndef CASTGRID_DAEMON_CONSTANTS_H
#define CASTGRID_DAEMON_CONSTANTS_H

#include <cstdint>

// Common constants shared across daemon components

namespace DaemonConstants {

// SSDP
constexpr const char* SSDP_MULTICAST_ADDRESS = "239.255.255.250";
constexpr uint16_t SSDP_PORT = 1900;
constexpr const char* SSDP_SEARCH_ALL = "ssdp:all";
constexpr const char* UPNP_MEDIA_RENDERER_TYPE = "urn:schemas-upnp-org:device:MediaRenderer:1";
constexpr const char* UPNP_AVTRANSPORT_SERVICE = "urn:schemas-upnp-org:service:AVTransport:1";
constexpr const char* AVTRANSPORT_MARKER = "AVTransport";
constexpr int DEFAULT_MULTICAST_TTL = 4;

// Device control
constexpr int DEFAULT_CONTROL_TIMEOUT_MS = 5000;
constexpr int DEFAULT_CONTROL_MAX_ATTEMPTS = 3;
constexpr int DEFAULT_CONTROL_RETRY_DELAY_MS = 2000;

// Streaming
constexpr uint16_t DEFAULT_STREAM_PORT_RANGE_START = 9000;
constexpr uint16_t DEFAULT_STREAM_PORT_RANGE_END = 9100;
constexpr const char* STREAM_PATH_PREFIX = "/stream/";
constexpr int DEFAULT_STALL_TIMEOUT_SECONDS = 90;
constexpr int DEFAULT_SESSION_RETENTION_SECONDS = 3600;
constexpr int DEFAULT_MAX_SESSION_HOURS = 24;
constexpr int DEFAULT_HEALTH_CHECK_INTERVAL_SECONDS = 5;

// User control reasons
constexpr const char* REASON_MANUAL_STOP = "manual_stop";
constexpr const char* REASON_USER_PLAY = "user_play";
constexpr const char* REASON_USER_PAUSE = "user_pause";
constexpr const char* REASON_BLACKOUT = "blackout";

// ZeroMQ endpoints
constexpr const char* ZEROMQ_IPC_PATH = "ipc:///tmp/castgrid.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";
constexpr int ZEROMQ_POLL_INTERVAL_MS = 100;
// Handlers slower than this are logged; device commands may sit in control retries
constexpr int ZEROMQ_SLOW_HANDLER_MS = 1000;

// Process files
constexpr const char* PID_FILE_PATH = "/tmp/castgrid_daemon.pid";
constexpr const char* DEFAULT_CONFIG_PATH = "config.json";
constexpr const char* STATS_FILE_PATH = "/tmp/castgrid_stats.json";

}  // namespace DaemonConstants

#endif  // CASTGRID_DAEMON_CONSTANTS_H
