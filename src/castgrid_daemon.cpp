#include "blackout/blackout_coordinator.h"
#include "control/control_client.h"
#include "core/config_loader.h"
#include "core/daemon_constants.h"
#include "daemon/app/app.h"
#include "daemon/app/process_resources.h"
#include "devices/device_registry.h"
#include "discovery/discovery_engine.h"
#include "discovery/ssdp_socket.h"
#include "logging/logger.h"
#include "playback/playback_supervisor.h"
#include "streaming/session_registry.h"
#include "streaming/streaming_server.h"

#include <cstdlib>
#include <string>
#include <unistd.h>

namespace {

// First CLI argument wins over CASTGRID_CONFIG, which wins over the default path
std::string resolveConfigPath(int argc, char* argv[]) {
    if (argc > 1) {
        return argv[1];
    }
    if (const char* env = std::getenv("CASTGRID_CONFIG")) {
        return env;
    }
    return DaemonConstants::DEFAULT_CONFIG_PATH;
}

}  // namespace

int main(int argc, char* argv[]) {
    // stderr only until the PID lock is held
    castgrid::logging::initializeEarly();

    std::string configPath = resolveConfigPath(argc, argv);

    daemon_app::ProcessResources::Options resourceOptions;
    resourceOptions.pidFilePath = DaemonConstants::PID_FILE_PATH;
    resourceOptions.statsFilePath = DaemonConstants::STATS_FILE_PATH;
    if (const char* endpoint = std::getenv("CASTGRID_IPC_ENDPOINT")) {
        resourceOptions.controlEndpoint = endpoint;
    } else {
        resourceOptions.controlEndpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    }
    auto resources = daemon_app::ProcessResources::acquire(resourceOptions);
    if (!resources) {
        return 1;
    }

    castgrid::logging::initializeFromConfig(configPath);

    LOG_INFO("========================================");
    LOG_INFO("  castgrid - renderer orchestration daemon");
    LOG_INFO("========================================");
    LOG_INFO("PID: {} (file: {})", getpid(), resources->pidLock().path());
    LOG_INFO("Config: {}", configPath);

    daemon_app::AppOverrides overrides;
    if (const char* devices = std::getenv("CASTGRID_DEVICES")) {
        overrides.devicesFile = devices;
    }
    if (const char* endpoint = std::getenv("CASTGRID_IPC_ENDPOINT")) {
        overrides.ipcEndpoint = endpoint;
    }

    daemon_app::RuntimeState state;
    daemon_app::App app(state, configPath, resources->statsFile().path());
    int exitCode = app.run(overrides);

    castgrid::logging::shutdown();
    return exitCode;
}
