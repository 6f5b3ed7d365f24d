#include "daemon/app/app.h"

#include "blackout/blackout_coordinator.h"
#include "control/control_client.h"
#include "control/http_transport.h"
#include "daemon/control/control_plane.h"
#include "daemon/core/shutdown_manager.h"
#include "devices/device_registry.h"
#include "discovery/configured_device.h"
#include "discovery/discovery_engine.h"
#include "discovery/ssdp_socket.h"
#include "logging/logger.h"
#include "playback/playback_supervisor.h"
#include "streaming/session_registry.h"
#include "streaming/streaming_server.h"

#include <chrono>
#include <thread>
#include <utility>

namespace daemon_app {
namespace {

void load_runtime_config(RuntimeState& state, const std::string& configFilePath,
                         const AppOverrides& overrides) {
    state.config = AppConfig{};
    if (!loadAppConfig(configFilePath, state.config)) {
        LOG_WARN("Config: {} not loaded, using defaults", configFilePath);
    }
    if (overrides.devicesFile) {
        state.config.devicesFile = *overrides.devicesFile;
        LOG_INFO("Config: devices file override: {}", *overrides.devicesFile);
    }
    if (overrides.ipcEndpoint) {
        state.config.ipc.endpoint = *overrides.ipcEndpoint;
    }

    state.deviceConfigs.clear();
    std::string error;
    if (!loadDeviceConfigs(state.config.devicesFile, state.deviceConfigs, error)) {
        LOG_WARN("Config: no configured devices ({})", error);
    } else {
        LOG_INFO("Config: {} configured device(s) from {}", state.deviceConfigs.size(),
                 state.config.devicesFile);
    }
}

discovery::DiscoveryOptions make_discovery_options(const AppConfig& config) {
    discovery::DiscoveryOptions options;
    options.interval = std::chrono::seconds(config.discovery.intervalSeconds);
    options.searchWindow = std::chrono::milliseconds(config.discovery.searchWindowMs);
    options.searchTarget = config.discovery.searchTarget;
    options.mxSeconds = config.discovery.mxSeconds;
    options.disconnectTimeout = std::chrono::seconds(config.discovery.disconnectTimeoutSeconds);
    options.errorBackoff = std::chrono::seconds(config.discovery.errorBackoffSeconds);
    options.descriptionTimeout = std::chrono::milliseconds(config.discovery.descriptionTimeoutMs);
    return options;
}

playback::SupervisorOptions make_supervisor_options(const AppConfig& config) {
    playback::SupervisorOptions options;
    options.passInterval = std::chrono::seconds(config.supervisor.passIntervalSeconds);
    options.overrideWindow = std::chrono::seconds(config.supervisor.overrideWindowSeconds);
    options.maxPlayRetries = config.supervisor.maxPlayRetries;
    options.retryBackoffBase = std::chrono::seconds(config.supervisor.retryBackoffBaseSeconds);
    options.retryBackoffMax = std::chrono::seconds(config.supervisor.retryBackoffMaxSeconds);
    options.errorRetry = std::chrono::seconds(config.supervisor.errorRetrySeconds);
    options.pollFailureThreshold = config.supervisor.pollFailureThreshold;
    return options;
}

void build_components(RuntimeState& state) {
    const AppConfig& config = state.config;
    auto& c = state.components;
    castgrid::NowProvider now = castgrid::systemNowProvider();

    c.registry = std::make_unique<devices::DeviceRegistry>();
    c.http = std::make_shared<control::CurlHttpTransport>();

    control::ControlOptions controlOptions;
    controlOptions.timeout = std::chrono::milliseconds(config.control.timeoutMs);
    controlOptions.maxAttempts = config.control.maxAttempts;
    controlOptions.retryDelay = std::chrono::milliseconds(config.control.retryDelayMs);
    c.control = std::make_unique<control::ControlClient>(c.http, controlOptions);

    c.ssdpSocket = std::make_unique<discovery::UdpSsdpSocket>(config.discovery.multicastTtl,
                                                               config.discovery.interfaceAddress);
    discovery::DiscoveryEngine::Dependencies discoveryDeps;
    discoveryDeps.registry = c.registry.get();
    discoveryDeps.socket = c.ssdpSocket.get();
    discoveryDeps.http = c.http.get();
    discoveryDeps.now = now;
    discoveryDeps.runningFlag = &state.flags.running;
    c.discovery = std::make_unique<discovery::DiscoveryEngine>(std::move(discoveryDeps),
                                                               make_discovery_options(config));

    streaming::SessionOptions sessionOptions;
    sessionOptions.stallTimeout = std::chrono::seconds(config.streaming.stallTimeoutSeconds);
    sessionOptions.retention = std::chrono::seconds(config.streaming.retentionSeconds);
    sessionOptions.maxDuration = std::chrono::hours(config.streaming.maxSessionHours);
    c.sessions = std::make_unique<streaming::StreamingSessionRegistry>(now, sessionOptions);

    streaming::ServerOptions serverOptions;
    serverOptions.bindAddress = config.streaming.bindAddress;
    serverOptions.port = config.streaming.port;
    serverOptions.portRangeStart = config.streaming.portRangeStart;
    serverOptions.portRangeEnd = config.streaming.portRangeEnd;
    c.server = std::make_unique<streaming::StreamingServer>(*c.sessions, serverOptions);

    playback::PlaybackSupervisor::Dependencies supervisorDeps;
    supervisorDeps.registry = c.registry.get();
    supervisorDeps.control = c.control.get();
    supervisorDeps.sessions = c.sessions.get();
    supervisorDeps.now = now;
    supervisorDeps.unreachableReporter = [engine = c.discovery.get()](
                                             const std::string& deviceId,
                                             const std::string& reason) {
        engine->markUnreachable(deviceId, reason);
    };
    c.supervisor = std::make_unique<playback::PlaybackSupervisor>(
        std::move(supervisorDeps), make_supervisor_options(config));

    blackout::BlackoutCoordinator::Dependencies blackoutDeps;
    blackoutDeps.registry = c.registry.get();
    blackoutDeps.supervisor = c.supervisor.get();
    blackoutDeps.now = now;
    blackout::BlackoutOptions blackoutOptions;
    blackoutOptions.clipPath = config.blackout.clipPath;
    blackoutOptions.loop = config.blackout.loop;
    c.blackout = std::make_unique<blackout::BlackoutCoordinator>(std::move(blackoutDeps),
                                                                 blackoutOptions);
}

void register_configured_devices(RuntimeState& state) {
    auto& c = state.components;
    for (const auto& entry : state.deviceConfigs) {
        devices::Device device;
        std::string error;
        if (!discovery::deviceFromConfig(entry, device, error)) {
            LOG_ERROR("Config: skipping device '{}': {}", entry.deviceName, error);
            continue;
        }
        std::string id = device.id;
        if (!c.discovery->registerConfiguredDevice(std::move(device))) {
            LOG_WARN("Config: device '{}' ({}) already registered", entry.deviceName, id);
            continue;
        }
        c.supervisor->setDesiredContent(id, playback::DesiredContent{entry.videoFile, entry.loop});
    }
}

void teardown_components(RuntimeState& state) {
    auto& c = state.components;
    if (c.discovery) {
        c.discovery->stop();
    }
    if (c.supervisor) {
        c.supervisor->stop();
    }
    if (c.server) {
        c.server->stop();
    }
    if (c.sessions) {
        c.sessions->clear();
    }
    if (c.registry) {
        c.registry->clear();
    }

    c.blackout.reset();
    c.supervisor.reset();
    c.server.reset();
    c.sessions.reset();
    c.discovery.reset();
    c.ssdpSocket.reset();
    c.control.reset();
    c.http.reset();
    c.registry.reset();
}

}  // namespace

App::App(RuntimeState& state, std::string configFilePath, std::string statsFilePath)
    : state_(state),
      configFilePath_(std::move(configFilePath)),
      statsFilePath_(std::move(statsFilePath)) {}

int App::run(const AppOverrides& overrides) {
    daemon_core::ShutdownManager::Dependencies shutdownDeps;
    shutdownDeps.operationsPending = [&state = state_]() {
        return state.components.supervisor && state.components.supervisor->hasPendingWork();
    };
    shutdownDeps.beginDrain = [&state = state_](daemon_core::StopReason) {
        state.flags.running.store(false);
        if (state.components.supervisor) {
            state.components.supervisor->stopScheduling();
        }
    };
    daemon_core::ShutdownManager shutdownManager(std::move(shutdownDeps));
    shutdownManager.installSignalHandlers();

    int exitCode = 0;
    bool reloading = false;

    do {
        shutdownManager.rearm();
        state_.flags.running.store(true);
        state_.flags.zmqBindFailed.store(false);
        if (reloading) {
            // Picks up a changed "logging.level" without reopening the sinks
            castgrid::logging::initializeFromConfig(configFilePath_);
        }

        load_runtime_config(state_, configFilePath_, overrides);
        build_components(state_);
        auto& c = state_.components;

        daemon_control::ControlPlaneDependencies controlDeps{};
        controlDeps.config = &state_.config;
        controlDeps.stop = &shutdownManager.controller();
        controlDeps.zmqBindFailed = &state_.flags.zmqBindFailed;
        controlDeps.registry = c.registry.get();
        controlDeps.discovery = c.discovery.get();
        controlDeps.supervisor = c.supervisor.get();
        controlDeps.sessions = c.sessions.get();
        controlDeps.blackout = c.blackout.get();
        controlDeps.statsFilePath = statsFilePath_;
        auto controlPlane = std::make_unique<daemon_control::ControlPlane>(std::move(controlDeps));

        bool started = controlPlane->start();
        if (started) {
            auto publisher = controlPlane->eventPublisher();
            c.discovery->setEventPublisher(publisher);
            c.supervisor->setEventPublisher(publisher);
            c.blackout->setEventPublisher(publisher);
        } else {
            LOG_ERROR("Startup aborted: control plane could not bind {}",
                      state_.config.ipc.endpoint);
        }

        if (started) {
            std::string error;
            if (!c.server->start(error)) {
                LOG_ERROR("Streaming server failed to start: {}", error);
                exitCode = 1;
                started = false;
            } else {
                std::string host = state_.config.streaming.advertiseHost.empty()
                                       ? streaming::StreamingServer::detectAdvertiseHost()
                                       : state_.config.streaming.advertiseHost;
                c.sessions->setBaseUrl("http://" + host + ":" +
                                       std::to_string(c.server->boundPort()));
                LOG_INFO("Streaming: serving on {}", c.sessions->baseUrl());
            }
        }

        if (started) {
            register_configured_devices(state_);
            if (state_.config.discovery.enabled) {
                c.discovery->start();
            } else {
                LOG_INFO("Discovery: disabled by config, configured devices only");
            }
            c.supervisor->start();

            LOG_INFO("System ready: {} device(s) registered, control on {}", c.registry->size(),
                     state_.config.ipc.endpoint);
            shutdownManager.notifyReady("Supervising " + std::to_string(c.registry->size()) +
                                        " renderer(s)");

            auto sweepInterval =
                std::chrono::seconds(state_.config.streaming.healthCheckIntervalSeconds);
            auto lastSweep = std::chrono::steady_clock::now();
            while (shutdownManager.tick()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                auto tickNow = std::chrono::steady_clock::now();
                if (tickNow - lastSweep >= sweepInterval) {
                    auto report = c.sessions->sweep();
                    LOG_IF(INFO, report.stalled + report.expired + report.purged > 0,
                           "Sessions: {} stalled, {} expired, {} purged", report.stalled,
                           report.expired, report.purged);
                    lastSweep = tickNow;
                }
            }
        } else {
            // Startup failures still go through the stop hook so the drain state is consistent
            shutdownManager.controller().requestShutdown("startup failure");
            shutdownManager.tick();
        }

        shutdownManager.drain();

        LOG_INFO("Stopping components...");
        controlPlane->stop();
        teardown_components(state_);

        if (state_.flags.zmqBindFailed.load()) {
            LOG_ERROR("Exiting due to ZeroMQ initialization failure.");
            exitCode = 1;
            break;
        }
        if (exitCode != 0) {
            break;
        }
        reloading = shutdownManager.reloadRequested();
        if (reloading) {
            LOG_INFO("Reload requested. Restarting with updated config...");
        }
    } while (reloading);

    LOG_INFO("Goodbye!");
    return exitCode;
}

}  // namespace daemon_app
