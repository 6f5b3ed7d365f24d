#include "daemon/core/shutdown_manager.h"

#include "logging/logger.h"

#include <csignal>
#include <thread>
#include <utility>

#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace daemon_core {

ShutdownManager::ShutdownManager(Dependencies deps)
    : deps_(std::move(deps)), controller_(&processSignalFlags()) {
    controller_.setStopHook([this](StopReason reason, const std::string& origin) {
        LOG_INFO("Stop requested by {}: {}", origin, stopReasonName(reason));
        notifySystemd(reason == StopReason::Reload ? "RELOADING=1\nSTATUS=Reloading config...\n"
                                                   : "STOPPING=1\nSTATUS=Shutting down...\n");
        if (deps_.beginDrain) {
            deps_.beginDrain(reason);
        }
    });
}

void ShutdownManager::installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = onSignal;
    sigemptyset(&action.sa_mask);
    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        sigaction(sig, &action, nullptr);
    }
    // A renderer or stream client closing its socket mid-write must not kill the daemon
    std::signal(SIGPIPE, SIG_IGN);
}

void ShutdownManager::notifyReady(const std::string& status) {
    notifySystemd("READY=1\nSTATUS=" + status + "\n");
    ready_ = true;
}

bool ShutdownManager::tick() {
    controller_.poll();
    bool keepRunning = !controller_.stopping();
    if (ready_ && keepRunning) {
        notifySystemd("WATCHDOG=1");
    }
    return keepRunning;
}

bool ShutdownManager::drain() {
    if (drained_) {
        return true;
    }
    drained_ = true;

    if (!deps_.operationsPending || !deps_.operationsPending()) {
        return true;
    }

    LOG_INFO("Waiting up to {} ms for in-flight device operations...", deps_.drainTimeout.count());
    const auto deadline = std::chrono::steady_clock::now() + deps_.drainTimeout;
    while (deps_.operationsPending()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("Drain timed out, tearing down with device work still pending");
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

void ShutdownManager::rearm() {
    controller_.rearm();
    drained_ = false;
    ready_ = false;
}

void ShutdownManager::notifySystemd(const std::string& message) {
#ifdef HAVE_SYSTEMD
    sd_notify(0, message.c_str());
#else
    (void)message;
#endif
}

}  // namespace daemon_core
