#include "daemon/core/graceful_shutdown.h"

namespace daemon_core {
namespace {

SignalFlags g_signalFlags;

std::string signalOrigin(int sig) {
    switch (sig) {
    case SIGTERM:
        return "SIGTERM";
    case SIGINT:
        return "SIGINT";
    case SIGHUP:
        return "SIGHUP";
    default:
        return "signal " + std::to_string(sig);
    }
}

}  // namespace

SignalFlags& processSignalFlags() {
    return g_signalFlags;
}

void onSignal(int sig) {
    g_signalFlags.lastSignal = sig;
    if (sig == SIGHUP) {
        g_signalFlags.hangup = 1;
    } else {
        g_signalFlags.terminate = 1;
    }
}

const char* stopReasonName(StopReason reason) {
    switch (reason) {
    case StopReason::Shutdown:
        return "shutdown";
    case StopReason::Reload:
        return "reload";
    case StopReason::None:
    default:
        return "none";
    }
}

void StopController::requestShutdown(const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    requested_ = StopReason::Shutdown;
    requestedOrigin_ = origin;
}

void StopController::requestReload(const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requested_ != StopReason::Shutdown) {
        requested_ = StopReason::Reload;
        requestedOrigin_ = origin;
    }
}

StopReason StopController::poll() {
    StopReason decidedNow = StopReason::None;
    std::string origin;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (flags_ && flags_->terminate) {
            std::string signalName = signalOrigin(flags_->lastSignal);
            flags_->terminate = 0;
            flags_->hangup = 0;
            requested_ = StopReason::Shutdown;
            requestedOrigin_ = signalName;
        } else if (flags_ && flags_->hangup) {
            flags_->hangup = 0;
            if (requested_ != StopReason::Shutdown) {
                requested_ = StopReason::Reload;
                requestedOrigin_ = "SIGHUP";
            }
        }

        if (requested_ == StopReason::None) {
            return StopReason::None;
        }
        bool upgrade = decided_ == StopReason::Reload && requested_ == StopReason::Shutdown;
        if (decided_ == StopReason::None || upgrade) {
            decideLocked(requested_, requestedOrigin_);
            decidedNow = decided_;
            origin = decidedOrigin_;
        }
        requested_ = StopReason::None;
        requestedOrigin_.clear();
    }

    if (decidedNow != StopReason::None && stopHook_) {
        stopHook_(decidedNow, origin);
    }
    return decidedNow;
}

void StopController::decideLocked(StopReason reason, std::string origin) {
    decided_ = reason;
    decidedOrigin_ = std::move(origin);
}

bool StopController::stopping() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decided_ != StopReason::None;
}

StopReason StopController::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decided_;
}

std::string StopController::origin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decidedOrigin_;
}

void StopController::rearm() {
    std::lock_guard<std::mutex> lock(mutex_);
    decided_ = StopReason::None;
    decidedOrigin_.clear();
}

}  // namespace daemon_core
