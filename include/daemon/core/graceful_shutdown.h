#pragma once

#include <csignal>
#include <functional>
#include <mutex>
#include <string>

namespace daemon_core {

// Written by the signal handler only. sig_atomic_t keeps the handler async-signal-safe.
struct SignalFlags {
    volatile sig_atomic_t terminate = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t hangup = 0;     // SIGHUP
    volatile sig_atomic_t lastSignal = 0;

    void clear() {
        terminate = 0;
        hangup = 0;
        lastSignal = 0;
    }
};

SignalFlags& processSignalFlags();

// Installed for SIGTERM, SIGINT and SIGHUP; only sets flags.
void onSignal(int sig);

enum class StopReason { None, Shutdown, Reload };

const char* stopReasonName(StopReason reason);

/**
 * @brief Turns signals and operator requests into one stop decision per daemon iteration.
 *
 * SIGTERM/SIGINT and the SHUTDOWN command stop the daemon; SIGHUP and the RELOAD
 * command stop the current iteration so it can be rebuilt from the config file.
 * A shutdown always wins: it overrides a pending or already-taken reload, and a
 * reload never downgrades a shutdown. The stop hook runs exactly once per
 * decision, on the thread that calls poll().
 *
 * Signal flags are polled; operator requests may come from any thread.
 */
class StopController {
   public:
    using StopHook = std::function<void(StopReason reason, const std::string& origin)>;

    explicit StopController(SignalFlags* flags = nullptr) : flags_(flags) {}

    void setStopHook(StopHook hook) {
        stopHook_ = std::move(hook);
    }

    void requestShutdown(const std::string& origin);
    void requestReload(const std::string& origin);

    // Folds pending signals and requests into the decision. Returns the reason
    // decided during this call, None when nothing changed.
    StopReason poll();

    bool stopping() const;
    StopReason reason() const;
    std::string origin() const;

    // Clears the decision between reload iterations. Pending signals are kept.
    void rearm();

   private:
    void decideLocked(StopReason reason, std::string origin);

    SignalFlags* flags_;
    StopHook stopHook_;

    mutable std::mutex mutex_;
    StopReason requested_ = StopReason::None;
    std::string requestedOrigin_;
    StopReason decided_ = StopReason::None;
    std::string decidedOrigin_;
};

}  // namespace daemon_core
