#pragma once

#include "daemon/core/graceful_shutdown.h"

#include <chrono>
#include <functional>
#include <string>

namespace daemon_core {

/**
 * @brief Process lifecycle around the daemon's main loop.
 *
 * Owns the StopController wired to the process signal flags, tells systemd
 * about readiness, liveness and stopping (when built with HAVE_SYSTEMD), and
 * drains in-flight device work before components are torn down.
 */
class ShutdownManager {
   public:
    struct Dependencies {
        // Reports whether device operations are still in flight
        std::function<bool()> operationsPending;
        // Called once per stop decision; components stop accepting new work
        std::function<void(StopReason)> beginDrain;
        std::chrono::milliseconds drainTimeout{5000};
    };

    explicit ShutdownManager(Dependencies deps);

    void installSignalHandlers();

    StopController& controller() {
        return controller_;
    }

    void notifyReady(const std::string& status);

    // One main-loop tick. False once the current iteration should end.
    bool tick();

    bool reloadRequested() const {
        return controller_.reason() == StopReason::Reload;
    }

    // Waits for pending work up to drainTimeout; runs once per iteration.
    // Returns false when the wait timed out.
    bool drain();

    // Between reload iterations
    void rearm();

   private:
    void notifySystemd(const std::string& message);

    Dependencies deps_;
    StopController controller_;
    bool ready_ = false;
    bool drained_ = false;
};

}  // namespace daemon_core
