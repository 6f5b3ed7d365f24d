#pragma once

#include "daemon/core/pid_lock.h"
#include "daemon/metrics/stats_file.h"

#include <optional>
#include <string>
#include <vector>

namespace daemon_app {

/**
 * @brief Files owned by the daemon process rather than by one reload iteration.
 *
 * Holding an instance means this process is the only castgrid daemon on the host:
 * the PID lock is taken, the directories for the lock, the stats snapshot and an
 * ipc:// control socket exist, and any snapshot left behind by a crashed run is gone.
 */
class ProcessResources {
   public:
    struct Options {
        std::string pidFilePath;
        std::string statsFilePath;
        // ipc:// endpoints get their socket directory created; other schemes are ignored
        std::string controlEndpoint;
    };

    static std::optional<ProcessResources> acquire(const Options& options);

    // Parent directories acquire() creates when missing
    static std::vector<std::string> runtimeDirectories(const Options& options);

    ProcessResources(const ProcessResources&) = delete;
    ProcessResources& operator=(const ProcessResources&) = delete;

    ProcessResources(ProcessResources&&) noexcept = default;
    ProcessResources& operator=(ProcessResources&&) noexcept = default;

    ~ProcessResources();

    const daemon_core::PidLock& pidLock() const {
        return pidLock_;
    }
    const daemon_metrics::StatsFile& statsFile() const {
        return statsFile_;
    }

   private:
    ProcessResources(daemon_core::PidLock pidLock, daemon_metrics::StatsFile statsFile);

    daemon_core::PidLock pidLock_;
    daemon_metrics::StatsFile statsFile_;
};

}  // namespace daemon_app
