#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

namespace daemon_core {

// What a running daemon records in its lock file
struct LockHolder {
    pid_t pid = 0;
    std::string controlEndpoint;  // empty when the holder did not record one
};

/**
 * @brief Single-instance guard for castgrid_daemon.
 *
 * Holds an exclusive flock() on the PID file and writes "<pid>\n<control endpoint>\n"
 * into it, so a second start can tell the operator where the running daemon
 * listens. A file left by a dead process is taken over; the file is unlinked on
 * release.
 */
class PidLock {
   public:
    static std::optional<PidLock> tryAcquire(const std::string& path,
                                             const std::string& controlEndpoint,
                                             std::string& error);

    static std::optional<LockHolder> readHolder(const std::string& path);

    PidLock(const PidLock&) = delete;
    PidLock& operator=(const PidLock&) = delete;

    PidLock(PidLock&& other) noexcept;
    PidLock& operator=(PidLock&& other) noexcept;

    ~PidLock();

    const std::string& path() const {
        return path_;
    }

   private:
    PidLock(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

    void release() noexcept;

    std::string path_;
    int fd_ = -1;
};

}  // namespace daemon_core
