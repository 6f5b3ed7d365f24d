#include "daemon/core/pid_lock.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace daemon_core {
namespace {

std::string describeErrno(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

bool writeAll(int fd, const std::string& content) {
    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t n = ::write(fd, content.data() + offset, content.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace

std::optional<LockHolder> PidLock::readHolder(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    LockHolder holder;
    if (!(in >> holder.pid) || holder.pid <= 0) {
        return std::nullopt;
    }
    in >> std::ws;
    std::getline(in, holder.controlEndpoint);
    return holder;
}

std::optional<PidLock> PidLock::tryAcquire(const std::string& path,
                                           const std::string& controlEndpoint,
                                           std::string& error) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = describeErrno("cannot open PID file", path);
        return std::nullopt;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        if (errno == EWOULDBLOCK) {
            auto holder = readHolder(path);
            error = "castgrid_daemon is already running";
            if (holder) {
                error += " (PID " + std::to_string(holder->pid);
                if (!holder->controlEndpoint.empty()) {
                    error += ", control " + holder->controlEndpoint;
                }
                error += ")";
            }
        } else {
            error = describeErrno("cannot lock PID file", path);
        }
        ::close(fd);
        return std::nullopt;
    }

    // The lock is ours from here; a stale pid from a crashed run gets overwritten
    std::string content = std::to_string(::getpid()) + "\n" + controlEndpoint + "\n";
    if (::ftruncate(fd, 0) < 0 || !writeAll(fd, content) || ::fsync(fd) < 0) {
        error = describeErrno("cannot write PID file", path);
        ::unlink(path.c_str());
        ::close(fd);
        return std::nullopt;
    }
    return PidLock(path, fd);
}

PidLock::PidLock(PidLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)) {}

PidLock& PidLock::operator=(PidLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

PidLock::~PidLock() {
    release();
}

void PidLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    // Unlink before unlocking: a daemon starting right now must not lock a file we are about to remove
    ::unlink(path_.c_str());
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

}  // namespace daemon_core
