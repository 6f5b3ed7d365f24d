#include "daemon/app/process_resources.h"

#include "logging/logger.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace daemon_app {
namespace {

void addParent(const std::string& path, std::vector<std::string>& dirs) {
    if (path.empty()) {
        return;
    }
    std::string parent = std::filesystem::path(path).parent_path().string();
    if (parent.empty() || std::find(dirs.begin(), dirs.end(), parent) != dirs.end()) {
        return;
    }
    dirs.push_back(parent);
}

}  // namespace

std::vector<std::string> ProcessResources::runtimeDirectories(const Options& options) {
    std::vector<std::string> dirs;
    addParent(options.pidFilePath, dirs);
    addParent(options.statsFilePath, dirs);
    constexpr const char* kIpcScheme = "ipc://";
    if (options.controlEndpoint.starts_with(kIpcScheme)) {
        addParent(options.controlEndpoint.substr(std::char_traits<char>::length(kIpcScheme)),
                  dirs);
    }
    return dirs;
}

std::optional<ProcessResources> ProcessResources::acquire(const Options& options) {
    for (const auto& dir : runtimeDirectories(options)) {
        std::error_code ec;
        if (std::filesystem::create_directories(dir, ec)) {
            LOG_INFO("Created runtime directory {}", dir);
        } else if (ec) {
            // The lock attempt below reports the failure that matters
            LOG_WARN("Cannot create runtime directory {}: {}", dir, ec.message());
        }
    }

    std::string error;
    auto pidLock =
        daemon_core::PidLock::tryAcquire(options.pidFilePath, options.controlEndpoint, error);
    if (!pidLock) {
        LOG_ERROR("{}", error);
        return std::nullopt;
    }
    LOG_DEBUG("PID lock acquired: {}", pidLock->path());

    daemon_metrics::StatsFile statsFile(options.statsFilePath);
    statsFile.removeIfExists();

    return ProcessResources(std::move(*pidLock), std::move(statsFile));
}

ProcessResources::ProcessResources(daemon_core::PidLock pidLock,
                                   daemon_metrics::StatsFile statsFile)
    : pidLock_(std::move(pidLock)), statsFile_(std::move(statsFile)) {}

ProcessResources::~ProcessResources() {
    statsFile_.removeIfExists();
}

}  // namespace daemon_app
