#include "daemon/metrics/stats_file.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace daemon_metrics {

StatsFile::StatsFile(std::string path, castgrid::NowProvider now)
    : path_(std::move(path)), now_(std::move(now)), startedAt_(now_()) {}

StatsFile::StatsFile(StatsFile&& other) noexcept
    : path_(std::exchange(other.path_, {})),
      now_(std::move(other.now_)),
      startedAt_(other.startedAt_),
      sequence_(std::exchange(other.sequence_, 0)) {}

StatsFile& StatsFile::operator=(StatsFile&& other) noexcept {
    if (this != &other) {
        path_ = std::exchange(other.path_, {});
        now_ = std::move(other.now_);
        startedAt_ = other.startedAt_;
        sequence_ = std::exchange(other.sequence_, 0);
    }
    return *this;
}

bool StatsFile::write(const nlohmann::json& stats, std::string& error) {
    if (path_.empty()) {
        error = "stats file path is empty";
        return false;
    }

    castgrid::Timestamp now = now_();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - startedAt_);
    nlohmann::json document = {
        {"schema_version", kSchemaVersion},
        {"pid", static_cast<int64_t>(::getpid())},
        {"sequence", sequence_ + 1},
        {"started_at", castgrid::formatIso8601(startedAt_)},
        {"updated_at", castgrid::toUnixMillis(now)},
        {"uptime_seconds", std::max<int64_t>(0, uptime.count())},
        {"stats", stats.is_null() ? nlohmann::json::object() : stats},
    };

    // Per-process temp name: a second daemon probing the same path must not clobber it
    const std::string tmpPath = path_ + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            error = "cannot open " + tmpPath + ": " + std::strerror(errno);
            return false;
        }
        out << document.dump(2) << '\n';
        out.flush();
        if (!out) {
            error = "short write to " + tmpPath;
            out.close();
            std::error_code ignored;
            std::filesystem::remove(tmpPath, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path_, ec);
    if (ec) {
        error = "cannot replace " + path_ + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        return false;
    }
    ++sequence_;
    return true;
}

void StatsFile::removeIfExists() const {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

std::optional<nlohmann::json> StatsFile::load(const std::string& path, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return std::nullopt;
    }
    auto document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        error = path + " is not a JSON object";
        return std::nullopt;
    }
    if (document.value("schema_version", 0) != kSchemaVersion) {
        error = path + " has unsupported schema_version";
        return std::nullopt;
    }
    return document;
}

}  // namespace daemon_metrics
