#pragma once

#include "core/clock.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace daemon_metrics {

/**
 * @brief Periodic statistics snapshot read by external monitoring.
 *
 * Every write produces a complete document:
 * {
 *   "schema_version": 1, "pid": N, "sequence": N,
 *   "started_at": ISO-8601, "updated_at": unix ms, "uptime_seconds": N,
 *   "stats": { ... }
 * }
 * The file is replaced with rename(2) so a reader never sees a partial write.
 * "sequence" starts at 1 per writer; a reader seeing it drop knows the daemon restarted.
 */
class StatsFile {
   public:
    static constexpr int kSchemaVersion = 1;

    explicit StatsFile(std::string path, castgrid::NowProvider now = castgrid::systemNowProvider());

    StatsFile(const StatsFile&) = delete;
    StatsFile& operator=(const StatsFile&) = delete;
    StatsFile(StatsFile&& other) noexcept;
    StatsFile& operator=(StatsFile&& other) noexcept;

    const std::string& path() const {
        return path_;
    }
    bool enabled() const {
        return !path_.empty();
    }
    uint64_t sequence() const {
        return sequence_;
    }

    bool write(const nlohmann::json& stats, std::string& error);
    void removeIfExists() const;

    // Reads a snapshot back and checks its schema version
    static std::optional<nlohmann::json> load(const std::string& path, std::string& error);

   private:
    std::string path_;
    castgrid::NowProvider now_;
    castgrid::Timestamp startedAt_;
    uint64_t sequence_ = 0;
};

}  // namespace daemon_metrics
