#include "core/clock.h"

#include <ctime>

namespace castgrid {

NowProvider systemNowProvider() {
    return []() { return std::chrono::system_clock::now(); };
}

int64_t toUnixMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

std::string formatIso8601(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        return {};
    }
    return buf;
}

}  // namespace castgrid
