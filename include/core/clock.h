#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace castgrid {

using Timestamp = std::chrono::system_clock::time_point;

// Injected wherever time decisions are made (override expiry, backoff, stall detection)
using NowProvider = std::function<Timestamp()>;

NowProvider systemNowProvider();

int64_t toUnixMillis(Timestamp ts);

// "2024-05-01T12:34:56Z"
std::string formatIso8601(Timestamp ts);

}  // namespace castgrid
