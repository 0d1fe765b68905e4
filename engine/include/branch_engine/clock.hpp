#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace branch {

// Time source for node/document timestamps and synthetic placeholder ids.
struct Clock {
    std::function<std::int64_t()> nowMillis; // milliseconds since the Unix epoch
    int utcOffsetMinutes = 480;              // timestamps are rendered in this fixed zone
};

Clock system_clock(int utcOffsetMinutes = 480);
Clock fixed_clock(std::int64_t millis, int utcOffsetMinutes = 480);

// ISO 8601 with seconds precision and explicit offset, e.g. 2025-03-01T20:15:07+08:00
std::string iso_timestamp(const Clock& clock);
std::string iso_timestamp(std::int64_t millis, int utcOffsetMinutes);

} // namespace branch
