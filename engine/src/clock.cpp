#include "branch_engine/clock.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <chrono>
#include <cstdlib>
#include <ctime>

namespace branch {

Clock system_clock(int utcOffsetMinutes) {
    Clock c;
    c.nowMillis = [] {
        using namespace std::chrono;
        return static_cast<std::int64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    };
    c.utcOffsetMinutes = utcOffsetMinutes;
    return c;
}

Clock fixed_clock(std::int64_t millis, int utcOffsetMinutes) {
    Clock c;
    c.nowMillis = [millis] { return millis; };
    c.utcOffsetMinutes = utcOffsetMinutes;
    return c;
}

std::string iso_timestamp(std::int64_t millis, int utcOffsetMinutes) {
    std::time_t local = static_cast<std::time_t>(millis / 1000) + static_cast<std::time_t>(utcOffsetMinutes) * 60;
    std::tm tm{};
    gmtime_r(&local, &tm);
    const char sign = utcOffsetMinutes < 0 ? '-' : '+';
    const int offset = std::abs(utcOffsetMinutes);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}{}{:02}:{:02}", tm, sign, offset / 60, offset % 60);
}

std::string iso_timestamp(const Clock& clock) {
    return iso_timestamp(clock.nowMillis(), clock.utcOffsetMinutes);
}

} // namespace branch
