#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunkyard
{

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // strftime-style formatting in UTC.
    std::string format_utc(TimePoint time, const char *pattern);

    // "2024-05-01T12:30:00.250Z"
    std::string format_iso8601(TimePoint time);

    // Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z".
    std::optional<TimePoint> parse_iso8601(std::string_view text);

    std::int64_t to_unix_millis(TimePoint time) noexcept;
    TimePoint from_unix_millis(std::int64_t millis) noexcept;

} // namespace chunkyard
