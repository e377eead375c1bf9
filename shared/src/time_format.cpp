#include "chunkyard/time_format.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chunkyard
{

    namespace
    {
        std::tm to_utc_tm(TimePoint time)
        {
            const auto seconds = Clock::to_time_t(time);
            std::tm tm{};
            gmtime_r(&seconds, &tm);
            return tm;
        }
    } // namespace

    std::string format_utc(TimePoint time, const char *pattern)
    {
        const auto tm = to_utc_tm(time);
        std::array<char, 64> buffer{};
        const auto written = std::strftime(buffer.data(), buffer.size(), pattern, &tm);
        return std::string(buffer.data(), written);
    }

    std::string format_iso8601(TimePoint time)
    {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
        std::array<char, 8> fraction{};
        std::snprintf(fraction.data(), fraction.size(), ".%03d", static_cast<int>(millis < 0 ? millis + 1000 : millis));
        return format_utc(time, "%Y-%m-%dT%H:%M:%S") + fraction.data() + "Z";
    }

    std::optional<TimePoint> parse_iso8601(std::string_view text)
    {
        std::tm tm{};
        std::istringstream input{std::string(text)};
        input >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (input.fail())
        {
            return std::nullopt;
        }
        std::int64_t millis = 0;
        if (input.peek() == '.')
        {
            input.get();
            int digits = 0;
            while (std::isdigit(input.peek()))
            {
                const auto digit = input.get() - '0';
                if (digits < 3)
                {
                    millis = millis * 10 + digit;
                }
                ++digits;
            }
            for (; digits < 3; ++digits)
            {
                millis *= 10;
            }
        }
        if (input.get() != 'Z')
        {
            return std::nullopt;
        }
        const auto seconds = timegm(&tm);
        return Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
    }

    std::int64_t to_unix_millis(TimePoint time) noexcept
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    TimePoint from_unix_millis(std::int64_t millis) noexcept
    {
        return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis))};
    }

} // namespace chunkyard
