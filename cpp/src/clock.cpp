#include "concord/clock.hpp"
#include <cstdio>
#include <ctime>

namespace concord
{

    std::string to_iso8601(TimePoint tp)
    {
        auto t = Clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        if (ms.count() < 0)
        {
            ms += std::chrono::milliseconds(1000);
            --t;
        }

        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

    Result<TimePoint> parse_iso8601(std::string_view s)
    {
        std::string buf(s);
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;

        int matched = std::sscanf(buf.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
                                  &year, &month, &day, &hour, &minute, &second, &millis);
        if (matched < 6)
        {
            return std::unexpected(ConcordError::parsing(std::format("Invalid ISO 8601 timestamp: {}", s)));
        }
        if (matched == 6)
            millis = 0;

        std::tm tm_buf{};
        tm_buf.tm_year = year - 1900;
        tm_buf.tm_mon = month - 1;
        tm_buf.tm_mday = day;
        tm_buf.tm_hour = hour;
        tm_buf.tm_min = minute;
        tm_buf.tm_sec = second;

        auto t = timegm(&tm_buf);
        if (t == static_cast<std::time_t>(-1))
        {
            return std::unexpected(ConcordError::parsing(std::format("Timestamp out of range: {}", s)));
        }

        return Clock::from_time_t(t) + std::chrono::milliseconds(millis);
    }

} // namespace concord
