#pragma once

#include "types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace concord
{

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    /** Source of "now". Injectable so expiry can be driven deterministically. */
    using NowFn = std::function<TimePoint()>;

    inline TimePoint system_now()
    {
        return Clock::now();
    }

    /** Format as ISO 8601 UTC with millisecond precision (2025-01-31T12:00:00.000Z) */
    std::string to_iso8601(TimePoint tp);

    /** Parse the format produced by to_iso8601 (milliseconds optional) */
    Result<TimePoint> parse_iso8601(std::string_view s);

} // namespace concord
