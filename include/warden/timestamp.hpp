#pragma once

#include "types.hpp"
#include <chrono>
#include <string>

namespace warden
{
    using Clock = std::chrono::system_clock;
    using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

    /** Current time truncated to microsecond precision */
    Timestamp now_utc();

    /** ISO 8601 UTC with microseconds and explicit offset, e.g. 2026-10-19T08:30:00.123456+00:00 */
    std::string format_iso8601(Timestamp ts);

    /**
     * Parse an ISO 8601 date-time. Accepts an optional fractional part and a
     * 'Z', +HH:MM or -HH:MM suffix; a missing offset is read as UTC.
     */
    Result<Timestamp> parse_iso8601(const std::string &text);

} // namespace warden
