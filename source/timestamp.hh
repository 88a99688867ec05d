// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace gqlc {
    using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    // RFC 3339 date-time: `2024-01-31T12:30:00Z', `2024-01-31T12:30:00.250+02:00'.
    // Fractional seconds beyond milliseconds are truncated.
    bool parseTimestamp(std::string_view text, Timestamp& out);

    // UTC with millisecond precision: `2024-01-31T10:30:00.250Z'
    std::string formatTimestamp(Timestamp ts);
}
