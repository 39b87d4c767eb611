#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace calendar {

// RFC 3339 date-time: "2024-01-01T10:00:00Z", "2024-01-01T10:00:00.250-05:00".
// Fractional seconds are truncated to whole seconds.
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& s);

// "2024-01-01T09:59:00Z"
std::string format_iso_z(std::chrono::system_clock::time_point tp);

}
