#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace calendar {

using Clock = std::chrono::system_clock;
using NowFn = std::function<Clock::time_point()>;

struct CalendarEvent {
    std::string id;
    std::optional<std::string> summary;
    std::optional<std::string> description;
    // Absent for all-day events.
    std::optional<Clock::time_point> start;
    // "YYYY-MM-DD" for all-day events, display only.
    std::optional<std::string> start_date;
};

}
