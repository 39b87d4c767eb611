#pragma once

#include "calendar/CalendarEvent.h"
#include <string>

namespace scheduling {

struct ScheduledCallJob {
    calendar::Clock::time_point run_at;
    std::string meeting_phone;
    std::string event_name;
    std::string event_id;
};

}
