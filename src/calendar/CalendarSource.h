#pragma once

#include "CalendarEvent.h"
#include <chrono>
#include <vector>

namespace calendar {

// Read-only view of a calendar. Implementations throw common::CredentialError
// when credentials are missing or rejected and common::TransportError on
// network or API failures.
class CalendarSource {
public:
    virtual ~CalendarSource() = default;
    // Events starting in [now, now + window), ordered by start time.
    virtual std::vector<CalendarEvent> fetch_upcoming(std::chrono::seconds window) = 0;
};

}
