#pragma once

#include "EventRegistry.h"
#include "JobScheduler.h"
#include "calendar/CalendarEvent.h"
#include "config/Config.h"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace scheduling {

inline constexpr std::chrono::minutes kCallLeadTime{1};
inline constexpr const char* kDefaultEventName = "Upcoming Event";

// Per-event decision: dedup, phone extraction, start validation, call time,
// past-time guard, submission, then registry update.
class SchedulingPipeline {
public:
    enum class Outcome { Scheduled, AlreadyScheduled, NoPhone, AllDay, PastCallTime, SubmitFailed };

    SchedulingPipeline(EventRegistry& registry, JobScheduler& scheduler, JobScheduler::Handler on_fire,
                       config::Config::DedupPolicy policy = config::Config::DedupPolicy::ID_ONLY,
                       calendar::NowFn now = calendar::Clock::now);

    Outcome process(const calendar::CalendarEvent& event);

    // Whether `event` (in its current form) already produced a job.
    bool is_scheduled(const calendar::CalendarEvent& event) const;

    static calendar::Clock::time_point call_time_for(calendar::Clock::time_point start);
    static const char* outcome_name(Outcome o);

private:
    std::string dedup_key(const calendar::CalendarEvent& event, const std::optional<std::string>& phone) const;

    EventRegistry& registry_;
    JobScheduler& scheduler_;
    JobScheduler::Handler on_fire_;
    config::Config::DedupPolicy policy_;
    calendar::NowFn now_;
    // Poll cycles and manual checks may overlap.
    std::mutex mu_;
};

}
