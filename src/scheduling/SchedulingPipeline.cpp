#include "SchedulingPipeline.h"
#include "auth/Crypto.h"
#include "calendar/TimeUtil.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include "phone/PhoneExtractor.h"
#include <stdexcept>

namespace scheduling {

using calendar::CalendarEvent;
using calendar::Clock;

SchedulingPipeline::SchedulingPipeline(EventRegistry& registry, JobScheduler& scheduler, JobScheduler::Handler on_fire,
                                       config::Config::DedupPolicy policy, calendar::NowFn now)
    : registry_(registry), scheduler_(scheduler), on_fire_(std::move(on_fire)), policy_(policy), now_(std::move(now)) {}

Clock::time_point SchedulingPipeline::call_time_for(Clock::time_point start) {
    return start - kCallLeadTime;
}

const char* SchedulingPipeline::outcome_name(Outcome o) {
    switch (o) {
        case Outcome::Scheduled: return "scheduled";
        case Outcome::AlreadyScheduled: return "already_scheduled";
        case Outcome::NoPhone: return "no_phone";
        case Outcome::AllDay: return "all_day";
        case Outcome::PastCallTime: return "past_call_time";
        case Outcome::SubmitFailed: return "submit_failed";
    }
    return "unknown";
}

std::string SchedulingPipeline::dedup_key(const CalendarEvent& event, const std::optional<std::string>& phone) const {
    if (policy_ == config::Config::DedupPolicy::ID_ONLY) return event.id;
    std::string content = (event.start ? calendar::format_iso_z(*event.start) : std::string()) + "|" + phone.value_or(std::string());
    return event.id + "#" + auth::sha256_hex(content);
}

bool SchedulingPipeline::is_scheduled(const CalendarEvent& event) const {
    if (policy_ == config::Config::DedupPolicy::ID_ONLY) return registry_.is_scheduled(event.id);
    return registry_.is_scheduled(dedup_key(event, phone::extract_phone_number(event.description)));
}

static SchedulingPipeline::Outcome skip(const CalendarEvent& event, SchedulingPipeline::Outcome o) {
    const char* reason = SchedulingPipeline::outcome_name(o);
    observability::log_info("pipeline.skip", {{"event_id", event.id}, {"reason", std::string(reason)}});
    observability::Metrics::instance().count("pipeline_skips_total", "reason", reason);
    return o;
}

SchedulingPipeline::Outcome SchedulingPipeline::process(const CalendarEvent& event) {
    std::lock_guard lock(mu_);
    const bool id_only = policy_ == config::Config::DedupPolicy::ID_ONLY;
    if (id_only && registry_.is_scheduled(event.id)) return skip(event, Outcome::AlreadyScheduled);

    auto phone = phone::extract_phone_number(event.description);
    if (!phone) return skip(event, Outcome::NoPhone);

    if (!event.start) return skip(event, Outcome::AllDay);

    // Content keys need the phone and start time, so that check happens here.
    std::string key = dedup_key(event, phone);
    if (!id_only && registry_.is_scheduled(key)) return skip(event, Outcome::AlreadyScheduled);

    auto call_time = call_time_for(*event.start);
    if (call_time <= now_()) return skip(event, Outcome::PastCallTime);

    ScheduledCallJob job;
    job.run_at = call_time;
    job.meeting_phone = *phone;
    job.event_name = event.summary && !event.summary->empty() ? *event.summary : std::string(kDefaultEventName);
    job.event_id = event.id;
    try {
        scheduler_.submit(call_time, job, on_fire_);
    } catch (const std::exception& e) {
        observability::log_error("pipeline.submit_failed", {{"event_id", event.id}, {"err", std::string(e.what())}});
        observability::Metrics::instance().count("pipeline_skips_total", "reason", outcome_name(Outcome::SubmitFailed));
        return Outcome::SubmitFailed;
    }
    registry_.mark_scheduled(key);

    observability::log_info("pipeline.scheduled", {
        {"event_id", event.id},
        {"event_name", job.event_name},
        {"meeting_phone", job.meeting_phone},
        {"call_time", calendar::format_iso_z(call_time)},
    });
    observability::Metrics::instance().count("calls_scheduled_total");
    return Outcome::Scheduled;
}

}
