#include "CalendarPoller.h"
#include "TimeUtil.h"
#include "common/Errors.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"

using namespace calendar;

CalendarPoller::CalendarPoller(boost::asio::io_context& ioc, boost::asio::thread_pool& workers, CalendarSource& source,
                               scheduling::SchedulingPipeline& pipeline, std::chrono::seconds interval, std::chrono::seconds window)
    : workers_(workers), timer_(boost::asio::make_strand(ioc)), source_(source), pipeline_(pipeline), interval_(interval), window_(window) {
    if (window_ <= interval_) {
        observability::log_warn("poll.window_not_overlapping", {{"interval_sec", int64_t(interval_.count())}, {"window_sec", int64_t(window_.count())}});
    }
}

CalendarPoller::~CalendarPoller() {
    running_ = false;
    boost::system::error_code ec; timer_.cancel(ec);
}

void CalendarPoller::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    auto self = shared_from_this();
    boost::asio::post(timer_.get_executor(), [self]{
        self->next_tick_ = std::chrono::steady_clock::now();
        self->tick();
    });
}

void CalendarPoller::stop() {
    auto self = shared_from_this();
    boost::asio::post(timer_.get_executor(), [self]{
        self->running_ = false;
        boost::system::error_code ec; self->timer_.cancel(ec);
    });
}

void CalendarPoller::tick() {
    if (!running_) return;
    schedule_next_tick();
    if (in_flight_.exchange(true)) {
        observability::log_warn("poll.skipped_in_flight");
        return;
    }
    auto self = shared_from_this();
    boost::asio::post(workers_, [self]{
        self->run_cycle();
        self->in_flight_ = false;
    });
}

void CalendarPoller::schedule_next_tick() {
    auto self = shared_from_this();
    next_tick_ += interval_;
    timer_.expires_at(next_tick_);
    timer_.async_wait([self](const boost::system::error_code& ec){ if (!ec) self->tick(); });
}

void CalendarPoller::run_cycle() {
    observability::log_info("poll.cycle_start", {{"ts", format_iso_z(Clock::now())}});
    try {
        auto report = run_once();
        observability::log_info("poll.cycle_done", {
            {"fetched", int64_t(report.fetched)},
            {"scheduled", int64_t(report.scheduled)},
            {"skipped", int64_t(report.skipped)},
        });
    } catch (const common::CredentialError& e) {
        observability::log_error("poll.credential_error", {{"err", std::string(e.what())}});
        observability::Metrics::instance().count("poll_failures_total", "kind", "credential");
    } catch (const common::TransportError& e) {
        observability::log_error("poll.transport_error", {{"err", std::string(e.what())}, {"status", int64_t(e.status)}});
        observability::Metrics::instance().count("poll_failures_total", "kind", "transport");
    } catch (const std::exception& e) {
        observability::log_error("poll.failed", {{"err", std::string(e.what())}});
        observability::Metrics::instance().count("poll_failures_total", "kind", "other");
    }
}

std::vector<CalendarEvent> CalendarPoller::fetch_upcoming() {
    return source_.fetch_upcoming(window_);
}

PollReport CalendarPoller::run_once() {
    PollReport report;
    auto events = fetch_upcoming();
    report.fetched = events.size();
    for (const auto& ev : events) {
        if (pipeline_.process(ev) == scheduling::SchedulingPipeline::Outcome::Scheduled) ++report.scheduled;
        else ++report.skipped;
    }
    return report;
}
