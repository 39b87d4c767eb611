#pragma once

#include "CalendarSource.h"
#include "scheduling/SchedulingPipeline.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

namespace calendar {

struct PollReport {
    std::size_t fetched = 0;
    std::size_t scheduled = 0;
    std::size_t skipped = 0;
};

// Periodically fetches the lookahead window and feeds every event to the
// scheduling pipeline. Fetches run on `workers`; a failed cycle is logged and
// the next tick happens on time.
class CalendarPoller : public std::enable_shared_from_this<CalendarPoller> {
public:
    CalendarPoller(boost::asio::io_context& ioc, boost::asio::thread_pool& workers, CalendarSource& source,
                   scheduling::SchedulingPipeline& pipeline, std::chrono::seconds interval, std::chrono::seconds window);
    ~CalendarPoller();

    // First cycle runs immediately, then every `interval`.
    void start();
    void stop();

    // One synchronous fetch + pipeline pass. Throws common::CredentialError /
    // common::TransportError from the source.
    PollReport run_once();

    // Fetch only, for the listing page.
    std::vector<CalendarEvent> fetch_upcoming();

    std::chrono::seconds window() const { return window_; }

private:
    void tick();
    void schedule_next_tick();
    void run_cycle();

    boost::asio::thread_pool& workers_;
    boost::asio::steady_timer timer_;
    CalendarSource& source_;
    scheduling::SchedulingPipeline& pipeline_;
    std::chrono::seconds interval_;
    std::chrono::seconds window_;
    std::chrono::steady_clock::time_point next_tick_;
    std::atomic_bool running_ = false;
    std::atomic_bool in_flight_ = false;
};

}
