#include <atomic>
#include <iostream>
#include <set>
#include <string>
#include <memory>
#include <thread>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include "calendar/CalendarPoller.h"
#include "common/Errors.h"
#include "observability/Metrics.h"
#include "test_fakes.h"

using calendar::Clock;

int main() {
    boost::asio::io_context io;
    boost::asio::thread_pool workers(2);
    auto& metrics = observability::Metrics::instance();

    scheduling::EventRegistry reg;
    ManualJobScheduler jobs;
    scheduling::SchedulingPipeline pipeline(reg, jobs, [](const scheduling::ScheduledCallJob&) {});
    FakeCalendarSource source;
    auto start = Clock::now() + std::chrono::minutes(30);
    source.events.push_back(make_event("e1", std::string("Standup"), std::string("dial 555-123-4567"), start));
    source.events.push_back(make_event("e2", std::string("Lunch"), std::string("no number"), start));
    source.events.push_back(make_event("e3", std::string("Offsite"), std::string("415-555-0132"), std::nullopt));

    auto poller = std::make_shared<calendar::CalendarPoller>(io, workers, source, pipeline, std::chrono::seconds(1), std::chrono::seconds(3600));

    {
        auto report = poller->run_once();
        if (report.fetched != 3 || report.scheduled != 1 || report.skipped != 2) {
            std::cerr << "report mismatch " << report.fetched << "/" << report.scheduled << "/" << report.skipped << "\n"; return 1;
        }
        if (source.last_window != std::chrono::seconds(3600)) { std::cerr << "lookahead window not passed through\n"; return 1; }
        auto again = poller->run_once();
        if (again.scheduled != 0 || jobs.entries.size() != 1) { std::cerr << "second cycle should not reschedule\n"; return 1; }
    }

    // A periodic cycle and a manual check racing over the same events.
    {
        scheduling::EventRegistry shared_reg;
        ManualJobScheduler shared_jobs;
        scheduling::SchedulingPipeline shared_pipeline(shared_reg, shared_jobs, [](const scheduling::ScheduledCallJob&) {});
        FakeCalendarSource shared_source;
        const int n = 200;
        for (int i = 0; i < n; ++i) {
            shared_source.events.push_back(make_event("ev" + std::to_string(i), std::string("Sync"), std::string("call 555-123-4567"), start));
        }
        auto racing = std::make_shared<calendar::CalendarPoller>(io, workers, shared_source, shared_pipeline,
                                                                 std::chrono::seconds(1), std::chrono::seconds(3600));
        std::atomic<bool> go{false};
        std::atomic<int> scheduled{0};
        auto cycle = [&] {
            while (!go) std::this_thread::yield();
            scheduled += static_cast<int>(racing->run_once().scheduled);
        };
        std::thread periodic(cycle);
        std::thread manual(cycle);
        go = true;
        periodic.join();
        manual.join();
        if (shared_jobs.entries.size() != static_cast<size_t>(n) || shared_reg.size() != static_cast<size_t>(n) || scheduled != n) {
            std::cerr << "overlapping cycles double-scheduled: jobs=" << shared_jobs.entries.size() << " scheduled=" << scheduled << "\n"; return 1;
        }
        bool single = true;
        std::set<std::string> seen;
        for (const auto& e : shared_jobs.entries) single = seen.insert(e.job.event_id).second && single;
        if (!single) { std::cerr << "an event id was scheduled twice\n"; return 1; }
    }

    source.fail = [] { throw common::CredentialError("Google Calendar credentials not found."); };
    {
        bool threw = false;
        try { poller->run_once(); } catch (const common::CredentialError&) { threw = true; }
        if (!threw) { std::cerr << "run_once should propagate CredentialError\n"; return 1; }
    }

    // The timer loop swallows failures and keeps ticking.
    auto before = metrics.counter_value("poll_failures_total", "kind", "credential");
    int calls_before = source.calls;
    poller->start();
    std::thread io_thread([&io] { io.run(); });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (metrics.counter_value("poll_failures_total", "kind", "credential") < before + 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    poller->stop();
    io_thread.join();
    workers.join();

    if (metrics.counter_value("poll_failures_total", "kind", "credential") < before + 2) { std::cerr << "poll loop stopped after a failure\n"; return 1; }
    if (source.calls < calls_before + 2) { std::cerr << "expected repeated cycles\n"; return 1; }

    std::cout << "calendar_poller_unit ok\n";
    return 0;
}
