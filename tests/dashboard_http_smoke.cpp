#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio/thread_pool.hpp>
#include "calendar/CalendarPoller.h"
#include "common/Errors.h"
#include "net/HttpServer.h"
#include "net/Router.h"
#include "web/Dashboard.h"
#include "http_test_util.h"
#include "test_fakes.h"
#include "test_util.h"

using calendar::Clock;

static bool contains(const std::string& hay, const std::string& needle) { return hay.find(needle) != std::string::npos; }

static int run_checks(unsigned short port, FakeCalendarSource& source, scheduling::EventRegistry& registry) {
    {
        auto r = get(port, "/health");
        if (r.status != 200 || r.body != "{\"status\":\"ok\"}") { std::cerr << "health mismatch: " << r.status << " " << r.body << "\n"; return 1; }
    }
    {
        auto r = get(port, "/twilio-webhook?meeting_phone=555-123-4567&event_name=Standup");
        if (r.status != 200 || r.content_type.rfind("text/xml", 0) != 0) { std::cerr << "webhook status/type mismatch: " << r.status << " " << r.content_type << "\n"; return 1; }
        if (!contains(r.body, "Standup") || !contains(r.body, ">555-123-4567</Dial>")) { std::cerr << "webhook body mismatch:\n" << r.body; return 1; }
    }
    {
        auto r = request(port, "POST", "/twilio-webhook?meeting_phone=555-123-4567",
                         "CallSid=CA1&event_name=Board+Review&meeting_phone=999", "application/x-www-form-urlencoded");
        if (r.status != 200 || !contains(r.body, "upcoming event: Board Review.")) { std::cerr << "form body fallback failed:\n" << r.body; return 1; }
        if (!contains(r.body, ">555-123-4567</Dial>")) { std::cerr << "query should win over form body\n"; return 1; }
    }
    {
        auto r = get(port, "/twilio-webhook");
        if (r.status != 200 || !contains(r.body, "Upcoming Event") || !contains(r.body, "</Response>")) { std::cerr << "bare webhook not robust\n"; return 1; }
    }
    {
        auto nf = get(port, "/nope");
        if (nf.status != 404) { std::cerr << "expected 404 got " << nf.status << "\n"; return 1; }
        auto na = request(port, "POST", "/health");
        if (na.status != 405) { std::cerr << "expected 405 got " << na.status << "\n"; return 1; }
    }
    {
        auto r = get(port, "/force-check");
        if (r.status != 303 || r.location != "/") { std::cerr << "force-check should redirect, got " << r.status << " " << r.location << "\n"; return 1; }
        if (registry.size() != 1) { std::cerr << "force-check should schedule one call, registry=" << registry.size() << "\n"; return 1; }

        auto page = get(port, "/");
        if (page.status != 200 || page.content_type.rfind("text/html", 0) != 0) { std::cerr << "index status/type mismatch\n"; return 1; }
        if (!contains(page.body, "Checked 2 events, scheduled 1 new calls.")) { std::cerr << "flash missing:\n" << page.body; return 1; }
        if (!contains(page.body, "Scheduled calls: 1")) { std::cerr << "scheduled count missing\n"; return 1; }
        if (!contains(page.body, "Standup") || !contains(page.body, "555-123-4567") || !contains(page.body, "R&amp;D")) { std::cerr << "events not listed:\n" << page.body; return 1; }

        auto again = get(port, "/");
        if (contains(again.body, "Checked 2 events")) { std::cerr << "flash should show once\n"; return 1; }
    }
    {
        source.fail = [] { throw common::CredentialError("Google Calendar credentials not found."); };
        auto page = get(port, "/");
        if (page.status != 200 || !contains(page.body, "credentials not found")) { std::cerr << "credential error not shown:\n" << page.body; return 1; }
        auto r = get(port, "/force-check");
        if (r.status != 303) { std::cerr << "failed force-check should still redirect\n"; return 1; }
        auto after = get(port, "/");
        if (!contains(after.body, "Calendar credentials problem")) { std::cerr << "failure flash missing\n"; return 1; }
    }
    {
        // A calendar fetch that hangs must not hold the only HTTP thread.
        Waiter entered, release;
        source.fail = [&] {
            entered.notify();
            release.wait_for(1, std::chrono::seconds(10));
        };
        HttpReply slow;
        std::thread slow_client([&] {
            try { slow = get(port, "/"); } catch (const std::exception& e) { std::cerr << "slow index failed: " << e.what() << "\n"; }
        });
        bool live = false;
        if (entered.wait_for(1, std::chrono::seconds(5))) {
            auto started = std::chrono::steady_clock::now();
            auto hook = get(port, "/twilio-webhook?meeting_phone=555-123-4567");
            auto health = get(port, "/health");
            live = hook.status == 200 && health.status == 200 &&
                   std::chrono::steady_clock::now() - started < std::chrono::seconds(2);
        }
        release.notify();
        slow_client.join();
        source.fail = nullptr;
        if (!live) { std::cerr << "webhook stalled behind a slow calendar fetch\n"; return 1; }
        if (slow.status != 200) { std::cerr << "slow index should still answer, got " << slow.status << "\n"; return 1; }
    }
    {
        auto m = get(port, "/metrics");
        if (m.status != 200 || !contains(m.body, "http_requests_total{path=\"/twilio-webhook\"")) { std::cerr << "metrics missing webhook requests\n"; return 1; }
    }
    return 0;
}

int main() {
    boost::asio::io_context io;
    boost::asio::thread_pool workers(2);

    FakeTelephonyProvider provider;
    scheduling::EventRegistry registry;
    ManualJobScheduler jobs;
    scheduling::SchedulingPipeline pipeline(registry, jobs, [](const scheduling::ScheduledCallJob&) {});
    FakeCalendarSource source;
    auto start = Clock::now() + std::chrono::minutes(30);
    source.events.push_back(make_event("e1", std::string("Standup"), std::string("dial 555-123-4567"), start));
    source.events.push_back(make_event("e2", std::string("R&D sync"), std::nullopt, start));
    auto poller = std::make_shared<calendar::CalendarPoller>(io, workers, source, pipeline, std::chrono::seconds(300), std::chrono::seconds(3600));

    telephony::BridgeResponder responder("+15550000002");
    web::Dashboard dashboard(*poller, pipeline, registry, responder, workers);
    Router router;
    dashboard.register_routes(router, true);
    HttpServer server(io, 0, router, true, false, "127.0.0.1");
    server.run();
    unsigned short port = server.port();
    std::thread io_thread([&io] { io.run(); });

    int rc = 1;
    try {
        rc = run_checks(port, source, registry);
    } catch (const std::exception& e) {
        std::cerr << "request failed: " << e.what() << "\n";
    }

    io.stop();
    io_thread.join();
    workers.join();
    if (rc != 0) return rc;
    std::cout << "dashboard_http_smoke ok\n";
    return 0;
}
