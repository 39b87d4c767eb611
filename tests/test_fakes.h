#pragma once

#include "calendar/CalendarSource.h"
#include "common/Errors.h"
#include "net/HttpsClient.h"
#include "scheduling/JobScheduler.h"
#include "telephony/TelephonyProvider.h"
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Returns a fixed event list, or throws what `fail` produces.
struct FakeCalendarSource : calendar::CalendarSource {
    std::vector<calendar::CalendarEvent> events;
    std::function<void()> fail;
    std::atomic<int> calls{0};
    std::chrono::seconds last_window{0};

    std::vector<calendar::CalendarEvent> fetch_upcoming(std::chrono::seconds window) override {
        ++calls;
        last_window = window;
        if (fail) fail();
        return events;
    }
};

struct FakeTelephonyProvider : telephony::TelephonyProvider {
    struct Call { std::string to, from, url; };
    std::mutex mu;
    std::vector<Call> calls;
    std::function<void()> fail;

    std::string create_call(const std::string& to, const std::string& from, const std::string& callback_url) override {
        if (fail) fail();
        std::lock_guard<std::mutex> lk(mu);
        calls.push_back({to, from, callback_url});
        return "CA" + std::to_string(calls.size());
    }
};

// Holds submitted jobs until the test fires them. Submissions may come from
// several threads; read `entries` once they are joined.
struct ManualJobScheduler : scheduling::JobScheduler {
    struct Entry { calendar::Clock::time_point run_at; scheduling::ScheduledCallJob job; Handler handler; };
    std::mutex mu;
    std::vector<Entry> entries;
    bool reject = false;

    void submit(calendar::Clock::time_point run_at, scheduling::ScheduledCallJob job, Handler handler) override {
        std::lock_guard<std::mutex> lk(mu);
        if (reject) throw std::runtime_error("scheduler rejected job");
        entries.push_back({run_at, std::move(job), std::move(handler)});
    }

    void fire_all() {
        std::vector<Entry> snapshot;
        {
            std::lock_guard<std::mutex> lk(mu);
            snapshot = entries;
        }
        for (auto& e : snapshot) e.handler(e.job);
    }
};

// Answers queued responses in order and records each request.
struct FakeHttpsClient : HttpsClient {
    std::vector<HttpsRequest> requests;
    std::deque<HttpsResponse> responses;

    void push(int status, std::string body) { responses.push_back({status, std::move(body)}); }

    HttpsResponse send(const HttpsRequest& req) override {
        requests.push_back(req);
        if (responses.empty()) throw common::TransportError("no canned response");
        auto r = responses.front();
        responses.pop_front();
        return r;
    }
};

inline calendar::CalendarEvent make_event(std::string id, std::optional<std::string> summary,
                                          std::optional<std::string> description,
                                          std::optional<calendar::Clock::time_point> start) {
    calendar::CalendarEvent ev;
    ev.id = std::move(id);
    ev.summary = std::move(summary);
    ev.description = std::move(description);
    ev.start = start;
    return ev;
}
