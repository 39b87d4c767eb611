#include "Dashboard.h"
#include "calendar/TimeUtil.h"
#include "common/Errors.h"
#include "net/UrlCodec.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include "phone/PhoneExtractor.h"
#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <sstream>

namespace http = boost::beast::http;

namespace web {

using telephony::xml_escape;

static Response make_response(const Request& req, http::status st, const char* content_type, std::string body) {
    Response res{st, req.version()};
    res.set(http::field::content_type, content_type);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::unordered_map<std::string, std::string> request_params(const Request& req) {
    auto params = parse_query(std::string(req.target()));
    std::string ct(req[http::field::content_type]);
    if (req.method() == http::verb::post && ct.rfind("application/x-www-form-urlencoded", 0) == 0) {
        for (auto& kv : parse_query(req.body())) params.emplace(kv.first, kv.second);
    }
    return params;
}

Dashboard::Dashboard(calendar::CalendarPoller& poller, scheduling::SchedulingPipeline& pipeline,
                     scheduling::EventRegistry& registry, telephony::BridgeResponder& responder,
                     boost::asio::thread_pool& blocking)
    : poller_(poller), pipeline_(pipeline), registry_(registry), responder_(responder), blocking_(blocking) {}

void Dashboard::offload(const Request& req, Router::Reply reply, Response (Dashboard::*fn)(const Request&)) {
    boost::asio::post(blocking_, [this, req, reply = std::move(reply), fn] {
        Response res;
        try {
            res = (this->*fn)(req);
        } catch (const std::exception& e) {
            observability::log_error("dashboard.handler_failed", {{"path", strip_query(std::string(req.target()))}, {"err", std::string(e.what())}});
            res = make_response(req, http::status::internal_server_error, "application/json; charset=utf-8", "{\"error\":\"internal\"}");
        }
        reply(std::move(res));
    });
}

void Dashboard::register_routes(Router& router, bool metrics_enabled) {
    router.add_async_route("GET", "/", [this](const Request& req, Router::Reply reply) {
        offload(req, std::move(reply), &Dashboard::index);
    });
    router.add_async_route("GET", "/force-check", [this](const Request& req, Router::Reply reply) {
        offload(req, std::move(reply), &Dashboard::force_check);
    });
    router.add_route("GET", "/twilio-webhook", [this](const Request& req) { return webhook(req); });
    router.add_route("POST", "/twilio-webhook", [this](const Request& req) { return webhook(req); });
    router.add_route("GET", "/health", [](const Request& req) {
        return make_response(req, http::status::ok, "application/json; charset=utf-8", "{\"status\":\"ok\"}");
    });
    if (metrics_enabled) {
        router.add_route("GET", "/metrics", [](const Request& req) {
            return make_response(req, http::status::ok, "text/plain; version=0.0.4", observability::Metrics::instance().scrape());
        });
    }
}

Response Dashboard::index(const Request& req) {
    std::vector<calendar::CalendarEvent> events;
    std::string error;
    try {
        events = poller_.fetch_upcoming();
    } catch (const common::CredentialError& e) {
        error = e.what();
        observability::log_warn("dashboard.credential_error", {{"err", error}});
    } catch (const std::exception& e) {
        error = std::string("Could not load events: ") + e.what();
        observability::log_error("dashboard.fetch_failed", {{"err", std::string(e.what())}});
    }

    std::ostringstream ss;
    ss << "<!DOCTYPE html>\n<html>\n<head><meta charset=\"utf-8\"><title>Meeting Dialer</title></head>\n<body>\n";
    ss << "<h1>Upcoming events</h1>\n";
    if (auto msg = flash_.take()) ss << "<p class=\"flash\">" << xml_escape(*msg) << "</p>\n";
    if (!error.empty()) ss << "<p class=\"error\">" << xml_escape(error) << "</p>\n";
    ss << "<p>Scheduled calls: " << registry_.size() << "</p>\n";
    ss << "<p><a href=\"/force-check\">Check now</a></p>\n";
    if (events.empty() && error.empty()) ss << "<p>No upcoming events.</p>\n";
    if (!events.empty()) {
        ss << "<table>\n<tr><th>Start</th><th>Event</th><th>Phone</th><th>Scheduled</th></tr>\n";
        for (const auto& ev : events) {
            std::string start = ev.start ? calendar::format_iso_z(*ev.start) : ev.start_date.value_or(std::string()) + " (all day)";
            auto phone = phone::extract_phone_number(ev.description);
            ss << "<tr><td>" << xml_escape(start) << "</td>"
               << "<td>" << xml_escape(ev.summary && !ev.summary->empty() ? *ev.summary : std::string(scheduling::kDefaultEventName)) << "</td>"
               << "<td>" << xml_escape(phone.value_or("-")) << "</td>"
               << "<td>" << (pipeline_.is_scheduled(ev) ? "yes" : "no") << "</td></tr>\n";
        }
        ss << "</table>\n";
    }
    ss << "</body>\n</html>\n";
    return make_response(req, http::status::ok, "text/html; charset=utf-8", ss.str());
}

Response Dashboard::force_check(const Request& req) {
    try {
        auto report = poller_.run_once();
        flash_.set("Checked " + std::to_string(report.fetched) + " events, scheduled " + std::to_string(report.scheduled) + " new calls.");
        observability::log_info("dashboard.force_check", {{"fetched", int64_t(report.fetched)}, {"scheduled", int64_t(report.scheduled)}});
    } catch (const common::CredentialError& e) {
        flash_.set(std::string("Calendar credentials problem: ") + e.what());
        observability::log_warn("dashboard.force_check_failed", {{"kind", std::string("credential")}, {"err", std::string(e.what())}});
    } catch (const std::exception& e) {
        flash_.set(std::string("Check failed: ") + e.what());
        observability::log_error("dashboard.force_check_failed", {{"kind", std::string("other")}, {"err", std::string(e.what())}});
    }
    Response res{http::status::see_other, req.version()};
    res.set(http::field::location, "/");
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

Response Dashboard::webhook(const Request& req) const {
    return make_response(req, http::status::ok, "text/xml; charset=utf-8", responder_.respond(request_params(req)));
}

}
