#pragma once

#include "Flash.h"
#include "calendar/CalendarPoller.h"
#include "net/Router.h"
#include "scheduling/EventRegistry.h"
#include "scheduling/SchedulingPipeline.h"
#include "telephony/BridgeResponder.h"
#include <boost/asio/thread_pool.hpp>

namespace web {

// HTTP surface of the dialer: listing page, manual check, the bridge webhook,
// health and metrics. The listing and manual check talk to the calendar, so
// they run on `blocking` and never hold an HTTP thread.
class Dashboard {
public:
    Dashboard(calendar::CalendarPoller& poller, scheduling::SchedulingPipeline& pipeline,
              scheduling::EventRegistry& registry, telephony::BridgeResponder& responder,
              boost::asio::thread_pool& blocking);

    void register_routes(Router& router, bool metrics_enabled);

    Response index(const Request& req);
    Response force_check(const Request& req);
    Response webhook(const Request& req) const;

    Flash& flash() { return flash_; }

private:
    void offload(const Request& req, Router::Reply reply, Response (Dashboard::*fn)(const Request&));

    calendar::CalendarPoller& poller_;
    scheduling::SchedulingPipeline& pipeline_;
    scheduling::EventRegistry& registry_;
    telephony::BridgeResponder& responder_;
    boost::asio::thread_pool& blocking_;
    Flash flash_;
};

// Query parameters, falling back to a form-encoded body for keys the query lacks.
std::unordered_map<std::string, std::string> request_params(const Request& req);

}
