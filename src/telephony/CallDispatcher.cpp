#include "CallDispatcher.h"
#include "auth/CallbackSignature.h"
#include "common/Errors.h"
#include "net/UrlCodec.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"

namespace telephony {

CallDispatcher::CallDispatcher(TelephonyProvider& provider, std::string owner_number, std::string caller_id,
                               std::string app_url, std::string signing_secret)
    : provider_(provider), owner_number_(std::move(owner_number)), caller_id_(std::move(caller_id)),
      app_url_(std::move(app_url)), signing_secret_(std::move(signing_secret)) {
    while (!app_url_.empty() && app_url_.back() == '/') app_url_.pop_back();
}

std::string CallDispatcher::callback_url(const std::string& meeting_phone, const std::string& event_name) const {
    std::string url = app_url_ + "/twilio-webhook?meeting_phone=" + url_encode(meeting_phone) + "&event_name=" + url_encode(event_name);
    if (!signing_secret_.empty()) url += "&sig=" + url_encode(auth::sign_callback(signing_secret_, meeting_phone, event_name));
    return url;
}

std::optional<std::string> CallDispatcher::place_call(const std::string& meeting_phone, const std::string& event_name) {
    auto& metrics = observability::Metrics::instance();
    try {
        std::string sid = provider_.create_call(owner_number_, caller_id_, callback_url(meeting_phone, event_name));
        observability::log_info("dispatch.call_placed", {{"sid", sid}, {"meeting_phone", meeting_phone}, {"event_name", event_name}});
        metrics.count("calls_placed_total");
        return sid;
    } catch (const common::CredentialError& e) {
        observability::log_error("dispatch.failed", {{"kind", std::string("credential")}, {"err", std::string(e.what())}, {"meeting_phone", meeting_phone}});
        metrics.count("call_dispatch_failures_total", "kind", "credential");
    } catch (const common::TransportError& e) {
        observability::log_error("dispatch.failed", {{"kind", std::string("transport")}, {"err", std::string(e.what())}, {"status", int64_t(e.status)}, {"meeting_phone", meeting_phone}});
        metrics.count("call_dispatch_failures_total", "kind", "transport");
    } catch (const std::exception& e) {
        observability::log_error("dispatch.failed", {{"kind", std::string("other")}, {"err", std::string(e.what())}, {"meeting_phone", meeting_phone}});
        metrics.count("call_dispatch_failures_total", "kind", "other");
    }
    return std::nullopt;
}

}
