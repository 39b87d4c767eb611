#include "BridgeResponder.h"
#include "auth/CallbackSignature.h"
#include "observability/Logging.h"
#include "scheduling/SchedulingPipeline.h"
#include <sstream>

namespace telephony {

std::string xml_escape(const std::string& s) {
    std::string out; out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

BridgeResponder::BridgeResponder(std::string owner_number, std::string signing_secret)
    : owner_number_(std::move(owner_number)), signing_secret_(std::move(signing_secret)) {}

static std::string param_or(const BridgeResponder::Params& params, const char* key, const std::string& def) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return def;
    return it->second;
}

std::string BridgeResponder::respond(const Params& params) const {
    std::string meeting_phone = param_or(params, "meeting_phone", std::string());
    std::string event_name = param_or(params, "event_name", scheduling::kDefaultEventName);

    std::ostringstream ss;
    ss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    ss << "<Response>\n";
    if (!signing_secret_.empty()) {
        auto raw_name = params.find("event_name");
        std::string signed_name = raw_name == params.end() ? std::string() : raw_name->second;
        if (!auth::verify_callback(signing_secret_, meeting_phone, signed_name, param_or(params, "sig", std::string()))) {
            observability::log_warn("webhook.bad_signature", {{"meeting_phone", meeting_phone}});
            ss << "    <Say voice=\"alice\">Sorry, this call could not be verified. Goodbye.</Say>\n";
            ss << "    <Hangup/>\n";
            ss << "</Response>\n";
            return ss.str();
        }
    }
    if (meeting_phone.empty()) observability::log_warn("webhook.missing_meeting_phone");
    ss << "    <Say voice=\"alice\">Hello, you have an upcoming event: " << xml_escape(event_name) << ". Please wait while we connect you.</Say>\n";
    ss << "    <Pause length=\"3\"/>\n";
    ss << "    <Dial callerId=\"" << xml_escape(owner_number_) << "\" timeout=\"20\">" << xml_escape(meeting_phone) << "</Dial>\n";
    ss << "</Response>\n";
    return ss.str();
}

}
