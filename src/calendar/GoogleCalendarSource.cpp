#include "GoogleCalendarSource.h"
#include "TimeUtil.h"
#include "common/Errors.h"
#include "net/MiniJson.h"
#include "net/UrlCodec.h"
#include "observability/Logging.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace calendar {

static const char* kEventsBase = "https://www.googleapis.com/calendar/v3/calendars/";

GoogleCredentials load_google_credentials(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw common::CredentialError("Google Calendar credentials not found. Please complete the OAuth2 flow to generate " + path + ".");
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string js = ss.str();
    GoogleCredentials c;
    try {
        c.token = json_extract_string_present(js, "token").second;
        c.refresh_token = json_extract_string_present(js, "refresh_token").second;
        c.client_id = json_extract_string_present(js, "client_id").second;
        c.client_secret = json_extract_string_present(js, "client_secret").second;
        auto uri = json_extract_string_present(js, "token_uri");
        if (uri.first && !uri.second.empty()) c.token_uri = uri.second;
        auto exp = json_extract_string_present(js, "expiry");
        if (exp.first && !exp.second.empty()) {
            // google-auth writes naive UTC timestamps without a zone suffix
            std::string e = exp.second;
            bool has_zone = e.back() == 'Z' || (e.size() >= 25 && (e[e.size()-6] == '+' || e[e.size()-6] == '-') && e[e.size()-3] == ':');
            if (!has_zone) e.push_back('Z');
            c.expiry = parse_rfc3339(e);
        }
    } catch (const std::runtime_error& e) {
        throw common::CredentialError(path + " is not valid JSON: " + e.what());
    }
    if (c.token.empty() && c.refresh_token.empty()) {
        throw common::CredentialError(path + " contains neither an access token nor a refresh token");
    }
    return c;
}

std::vector<CalendarEvent> parse_events_response(const std::string& body) {
    std::vector<CalendarEvent> out;
    try {
        auto items = json_extract_raw(body, "items");
        if (!items || *items == "null") return out;
        for (const auto& item : json_split_array(*items)) {
            CalendarEvent ev;
            ev.id = json_extract_string(item, "id");
            if (ev.id.empty()) continue;
            auto summary = json_extract_string_opt_present(item, "summary");
            if (summary.second) ev.summary = *summary.second;
            auto description = json_extract_string_opt_present(item, "description");
            if (description.second) ev.description = *description.second;
            auto start = json_extract_raw(item, "start");
            if (start && !start->empty() && start->front() == '{') {
                auto dt = json_extract_string_opt_present(*start, "dateTime");
                if (dt.second) ev.start = parse_rfc3339(*dt.second);
                auto date = json_extract_string_opt_present(*start, "date");
                if (date.second) ev.start_date = *date.second;
            }
            out.push_back(std::move(ev));
        }
    } catch (const std::runtime_error& e) {
        throw common::TransportError(std::string("malformed calendar response: ") + e.what());
    }
    return out;
}

GoogleCalendarSource::GoogleCalendarSource(std::string token_file, std::string calendar_id, std::shared_ptr<HttpsClient> http, NowFn now)
    : token_file_(std::move(token_file)), calendar_id_(std::move(calendar_id)), http_(std::move(http)), now_(std::move(now)) {}

void GoogleCalendarSource::refresh(GoogleCredentials& creds) {
    if (creds.refresh_token.empty() || creds.client_id.empty() || creds.client_secret.empty()) {
        throw common::CredentialError("Google access token expired and " + token_file_ + " has no refresh credentials");
    }
    HttpsRequest req;
    req.method = "POST";
    req.url = creds.token_uri;
    req.content_type = "application/x-www-form-urlencoded";
    req.body = form_encode({
        {"grant_type", "refresh_token"},
        {"refresh_token", creds.refresh_token},
        {"client_id", creds.client_id},
        {"client_secret", creds.client_secret},
    });
    auto res = http_->send(req);
    if (res.status == 400 || res.status == 401) {
        throw common::CredentialError("Google token refresh rejected (HTTP " + std::to_string(res.status) + ")");
    }
    if (res.status < 200 || res.status >= 300) {
        throw common::TransportError("Google token refresh failed", res.status);
    }
    std::string token;
    std::optional<int64_t> expires_in;
    try {
        token = json_extract_string_present(res.body, "access_token").second;
        expires_in = json_extract_int_opt(res.body, "expires_in");
    } catch (const std::runtime_error& e) {
        throw common::TransportError(std::string("malformed token response: ") + e.what());
    }
    if (token.empty()) throw common::CredentialError("Google token refresh returned no access_token");
    creds.token = token;
    creds.expiry = now_() + std::chrono::seconds(expires_in.value_or(3600));
    observability::log_info("calendar.token_refreshed", {{"expires_in", int64_t(expires_in.value_or(3600))}});
}

std::string GoogleCalendarSource::access_token() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!creds_) creds_ = load_google_credentials(token_file_);
    bool expired = creds_->expiry.has_value() && *creds_->expiry <= now_() + std::chrono::seconds(60);
    if (creds_->token.empty() || expired) refresh(*creds_);
    return creds_->token;
}

std::vector<CalendarEvent> GoogleCalendarSource::fetch_upcoming(std::chrono::seconds window) {
    auto now = now_();
    HttpsRequest req;
    req.url = std::string(kEventsBase) + url_encode(calendar_id_) + "/events?" + form_encode({
        {"timeMin", format_iso_z(now)},
        {"timeMax", format_iso_z(now + window)},
        {"singleEvents", "true"},
        {"orderBy", "startTime"},
        {"maxResults", "250"},
    });
    req.headers.emplace_back("Authorization", "Bearer " + access_token());
    auto res = http_->send(req);
    if (res.status == 401 || res.status == 403) {
        if (res.status == 401) {
            // Force a reload/refresh on the next cycle.
            std::lock_guard<std::mutex> lk(mu_);
            creds_.reset();
        }
        throw common::CredentialError("Google Calendar rejected credentials (HTTP " + std::to_string(res.status) + ")");
    }
    if (res.status < 200 || res.status >= 300) {
        throw common::TransportError("Google Calendar events.list failed (HTTP " + std::to_string(res.status) + ")", res.status);
    }
    auto events = parse_events_response(res.body);
    observability::log_debug("calendar.fetched", {{"count", int64_t(events.size())}, {"calendar", calendar_id_}});
    return events;
}

}
