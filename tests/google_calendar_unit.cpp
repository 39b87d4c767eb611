#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include "calendar/GoogleCalendarSource.h"
#include "calendar/TimeUtil.h"
#include "common/Errors.h"
#include "net/UrlCodec.h"
#include "test_fakes.h"

using calendar::Clock;

static Clock::time_point at(const char* iso) { return *calendar::parse_rfc3339(iso); }

static void write_file(const std::string& path, const std::string& body) {
    std::ofstream out(path, std::ios::trunc);
    out << body;
}

static int test_parse() {
    const std::string body = R"({
      "kind": "calendar#events",
      "summary": "owner@example.com",
      "items": [
        {"id": "e1", "summary": "Standup", "description": "dial 555-123-4567",
         "start": {"dateTime": "2024-01-01T10:00:00-05:00", "timeZone": "America/New_York"}},
        {"id": "e2", "start": {"date": "2024-01-02"}},
        {"summary": "no id", "start": {"dateTime": "2024-01-01T10:00:00Z"}},
        {"id": "e3", "summary": null, "description": "Notes with \"quotes\"\nand 415-555-0132",
         "start": {"dateTime": "2024-01-01T15:30:00.000Z"}}
      ]
    })";
    auto events = calendar::parse_events_response(body);
    if (events.size() != 3) { std::cerr << "expected 3 events got " << events.size() << "\n"; return 1; }

    const auto& e1 = events[0];
    if (e1.id != "e1" || e1.summary != std::optional<std::string>("Standup") || !e1.start) { std::cerr << "e1 fields mismatch\n"; return 1; }
    if (*e1.start != at("2024-01-01T15:00:00Z")) { std::cerr << "e1 offset not applied: " << calendar::format_iso_z(*e1.start) << "\n"; return 1; }

    const auto& e2 = events[1];
    if (e2.start || e2.start_date != std::optional<std::string>("2024-01-02")) { std::cerr << "all-day event should have date only\n"; return 1; }
    if (e2.summary || e2.description) { std::cerr << "missing summary/description should be absent\n"; return 1; }

    const auto& e3 = events[2];
    if (e3.summary) { std::cerr << "null summary should be absent\n"; return 1; }
    if (!e3.description || e3.description->find("\"quotes\"\nand") == std::string::npos) { std::cerr << "description not decoded\n"; return 1; }

    if (!calendar::parse_events_response("{\"kind\":\"calendar#events\"}").empty()) { std::cerr << "missing items should be empty\n"; return 1; }
    bool threw = false;
    try { calendar::parse_events_response("{\"items\":[{\"id\":\"x\""); } catch (const common::TransportError&) { threw = true; }
    if (!threw) { std::cerr << "malformed body should raise TransportError\n"; return 1; }
    return 0;
}

static int test_credentials(const std::string& path) {
    std::remove(path.c_str());
    bool threw = false;
    try { calendar::load_google_credentials(path); } catch (const common::CredentialError& e) {
        threw = std::string(e.what()).find("credentials not found") != std::string::npos;
    }
    if (!threw) { std::cerr << "missing token file should raise CredentialError\n"; return 1; }

    write_file(path, R"({"token":"tok","refresh_token":"ref","client_id":"cid","client_secret":"sec","expiry":"2024-01-01T10:00:00.123456"})");
    auto c = calendar::load_google_credentials(path);
    if (c.token != "tok" || c.refresh_token != "ref" || c.token_uri != "https://oauth2.googleapis.com/token") { std::cerr << "credential fields mismatch\n"; return 1; }
    if (!c.expiry || *c.expiry != at("2024-01-01T10:00:00Z")) { std::cerr << "naive expiry should be read as UTC\n"; return 1; }

    write_file(path, R"({"client_id":"cid"})");
    threw = false;
    try { calendar::load_google_credentials(path); } catch (const common::CredentialError&) { threw = true; }
    if (!threw) { std::cerr << "token-less file should raise CredentialError\n"; return 1; }
    return 0;
}

static int test_source(const std::string& path) {
    const auto now = at("2024-01-01T09:00:00Z");
    write_file(path, R"({"token":"stale","refresh_token":"ref","client_id":"cid","client_secret":"sec",
        "token_uri":"https://oauth.example.test/token","expiry":"2024-01-01T08:00:00Z"})");
    auto http = std::make_shared<FakeHttpsClient>();
    calendar::GoogleCalendarSource src(path, "team@example.com", http, [now] { return now; });

    http->push(200, R"({"access_token":"fresh","expires_in":3599,"token_type":"Bearer"})");
    http->push(200, R"({"items":[{"id":"e1","summary":"Standup","description":"dial 555-123-4567","start":{"dateTime":"2024-01-01T09:30:00Z"}}]})");
    auto events = src.fetch_upcoming(std::chrono::hours(1));
    if (events.size() != 1 || events[0].id != "e1") { std::cerr << "events not returned\n"; return 1; }
    if (http->requests.size() != 2) { std::cerr << "expected refresh + list requests\n"; return 1; }

    const auto& refresh = http->requests[0];
    if (refresh.method != "POST" || refresh.url != "https://oauth.example.test/token") { std::cerr << "refresh request mismatch\n"; return 1; }
    auto form = parse_query(refresh.body);
    if (form["grant_type"] != "refresh_token" || form["refresh_token"] != "ref" || form["client_id"] != "cid") { std::cerr << "refresh form mismatch\n"; return 1; }

    const auto& list = http->requests[1];
    if (list.url.rfind("https://www.googleapis.com/calendar/v3/calendars/team%40example.com/events?", 0) != 0) { std::cerr << "list url mismatch: " << list.url << "\n"; return 1; }
    auto q = parse_query(list.url);
    if (q["timeMin"] != "2024-01-01T09:00:00Z" || q["timeMax"] != "2024-01-01T10:00:00Z") { std::cerr << "window mismatch\n"; return 1; }
    if (q["singleEvents"] != "true" || q["orderBy"] != "startTime") { std::cerr << "query flags mismatch\n"; return 1; }
    bool bearer = false;
    for (const auto& h : list.headers) if (h.first == "Authorization" && h.second == "Bearer fresh") bearer = true;
    if (!bearer) { std::cerr << "refreshed token not used\n"; return 1; }

    // The refreshed token is reused until it nears expiry.
    http->push(200, R"({"items":[]})");
    if (!src.fetch_upcoming(std::chrono::hours(1)).empty() || http->requests.size() != 3) { std::cerr << "token should be cached\n"; return 1; }

    http->push(503, "{}");
    bool transport = false;
    try { src.fetch_upcoming(std::chrono::hours(1)); } catch (const common::TransportError& e) { transport = e.status == 503; }
    if (!transport) { std::cerr << "503 should raise TransportError\n"; return 1; }

    http->push(401, "{}");
    bool credential = false;
    try { src.fetch_upcoming(std::chrono::hours(1)); } catch (const common::CredentialError&) { credential = true; }
    if (!credential) { std::cerr << "401 should raise CredentialError\n"; return 1; }

    // After a 401 the file is reloaded; a rejected refresh is a credential problem.
    http->push(400, R"({"error":"invalid_grant"})");
    credential = false;
    try { src.fetch_upcoming(std::chrono::hours(1)); } catch (const common::CredentialError&) { credential = true; }
    if (!credential || http->requests.back().method != "POST") { std::cerr << "rejected refresh should raise CredentialError\n"; return 1; }
    return 0;
}

int main() {
    const std::string path = "/tmp/google_calendar_unit_token.json";
    if (test_parse() || test_credentials(path) || test_source(path)) return 1;
    std::remove(path.c_str());
    std::cout << "google_calendar_unit ok\n";
    return 0;
}
