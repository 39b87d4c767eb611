#pragma once

#include "CalendarSource.h"
#include "net/HttpsClient.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace calendar {

// OAuth material as written by the Google authorized-user flow (token.json).
struct GoogleCredentials {
    std::string token;
    std::string refresh_token;
    std::string client_id;
    std::string client_secret;
    std::string token_uri = "https://oauth2.googleapis.com/token";
    std::optional<Clock::time_point> expiry;
};

// Throws common::CredentialError when the file is missing or unusable.
GoogleCredentials load_google_credentials(const std::string& path);

// Google Calendar v3 events.list body -> events. Items without an id are dropped.
// Throws common::TransportError on malformed JSON.
std::vector<CalendarEvent> parse_events_response(const std::string& body);

class GoogleCalendarSource : public CalendarSource {
public:
    GoogleCalendarSource(std::string token_file, std::string calendar_id,
                         std::shared_ptr<HttpsClient> http = std::make_shared<HttpsClient>(),
                         NowFn now = Clock::now);
    std::vector<CalendarEvent> fetch_upcoming(std::chrono::seconds window) override;

private:
    std::string access_token();
    void refresh(GoogleCredentials& creds);

    std::string token_file_;
    std::string calendar_id_;
    std::shared_ptr<HttpsClient> http_;
    NowFn now_;
    std::mutex mu_;
    std::optional<GoogleCredentials> creds_;
};

}
