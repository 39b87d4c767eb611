#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    enum class DedupPolicy { ID_ONLY, ID_AND_CONTENT };

    uint16_t port = 5000;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    int http_threads = 4;
    int worker_threads = 4;

    std::string twilio_account_sid;
    std::string twilio_auth_token;
    std::string twilio_phone_number;
    std::string owner_phone_number;
    std::string app_url;

    std::string google_token_file = "token.json";
    std::string calendar_id = "primary";
    int poll_interval_sec = 300;
    int lookahead_sec = 3600;
    DedupPolicy dedup_policy = DedupPolicy::ID_ONLY;
    std::string webhook_signing_secret;

    static Config from_env(int argc, char** argv);

    // Human readable problems that make the server unable to place calls.
    std::vector<std::string> validate() const;
};

}
