#include "Config.h"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <stdexcept>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = to_upper(s);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

static Config::DedupPolicy parse_dedup(const std::string& s) {
    std::string u = to_upper(s);
    if (u == "CONTENT" || u == "ID_AND_CONTENT") return Config::DedupPolicy::ID_AND_CONTENT;
    return Config::DedupPolicy::ID_ONLY;
}

// Keeps `fallback` when the variable is unset, not a number, or below `min_value`.
static int getenv_int(const char* name, int fallback, int min_value) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        if (used != std::string(v).size() || parsed < min_value) return fallback;
        return parsed;
    } catch (const std::exception&) {
        return fallback;
    }
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    int env_port = getenv_int("PORT", c.port, 1);
    if (env_port <= 65535) c.port = static_cast<uint16_t>(env_port);
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) {
            try {
                int p = std::stoi(argv[i+1]);
                if (p >= 1 && p <= 65535) c.port = static_cast<uint16_t>(p);
            } catch (const std::exception&) {}
        }
    }
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    c.http_threads = std::clamp(getenv_int("HTTP_THREADS", 4, 1), 1, 64);
    c.worker_threads = std::clamp(getenv_int("WORKER_THREADS", 4, 1), 1, 64);

    c.twilio_account_sid = getenv_or("TWILIO_ACCOUNT_SID", "");
    c.twilio_auth_token = getenv_or("TWILIO_AUTH_TOKEN", "");
    c.twilio_phone_number = getenv_or("TWILIO_PHONE_NUMBER", "");
    c.owner_phone_number = getenv_or("MY_PHONE_NUMBER", "");
    c.app_url = getenv_or("APP_URL", "");
    while (!c.app_url.empty() && c.app_url.back() == '/') c.app_url.pop_back();

    c.google_token_file = getenv_or("GOOGLE_TOKEN_FILE", "token.json");
    c.calendar_id = getenv_or("CALENDAR_ID", "primary");
    if (c.calendar_id.empty()) c.calendar_id = "primary";
    c.poll_interval_sec = getenv_int("POLL_INTERVAL_SEC", 300, 1);
    c.lookahead_sec = getenv_int("LOOKAHEAD_SEC", 3600, 1);
    c.dedup_policy = parse_dedup(getenv_or("DEDUP_POLICY", "id"));
    c.webhook_signing_secret = getenv_or("WEBHOOK_SIGNING_SECRET", "");
    return c;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;
    if (twilio_account_sid.empty() || twilio_auth_token.empty()) problems.push_back("TWILIO_ACCOUNT_SID and TWILIO_AUTH_TOKEN must be set");
    if (twilio_phone_number.empty()) problems.push_back("TWILIO_PHONE_NUMBER is not set");
    if (owner_phone_number.empty()) problems.push_back("MY_PHONE_NUMBER is not set");
    if (app_url.empty()) problems.push_back("APP_URL is not set");
    else if (app_url.rfind("http://", 0) != 0 && app_url.rfind("https://", 0) != 0) problems.push_back("APP_URL must start with http:// or https://");
    return problems;
}

}
