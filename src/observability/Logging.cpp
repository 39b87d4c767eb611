#include "Logging.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace observability {

static std::atomic<int> g_level{2};
static std::mutex g_out_mu;

void set_log_level(int level) { g_level = level; }
int log_level() { return g_level.load(); }

static std::string now_iso_ms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, int(ms));
    return std::string(buf);
}

static std::string escape_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char u[8]; std::snprintf(u, sizeof(u), "\\u%04x", c); out += u;
                } else out += c;
                break;
        }
    }
    return out;
}

static void write_field(std::ostringstream& ss, const FieldValue& v) {
    if (std::holds_alternative<std::string>(v)) {
        ss << '"' << escape_json(std::get<std::string>(v)) << '"';
    } else if (std::holds_alternative<int64_t>(v)) {
        ss << std::get<int64_t>(v);
    } else {
        ss << std::fixed << std::setprecision(3) << std::get<double>(v);
    }
}

static void log_generic(int level, const char* lvl_name, const std::string& msg, const Fields& fields) {
    if (level < g_level.load()) return;
    std::ostringstream ss;
    ss << '{';
    ss << "\"ts\":\"" << now_iso_ms() << "\",";
    ss << "\"level\":\"" << lvl_name << "\",";
    ss << "\"msg\":\"" << escape_json(msg) << "\"";
    for (const auto& p : fields) {
        ss << ",\"" << escape_json(p.first) << "\":";
        write_field(ss, p.second);
    }
    ss << "}\n";
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cout << ss.str() << std::flush;
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(1, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(2, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(3, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(4, "ERROR", msg, fields); }

} // namespace observability
