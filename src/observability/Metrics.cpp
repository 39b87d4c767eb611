#include "Metrics.h"

namespace observability {

static const std::vector<double>& latency_buckets() {
    static const std::vector<double> buckets = {1,2,5,10,20,50,100,200,500,1000,2000,5000,10000};
    return buckets;
}

static std::string render_labels(const std::string& key, const std::string& value) {
    if (key.empty()) return std::string();
    return key + "=\"" + value + "\"";
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

Metrics::Metrics() {}

void Metrics::inc(const std::string& path, const std::string& method, int code) {
    MetricsKey k{path, method, code};
    std::lock_guard lock(mu_);
    map_[k] += 1;
}

void Metrics::observe_latency(const std::string& path, const std::string& method, double latency_ms) {
    const auto& buckets = latency_buckets();
    MetricsKey k{path, method, 0};
    std::lock_guard lock(mu_);
    auto& h = hist_[k];
    if (h.buckets.empty()) h.buckets.assign(buckets.size(), 0);
    h.count += 1;
    h.sum += latency_ms;
    for (size_t i = 0; i < buckets.size(); ++i) { if (latency_ms <= buckets[i]) { h.buckets[i] += 1; } }
}

void Metrics::count(const std::string& name, const std::string& label_key, const std::string& label_value) {
    std::lock_guard lock(mu_);
    counters_[name][render_labels(label_key, label_value)] += 1;
}

uint64_t Metrics::counter_value(const std::string& name, const std::string& label_key, const std::string& label_value) const {
    std::lock_guard lock(mu_);
    auto it = counters_.find(name);
    if (it == counters_.end()) return 0;
    auto jt = it->second.find(render_labels(label_key, label_value));
    return jt == it->second.end() ? 0 : jt->second;
}

std::string Metrics::scrape() const {
    std::ostringstream ss;
    std::lock_guard lock(mu_);
    ss << "# HELP http_requests_total Total HTTP requests\n";
    ss << "# TYPE http_requests_total counter\n";
    for (const auto& p : map_) {
        ss << "http_requests_total{path=\"" << p.first.path << "\",method=\"" << p.first.method << "\",code=\"" << p.first.code << "\"} " << p.second << "\n";
    }
    ss << "# HELP http_request_duration_ms Histogram of request durations\n";
    ss << "# TYPE http_request_duration_ms histogram\n";
    const auto& buckets = latency_buckets();
    for (const auto& p : hist_) {
        const auto& k = p.first;
        const auto& h = p.second;
        for (size_t i = 0; i < buckets.size(); ++i) {
            ss << "http_request_duration_ms_bucket{path=\"" << k.path << "\",method=\"" << k.method << "\",le=\"" << buckets[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << "http_request_duration_ms_bucket{path=\"" << k.path << "\",method=\"" << k.method << "\",le=\"+Inf\"} " << h.count << "\n";
        ss << "http_request_duration_ms_sum{path=\"" << k.path << "\",method=\"" << k.method << "\"} " << h.sum << "\n";
        ss << "http_request_duration_ms_count{path=\"" << k.path << "\",method=\"" << k.method << "\"} " << h.count << "\n";
    }
    for (const auto& c : counters_) {
        ss << "# TYPE " << c.first << " counter\n";
        for (const auto& v : c.second) {
            ss << c.first;
            if (!v.first.empty()) ss << '{' << v.first << '}';
            ss << ' ' << v.second << "\n";
        }
    }
    return ss.str();
}

}
