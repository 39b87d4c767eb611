#include "UrlCodec.h"

static int hex_value(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

std::string url_encode(std::string_view s) {
    static const char* digits = "0123456789ABCDEF";
    std::string out; out.reserve(s.size() * 3);
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0f]);
        }
    }
    return out;
}

std::string url_decode(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            int hi = i + 2 < s.size() ? hex_value(s[i+1]) : -1;
            int lo = i + 2 < s.size() ? hex_value(s[i+2]) : -1;
            // Malformed escapes pass through as written.
            if (hi < 0 || lo < 0) { out.push_back('%'); continue; }
            out.push_back(char((hi << 4) | lo)); i += 2;
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

std::unordered_map<std::string, std::string> parse_query(std::string_view in) {
    std::unordered_map<std::string, std::string> out;
    auto q = in.find('?');
    if (q != std::string_view::npos) in = in.substr(q + 1);
    else if (!in.empty() && in.front() == '/') return out;
    auto hash = in.find('#');
    if (hash != std::string_view::npos) in = in.substr(0, hash);
    size_t pos = 0;
    while (pos <= in.size()) {
        size_t amp = in.find('&', pos);
        std::string_view pair = in.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string val = eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
            if (!key.empty()) out.emplace(std::move(key), std::move(val));
        }
        if (amp == std::string_view::npos) break;
        pos = amp + 1;
    }
    return out;
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& f : fields) {
        if (!out.empty()) out.push_back('&');
        out += url_encode(f.first);
        out.push_back('=');
        out += url_encode(f.second);
    }
    return out;
}
