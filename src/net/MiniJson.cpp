#include "MiniJson.h"
#include <stdexcept>
#include <cctype>

namespace {

size_t skip_ws(const std::string& js, size_t i) {
    while (i < js.size() && isspace((unsigned char)js[i])) ++i;
    return i;
}

void append_utf8(std::string& out, int code) {
    if (code <= 0x7f) out.push_back((char)code);
    else if (code <= 0x7ff) {
        out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    } else {
        out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    }
}

// `start` is the index just after the opening quote. Returns decoded text and the closing quote index.
std::pair<std::string,size_t> decode_string(const std::string& js, size_t start) {
    const size_t n = js.size();
    std::string out;
    for (size_t i = start;; ++i) {
        if (i >= n) throw std::runtime_error("unterminated json string");
        char c = js[i];
        if (c == '"') return {out, i};
        if (c != '\\') { out.push_back(c); continue; }
        if (i + 1 >= n) throw std::runtime_error("unterminated escape in json string");
        char e = js[++i];
        switch (e) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                // BMP only
                if (i + 4 >= n) throw std::runtime_error("invalid unicode escape in json string");
                int code = 0;
                for (size_t k = i+1; k <= i+4; ++k) {
                    char ch = js[k];
                    code <<= 4;
                    if (ch >= '0' && ch <= '9') code += ch - '0';
                    else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
                    else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
                    else throw std::runtime_error("invalid hex in unicode escape");
                }
                append_utf8(out, code);
                i += 4;
                break;
            }
            default: throw std::runtime_error("unsupported escape in json string");
        }
    }
}

// Index one past the end of the value starting at `i`.
size_t skip_value(const std::string& js, size_t i) {
    const size_t n = js.size();
    i = skip_ws(js, i);
    if (i >= n) throw std::runtime_error("missing json value");
    char c = js[i];
    if (c == '"') return decode_string(js, i + 1).second + 1;
    if (c == '{' || c == '[') {
        int depth = 0;
        for (; i < n; ++i) {
            char d = js[i];
            if (d == '"') { i = decode_string(js, i + 1).second; continue; }
            if (d == '{' || d == '[') ++depth;
            else if (d == '}' || d == ']') { if (--depth == 0) return i + 1; }
        }
        throw std::runtime_error("unterminated json container");
    }
    size_t end = i;
    while (end < n && js[end] != ',' && js[end] != '}' && js[end] != ']' && !isspace((unsigned char)js[end])) ++end;
    if (end == i) throw std::runtime_error("invalid json value");
    return end;
}

// Index of the value for `key` in the outermost object, if present.
std::optional<size_t> find_top_level_value(const std::string& js, const std::string& key) {
    size_t i = skip_ws(js, 0);
    if (i >= js.size()) return std::nullopt;
    if (js[i] != '{') throw std::runtime_error("json object expected");
    i = skip_ws(js, i + 1);
    if (i < js.size() && js[i] == '}') return std::nullopt;
    while (i < js.size()) {
        if (js[i] != '"') throw std::runtime_error("json key expected");
        auto k = decode_string(js, i + 1);
        i = skip_ws(js, k.second + 1);
        if (i >= js.size() || js[i] != ':') throw std::runtime_error("missing ':' after json key");
        size_t val = skip_ws(js, i + 1);
        if (k.first == key) return val;
        i = skip_ws(js, skip_value(js, val));
        if (i < js.size() && js[i] == ',') { i = skip_ws(js, i + 1); continue; }
        if (i < js.size() && js[i] == '}') return std::nullopt;
        throw std::runtime_error("malformed json object");
    }
    throw std::runtime_error("unterminated json object");
}

}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    auto pos = find_top_level_value(js, key);
    if (!pos) return {false, std::nullopt};
    if (js.compare(*pos, 4, "null") == 0) return {true, std::nullopt};
    if (*pos >= js.size() || js[*pos] != '"') throw std::runtime_error("invalid type for json string field");
    return {true, decode_string(js, *pos + 1).first};
}

std::pair<bool,std::string> json_extract_string_present(const std::string& js, const std::string& key) {
    auto p = json_extract_string_opt_present(js, key);
    if (!p.first) return {false, std::string()};
    return {true, p.second.value_or(std::string())};
}

std::string json_extract_string(const std::string& js, const std::string& key) {
    try {
        return json_extract_string_present(js, key).second;
    } catch (const std::runtime_error&) {
        return std::string();
    }
}

std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key) {
    auto pos = find_top_level_value(js, key);
    if (!pos) return std::nullopt;
    size_t end = skip_value(js, *pos);
    std::string tok = js.substr(*pos, end - *pos);
    if (tok.empty() || tok == "null") return std::nullopt;
    size_t k = tok[0] == '-' ? 1 : 0;
    if (k >= tok.size()) return std::nullopt;
    for (; k < tok.size(); ++k) if (tok[k] < '0' || tok[k] > '9') return std::nullopt;
    try { return std::stoll(tok); } catch (const std::out_of_range&) { return std::nullopt; }
}

std::optional<std::string> json_extract_raw(const std::string& js, const std::string& key) {
    auto pos = find_top_level_value(js, key);
    if (!pos) return std::nullopt;
    size_t end = skip_value(js, *pos);
    return js.substr(*pos, end - *pos);
}

std::vector<std::string> json_split_array(const std::string& array_js) {
    std::vector<std::string> out;
    size_t i = skip_ws(array_js, 0);
    if (i >= array_js.size() || array_js[i] != '[') throw std::runtime_error("json array expected");
    i = skip_ws(array_js, i + 1);
    if (i < array_js.size() && array_js[i] == ']') return out;
    while (i < array_js.size()) {
        size_t end = skip_value(array_js, i);
        out.push_back(array_js.substr(i, end - i));
        i = skip_ws(array_js, end);
        if (i < array_js.size() && array_js[i] == ',') { i = skip_ws(array_js, i + 1); continue; }
        if (i < array_js.size() && array_js[i] == ']') return out;
        throw std::runtime_error("malformed json array");
    }
    throw std::runtime_error("unterminated json array");
}
