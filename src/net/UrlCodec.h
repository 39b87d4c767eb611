#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string url_encode(std::string_view s);

// Decodes %XX escapes and '+' as space. A malformed escape is kept literally.
std::string url_decode(std::string_view s);

// Parses "a=1&b=2" (with or without a leading path and '?'). First occurrence of a key wins.
std::unordered_map<std::string, std::string> parse_query(std::string_view target_or_query);

// application/x-www-form-urlencoded body from ordered pairs.
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);
