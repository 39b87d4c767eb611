#include "PhoneExtractor.h"
#include <regex>

namespace phone {

// [+1] [(]NXX[)] NXX XXXX with optional space/hyphen separators. The match
// always starts on '+', '(' or a digit so surrounding whitespace is never included.
static const std::regex& phone_pattern() {
    static const std::regex re(
        R"((?:\+?1[ \t]*-?[ \t]*)?\(?\d{3}\)?[ \t]*-?[ \t]*\d{3}[ \t]*-?[ \t]*\d{4})",
        std::regex::ECMAScript | std::regex::optimize);
    return re;
}

std::optional<std::string> extract_phone_number(const std::optional<std::string>& text) {
    if (!text || text->empty()) return std::nullopt;
    std::smatch m;
    if (!std::regex_search(*text, m, phone_pattern())) return std::nullopt;
    return m.str(0);
}

}
