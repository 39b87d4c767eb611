#pragma once

#include <optional>
#include <string>

namespace phone {

// First North-American number in `text`, returned exactly as written
// ("+1 (415) 555-0132", "415-555-0132", "4155550132"). Empty or absent
// text, or text without a number, yields nullopt.
std::optional<std::string> extract_phone_number(const std::optional<std::string>& text);

}
