#include <iostream>
#include <string>
#include "calendar/TimeUtil.h"

using calendar::parse_rfc3339;
using calendar::format_iso_z;

int main() {
    auto base = parse_rfc3339("2024-01-01T10:00:00Z");
    if (!base) { std::cerr << "failed to parse basic Z timestamp\n"; return 1; }
    if (format_iso_z(*base) != "2024-01-01T10:00:00Z") { std::cerr << "round trip mismatch: " << format_iso_z(*base) << "\n"; return 1; }

    auto offset = parse_rfc3339("2024-01-01T05:00:00-05:00");
    if (!offset || *offset != *base) { std::cerr << "negative offset not applied\n"; return 1; }
    auto plus = parse_rfc3339("2024-01-01T15:30:00+05:30");
    if (!plus || *plus != *base) { std::cerr << "positive offset not applied\n"; return 1; }
    auto frac = parse_rfc3339("2024-01-01T10:00:00.750Z");
    if (!frac || *frac != *base) { std::cerr << "fractional seconds not truncated\n"; return 1; }
    auto spaced = parse_rfc3339("2024-01-01 10:00:00z");
    if (!spaced || *spaced != *base) { std::cerr << "space separator rejected\n"; return 1; }

    auto leap = parse_rfc3339("2024-02-29T23:59:59Z");
    if (!leap || format_iso_z(*leap) != "2024-02-29T23:59:59Z") { std::cerr << "leap day mismatch\n"; return 1; }

    const char* bad[] = {
        "", "2024-01-01", "2024-01-01T10:00:00", "2024-13-01T10:00:00Z", "2024-01-01T25:00:00Z",
        "2024-01-01T10:00:00+0500", "2024-01-01T10:00:00.Z", "2024-01-01T10:00:00Zjunk", "not a date at all!!",
    };
    for (const char* b : bad) {
        if (parse_rfc3339(b)) { std::cerr << "accepted malformed timestamp: " << b << "\n"; return 1; }
    }

    std::cout << "time_util_unit ok\n";
    return 0;
}
