#include <iostream>
#include <optional>
#include <string>
#include "phone/PhoneExtractor.h"

using phone::extract_phone_number;

static bool expect(const std::optional<std::string>& text, const std::optional<std::string>& want) {
    auto got = extract_phone_number(text);
    if (got == want) return true;
    std::cerr << "extract(" << text.value_or("<none>") << ") = " << got.value_or("<none>")
              << ", expected " << want.value_or("<none>") << "\n";
    return false;
}

int main() {
    bool ok = true;
    ok &= expect(std::string("Call-in: +1 (415) 555-0132"), std::string("+1 (415) 555-0132"));
    ok &= expect(std::string("415-555-0132"), std::string("415-555-0132"));
    ok &= expect(std::string("4155550132"), std::string("4155550132"));
    ok &= expect(std::string("dial 555-123-4567"), std::string("555-123-4567"));
    ok &= expect(std::string("Bridge: (212) 555 0199 pin 1234#"), std::string("(212) 555 0199"));
    ok &= expect(std::string("first 415-555-0132 then 212-555-0199"), std::string("415-555-0132"));
    ok &= expect(std::string("line one\ndial 1-800-555-0100\nline three"), std::string("1-800-555-0100"));

    ok &= expect(std::string("no number here"), std::nullopt);
    ok &= expect(std::string(""), std::nullopt);
    ok &= expect(std::nullopt, std::nullopt);
    ok &= expect(std::string("room 12-34"), std::nullopt);
    ok &= expect(std::string("pin 123456"), std::nullopt);

    if (!ok) return 1;
    std::cout << "phone_extractor_unit ok\n";
    return 0;
}
