#pragma once

#include <string>
#include <unordered_map>

namespace telephony {

// Renders the TwiML that announces the event and dials the meeting as leg 2.
// Everything it needs arrives in the request parameters.
class BridgeResponder {
public:
    using Params = std::unordered_map<std::string, std::string>;

    explicit BridgeResponder(std::string owner_number, std::string signing_secret = std::string());

    // Always returns a well-formed document, even with missing parameters.
    std::string respond(const Params& params) const;

private:
    std::string owner_number_;
    std::string signing_secret_;
};

std::string xml_escape(const std::string& s);

}
