#pragma once

#include "TelephonyProvider.h"
#include <optional>
#include <string>

namespace telephony {

// Places leg 1 of the bridge: a call to the owner whose answer URL carries
// the meeting number and event name.
class CallDispatcher {
public:
    CallDispatcher(TelephonyProvider& provider, std::string owner_number, std::string caller_id,
                   std::string app_url, std::string signing_secret = std::string());

    // Never throws; provider failures are logged and yield nullopt. No retry.
    std::optional<std::string> place_call(const std::string& meeting_phone, const std::string& event_name);

    std::string callback_url(const std::string& meeting_phone, const std::string& event_name) const;

private:
    TelephonyProvider& provider_;
    std::string owner_number_;
    std::string caller_id_;
    std::string app_url_;
    std::string signing_secret_;
};

}
