#pragma once

#include <string>

namespace telephony {

class TelephonyProvider {
public:
    virtual ~TelephonyProvider() = default;
    // Starts an outbound call; the provider fetches voice instructions from
    // `callback_url` once `to` answers. Returns the provider's call id.
    // Throws common::CredentialError or common::TransportError.
    virtual std::string create_call(const std::string& to, const std::string& from, const std::string& callback_url) = 0;
};

}
