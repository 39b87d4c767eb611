#pragma once

#include "TelephonyProvider.h"
#include "net/HttpsClient.h"
#include <memory>
#include <string>

namespace telephony {

// Twilio REST "Calls" resource.
class TwilioClient : public TelephonyProvider {
public:
    TwilioClient(std::string account_sid, std::string auth_token,
                 std::shared_ptr<HttpsClient> http = std::make_shared<HttpsClient>(),
                 std::string api_base = "https://api.twilio.com");
    std::string create_call(const std::string& to, const std::string& from, const std::string& callback_url) override;
private:
    std::string account_sid_;
    std::string auth_token_;
    std::shared_ptr<HttpsClient> http_;
    std::string api_base_;
};

}
