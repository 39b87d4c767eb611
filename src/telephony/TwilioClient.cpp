#include "TwilioClient.h"
#include "auth/Crypto.h"
#include "common/Errors.h"
#include "net/MiniJson.h"
#include "net/UrlCodec.h"
#include <stdexcept>

namespace telephony {

TwilioClient::TwilioClient(std::string account_sid, std::string auth_token, std::shared_ptr<HttpsClient> http, std::string api_base)
    : account_sid_(std::move(account_sid)), auth_token_(std::move(auth_token)), http_(std::move(http)), api_base_(std::move(api_base)) {}

static std::string error_message(const std::string& body) {
    try {
        return json_extract_string_present(body, "message").second;
    } catch (const std::runtime_error&) {
        return std::string();
    }
}

std::string TwilioClient::create_call(const std::string& to, const std::string& from, const std::string& callback_url) {
    if (account_sid_.empty() || auth_token_.empty()) throw common::CredentialError("Twilio account SID or auth token is not configured");
    HttpsRequest req;
    req.method = "POST";
    req.url = api_base_ + "/2010-04-01/Accounts/" + url_encode(account_sid_) + "/Calls.json";
    req.headers.emplace_back("Authorization", "Basic " + auth::base64_encode(account_sid_ + ":" + auth_token_));
    req.content_type = "application/x-www-form-urlencoded";
    req.body = form_encode({{"To", to}, {"From", from}, {"Url", callback_url}});

    auto res = http_->send(req);
    if (res.status == 401 || res.status == 403) {
        throw common::CredentialError("Twilio rejected credentials (HTTP " + std::to_string(res.status) + ")");
    }
    if (res.status < 200 || res.status >= 300) {
        std::string msg = error_message(res.body);
        throw common::TransportError("Twilio call creation failed (HTTP " + std::to_string(res.status) + ")" + (msg.empty() ? "" : ": " + msg), res.status);
    }
    std::string sid;
    try {
        sid = json_extract_string_present(res.body, "sid").second;
    } catch (const std::runtime_error& e) {
        throw common::TransportError(std::string("malformed Twilio response: ") + e.what(), res.status);
    }
    if (sid.empty()) throw common::TransportError("Twilio response has no call sid", res.status);
    return sid;
}

}
