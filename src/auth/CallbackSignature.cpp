#include "CallbackSignature.h"
#include "Crypto.h"

namespace auth {

std::string sign_callback(const std::string& secret, const std::string& meeting_phone, const std::string& event_name) {
    return base64url_encode(hmac_sha256(secret, meeting_phone + "\n" + event_name));
}

bool verify_callback(const std::string& secret, const std::string& meeting_phone, const std::string& event_name, const std::string& signature) {
    if (signature.empty() || signature.size() > 128) return false;
    return constant_time_equals(signature, sign_callback(secret, meeting_phone, event_name));
}

}
