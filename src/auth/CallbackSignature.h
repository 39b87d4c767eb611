#pragma once

#include <string>

namespace auth {

// base64url(HMAC-SHA256(secret, meeting_phone + "\n" + event_name))
std::string sign_callback(const std::string& secret, const std::string& meeting_phone, const std::string& event_name);

bool verify_callback(const std::string& secret, const std::string& meeting_phone, const std::string& event_name, const std::string& signature);

}
