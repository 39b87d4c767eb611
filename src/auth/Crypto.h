#pragma once

#include <string>

namespace auth {

std::string base64_encode(const std::string& in);
std::string base64url_encode(const std::string& in);

// Raw 32-byte digest.
std::string hmac_sha256(const std::string& key, const std::string& data);
// Lowercase hex.
std::string sha256_hex(const std::string& data);

bool constant_time_equals(const std::string& a, const std::string& b);

}
