#pragma once

#include <stdexcept>
#include <string>

namespace common {

// Missing or rejected credentials for the calendar or the telephony provider.
struct CredentialError : std::runtime_error {
    explicit CredentialError(const std::string& what) : std::runtime_error(what) {}
};

// Network, TLS or unexpected HTTP status while talking to a remote API.
struct TransportError : std::runtime_error {
    int status = 0;
    explicit TransportError(const std::string& what, int http_status = 0) : std::runtime_error(what), status(http_status) {}
};

}
