#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

struct HttpsRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string content_type;
    std::string body;
};

struct HttpsResponse {
    int status = 0;
    std::string body;
};

struct ParsedUrl {
    bool tls = true;
    std::string host;
    std::string port;
    std::string target;
};

// Throws common::TransportError for anything that is not http(s)://host[:port][/path].
ParsedUrl parse_url(const std::string& url);

// Blocking one-request-per-connection HTTP/1.1 client. https URLs are verified
// against the system trust store. Any socket, DNS or TLS failure is reported as
// common::TransportError; HTTP status codes are returned, not thrown. Resolve,
// connect, handshake, write and read are each bounded by the timeout.
class HttpsClient {
public:
    explicit HttpsClient(std::chrono::seconds timeout = std::chrono::seconds(15));
    virtual ~HttpsClient() = default;
    virtual HttpsResponse send(const HttpsRequest& req);
private:
    std::chrono::seconds timeout_;
};
