#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

// Exact method + path routing. The query string is not part of the match.
class Router {
public:
    using Handler = std::function<Response(const Request&)>;
    using Reply = std::function<void(Response)>;
    // Must call the reply exactly once, from any thread. The request is only
    // valid for the duration of the call.
    using AsyncHandler = std::function<void(const Request&, Reply)>;

    void add_route(std::string method, std::string path, Handler h);
    void add_async_route(std::string method, std::string path, AsyncHandler h);

    // Plain handlers reply before dispatch returns.
    void dispatch(const Request& req, Reply reply) const;
    // For plain handlers only; throws std::logic_error if the handler deferred.
    Response route(const Request& req) const;
private:
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };
    std::unordered_map<Key, AsyncHandler, KeyHash, KeyEq> routes_;
};

std::string strip_query(const std::string& target);
