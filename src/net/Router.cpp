#include "Router.h"
#include <boost/beast/http.hpp>
#include <optional>
#include <stdexcept>

std::string strip_query(const std::string& target) {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

static Response json_error(const Request& req, boost::beast::http::status st, const char* body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

void Router::add_route(std::string method, std::string path, Handler h) {
    add_async_route(std::move(method), std::move(path), [h = std::move(h)](const Request& req, Reply reply) {
        reply(h(req));
    });
}

void Router::add_async_route(std::string method, std::string path, AsyncHandler h) {
    Key k{std::move(method), std::move(path)};
    routes_[std::move(k)] = std::move(h);
}

void Router::dispatch(const Request& req, Reply reply) const {
    Key k{std::string(req.method_string()), strip_query(std::string(req.target()))};
    auto it = routes_.find(k);
    if (it != routes_.end()) return it->second(req, std::move(reply));
    for (const auto& p : routes_) {
        if (p.first.path == k.path) return reply(json_error(req, boost::beast::http::status::method_not_allowed, "{\"error\":\"method not allowed\"}"));
    }
    reply(json_error(req, boost::beast::http::status::not_found, "{\"error\":\"not found\"}"));
}

Response Router::route(const Request& req) const {
    std::optional<Response> out;
    dispatch(req, [&out](Response res) { out.emplace(std::move(res)); });
    if (!out) throw std::logic_error("route " + strip_query(std::string(req.target())) + " replies asynchronously");
    return std::move(*out);
}
