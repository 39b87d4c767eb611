#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    std::optional<http::request_parser<http::string_body>> parser;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al) {}

    void run() { do_read(); }

    void arm_read_timer(std::chrono::seconds d) {
        auto self = shared_from_this();
        read_timer.expires_after(d);
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });
    }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;
        parser.emplace();
        parser->header_limit(8 * 1024);
        parser->body_limit(256 * 1024);
        arm_read_timer(std::chrono::seconds(5));

        http::async_read_header(socket, buffer, *parser, [self](beast::error_code ec, std::size_t) {
            boost::system::error_code ignored; self->read_timer.cancel(ignored);
            if (ec) {
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}", "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version || ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\"}", "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }
            self->http_version = self->parser->get().version();
            self->arm_read_timer(std::chrono::seconds(20));
            http::async_read(self->socket, self->buffer, *self->parser, [self](beast::error_code ec2, std::size_t) {
                boost::system::error_code ignored2; self->read_timer.cancel(ignored2);
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\"}", "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }
                self->req = self->parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        std::string path = strip_query(std::string(req.target()));
        auto self = shared_from_this();
        try {
            // Deferred handlers reply from other threads; writes go back through the socket's strand.
            router.dispatch(req, [self, path](Response res) {
                auto r = std::make_shared<Response>(std::move(res));
                net::post(self->socket.get_executor(), [self, r, path] { self->send_response(r, path); });
            });
        } catch (const std::exception& e) {
            observability::log_error("http.handler_failed", {{"path", path}, {"err", std::string(e.what())}});
            auto res = std::make_shared<Response>(http::status::internal_server_error, req.version());
            res->set(http::field::content_type, "application/json; charset=utf-8");
            res->body() = "{\"error\":\"internal\"}";
            res->prepare_payload();
            send_response(res, path);
        }
    }

    void record(const std::string& path, int code) {
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        std::string method = std::string(req.method_string());
        if (metrics_enabled) {
            observability::Metrics::instance().inc(path, method, code);
            observability::Metrics::instance().observe_latency(path, method, ms);
        }
        if (access_log) {
            observability::log_info("http.access", {{"method", method}, {"path", path}, {"status", int64_t(code)}, {"ms", ms}});
        }
    }

    void send_response(std::shared_ptr<Response> res, const std::string& path) {
        auto self = shared_from_this();
        if (res->find(http::field::connection) == res->end()) res->keep_alive(req.keep_alive());
        record(path, static_cast<int>(res->result_int()));
        http::async_write(socket, *res, [self, res, path](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", path}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (res->keep_alive()) self->do_read();
            else self->close_socket();
        });
    }

    void close_socket() {
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void reply_json_error(http::status st, const std::string& body, const std::string& path) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        res->set(http::field::connection, "close");
        res->keep_alive(false);
        res->body() = body;
        res->prepare_payload();
        start_ts = std::chrono::steady_clock::now();
        send_response(res, path);
    }
};

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log, const std::string& bind_address)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::make_address(bind_address), port)), router_(router), metrics_enabled_(metrics_enabled), access_log_(access_log) {}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) observability::log_warn("acceptor_close_failed", {{"err", ec.message()}});
}

unsigned short HttpServer::port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_)->run();
        } else observability::log_warn("accept error", {{"err", int64_t(ec.value())}});
        do_accept();
    });
}
