#include "HttpsClient.h"
#include "common/Errors.h"
#include "observability/Logging.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl out;
    size_t pos = 0;
    if (url.rfind("https://", 0) == 0) { out.tls = true; pos = 8; }
    else if (url.rfind("http://", 0) == 0) { out.tls = false; pos = 7; }
    else throw common::TransportError("unsupported url scheme: " + url);
    size_t slash = url.find('/', pos);
    std::string hostport = url.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    out.target = slash == std::string::npos ? std::string("/") : url.substr(slash);
    size_t colon = hostport.rfind(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = out.tls ? "443" : "80";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
    }
    if (out.host.empty() || out.port.empty()) throw common::TransportError("malformed url: " + url);
    return out;
}

HttpsClient::HttpsClient(std::chrono::seconds timeout) : timeout_(timeout) {}

namespace {

// One request/response on a stream owned by the caller. Every step is an
// async operation so the tcp_stream expiry bounds it.
template <class Stream>
class Exchange {
public:
    Exchange(Stream& stream, http::request<http::string_body>& req, std::chrono::seconds timeout)
        : stream_(stream), req_(req), timeout_(timeout) {
        parser_.body_limit(8 * 1024 * 1024);
    }

    void start(const net::ip::tcp::resolver::results_type& results) {
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        beast::get_lowest_layer(stream_).async_connect(results,
            [this](beast::error_code ec, const net::ip::tcp::endpoint&) {
                if (ec) return fail(ec, "connect");
                handshake();
            });
    }

    void fail(beast::error_code ec, const char* stage) {
        ec_ = ec;
        stage_ = stage;
    }

    const beast::error_code& error() const { return ec_; }
    const std::string& stage() const { return stage_; }
    bool done() const { return done_; }

    HttpsResponse response() {
        HttpsResponse out;
        out.status = static_cast<int>(parser_.get().result_int());
        out.body = std::move(parser_.get().body());
        return out;
    }

private:
    void handshake() {
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            beast::get_lowest_layer(stream_).expires_after(timeout_);
            stream_.async_handshake(ssl::stream_base::client, [this](beast::error_code ec) {
                if (ec) return fail(ec, "handshake");
                write();
            });
        } else {
            write();
        }
    }

    void write() {
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        http::async_write(stream_, req_, [this](beast::error_code ec, std::size_t) {
            if (ec) return fail(ec, "write");
            read();
        });
    }

    void read() {
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        http::async_read(stream_, buffer_, parser_, [this](beast::error_code ec, std::size_t) {
            if (ec) return fail(ec, "read");
            done_ = true;
        });
    }

    Stream& stream_;
    http::request<http::string_body>& req_;
    std::chrono::seconds timeout_;
    beast::flat_buffer buffer_;
    http::response_parser<http::string_body> parser_;
    beast::error_code ec_;
    std::string stage_;
    bool done_ = false;
};

std::string describe(const beast::error_code& ec) {
    if (ec == beast::error::timeout) return "timed out";
    return ec.message();
}

// Resolves under a deadline, then runs the exchange on the same io_context.
template <class Stream>
void run_exchange(net::io_context& ioc, Exchange<Stream>& ex, const ParsedUrl& u, std::chrono::seconds timeout) {
    net::ip::tcp::resolver resolver(ioc);
    net::steady_timer deadline(ioc);
    bool resolve_timed_out = false;
    deadline.expires_after(timeout);
    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (ec) return;
        resolve_timed_out = true;
        resolver.cancel();
    });
    resolver.async_resolve(u.host, u.port,
        [&](const boost::system::error_code& ec, net::ip::tcp::resolver::results_type results) {
            deadline.cancel();
            if (ec) {
                beast::error_code rec = ec;
                if (resolve_timed_out) rec = beast::error::timeout;
                return ex.fail(rec, "resolve");
            }
            ex.start(results);
        });
    ioc.run();
    if (ex.error()) {
        throw common::TransportError(u.host + ": " + ex.stage() + ": " + describe(ex.error()));
    }
    if (!ex.done()) throw common::TransportError(u.host + ": exchange did not complete");
}

} // namespace

HttpsResponse HttpsClient::send(const HttpsRequest& in) {
    ParsedUrl u = parse_url(in.url);
    http::request<http::string_body> req{http::string_to_verb(in.method), u.target, 11};
    if (req.method() == http::verb::unknown) throw common::TransportError("unsupported method " + in.method);
    req.set(http::field::host, u.host);
    req.set(http::field::user_agent, "meeting-dialer/1.0");
    req.set(http::field::accept, "application/json");
    for (const auto& h : in.headers) req.set(h.first, h.second);
    if (!in.content_type.empty()) req.set(http::field::content_type, in.content_type);
    req.body() = in.body;
    req.prepare_payload();

    net::io_context ioc;
    if (!u.tls) {
        beast::tcp_stream stream(ioc);
        Exchange<beast::tcp_stream> ex(stream, req, timeout_);
        run_exchange(ioc, ex, u, timeout_);
        auto out = ex.response();
        beast::error_code ec;
        stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) observability::log_debug("https.shutdown", {{"host", u.host}, {"err", ec.message()}});
        return out;
    }

    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
        throw common::TransportError("failed to set SNI for " + u.host);
    }
    stream.set_verify_callback(ssl::host_name_verification(u.host));
    Exchange<beast::ssl_stream<beast::tcp_stream>> ex(stream, req, timeout_);
    run_exchange(ioc, ex, u, timeout_);
    auto out = ex.response();

    beast::error_code shutdown_ec;
    beast::get_lowest_layer(stream).expires_after(timeout_);
    stream.async_shutdown([&shutdown_ec](beast::error_code ec) { shutdown_ec = ec; });
    ioc.restart();
    ioc.run();
    // Servers commonly close without a close_notify.
    if (shutdown_ec && shutdown_ec != net::error::eof && shutdown_ec != ssl::error::stream_truncated) {
        observability::log_debug("https.shutdown", {{"host", u.host}, {"err", shutdown_ec.message()}});
    }
    return out;
}
