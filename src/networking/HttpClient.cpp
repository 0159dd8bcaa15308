#include "HttpClient.h"
#include "ClientError.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <memory>
#include <stdexcept>
#include <utility>

namespace cloudclip::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

HttpClient::HttpClient(std::string host, std::string port, std::chrono::milliseconds timeout)
    : host_(std::move(host)),
      port_(std::move(port)),
      timeout_(timeout) {}

HttpClient HttpClient::from_url(const std::string& url, std::chrono::milliseconds timeout) {
    std::string rest = url;

    static const std::string kScheme = "http://";
    if (rest.compare(0, kScheme.size(), kScheme) == 0) {
        rest.erase(0, kScheme.size());
    } else if (rest.find("://") != std::string::npos) {
        throw std::invalid_argument("unsupported scheme in '" + url + "' (only http:// is supported)");
    }

    auto slash = rest.find('/');
    if (slash != std::string::npos) rest.resize(slash);

    std::string host = rest;
    std::string port = "80";
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        host = rest.substr(0, colon);
        port = rest.substr(colon + 1);
    }

    if (host.empty() || port.empty()) {
        throw std::invalid_argument("malformed server url '" + url + "'");
    }
    return HttpClient(std::move(host), std::move(port), timeout);
}

namespace {

// Drives one exchange on a private io_context. Beast only applies stream
// deadlines to asynchronous operations, hence the callback chain. The
// resolver has no deadline of its own; deadline_ bounds the whole exchange.
class Exchange {
public:
    Exchange(const std::string& host, const std::string& port,
             std::chrono::milliseconds timeout, http::request<http::string_body> req)
        : resolver_(ioc_),
          stream_(ioc_),
          deadline_(ioc_),
          host_(host),
          port_(port),
          timeout_(timeout),
          req_(std::move(req)) {}

    http::response<http::string_body> run() {
        deadline_.expires_after(timeout_);
        deadline_.async_wait([this](beast::error_code ec) {
            if (ec) return; // cancelled: the exchange finished first
            timed_out_ = true;
            resolver_.cancel();
            stream_.cancel();
        });

        resolver_.async_resolve(
            host_, port_,
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                if (timed_out_) return fail(ClientError::Kind::Timeout, "resolve", beast::error::timeout);
                if (ec) return fail(ClientError::Kind::Unreachable, "resolve", ec);
                on_resolve(results);
            });

        ioc_.run();

        if (error_) throw *error_;
        return std::move(res_);
    }

private:
    void on_resolve(const tcp::resolver::results_type& results) {
        stream_.expires_after(timeout_);
        stream_.async_connect(
            results,
            [this](beast::error_code ec, const tcp::endpoint&) {
                if (timed_out_ || ec == beast::error::timeout) return fail(ClientError::Kind::Timeout, "connect", ec);
                if (ec) return fail(ClientError::Kind::Unreachable, "connect", ec);
                on_connect();
            });
    }

    void on_connect() {
        stream_.expires_after(timeout_);
        http::async_write(
            stream_, req_,
            [this](beast::error_code ec, std::size_t) {
                if (ec) return fail_io("write", ec);
                on_write();
            });
    }

    void on_write() {
        stream_.expires_after(timeout_);
        http::async_read(
            stream_, buffer_, res_,
            [this](beast::error_code ec, std::size_t) {
                if (ec) return fail_io("read", ec);

                deadline_.cancel();
                beast::error_code ignored;
                stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
            });
    }

    void fail_io(const char* what, beast::error_code ec) {
        fail(timed_out_ || ec == beast::error::timeout ? ClientError::Kind::Timeout : ClientError::Kind::Protocol,
             what, ec);
    }

    void fail(ClientError::Kind kind, const char* what, beast::error_code ec) {
        deadline_.cancel();
        error_ = std::make_unique<ClientError>(
            kind, std::string(what) + " " + host_ + ":" + port_ + ": " + ec.message());
    }

    asio::io_context ioc_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    asio::steady_timer deadline_;
    bool timed_out_ = false;

    const std::string& host_;
    const std::string& port_;
    std::chrono::milliseconds timeout_;

    http::request<http::string_body> req_;
    beast::flat_buffer buffer_;
    http::response<http::string_body> res_;

    std::unique_ptr<ClientError> error_;
};

} // namespace

Response HttpClient::send(const Request& request) const {
    http::request<http::string_body> req{request.method, request.target, 11};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!request.authorization.empty()) {
        req.set(http::field::authorization, request.authorization);
    }
    if (!request.body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = request.body;
    }
    req.keep_alive(false);
    req.prepare_payload();

    Exchange exchange(host_, port_, timeout_, std::move(req));
    auto res = exchange.run();

    Response response;
    response.status = res.result();
    response.body = std::move(res.body());
    return response;
}

} // namespace cloudclip::networking
