#include "HttpServer.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace cloudclip::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

static constexpr std::chrono::seconds kIdleTimeout{30};
static constexpr const char* kServerName = "cloudclip";

class HttpServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& address, unsigned short port)
        : ioc_(ioc),
          acceptor_(asio::make_strand(ioc), tcp::endpoint(asio::ip::make_address(address), port)) {}

    void start() { do_accept(); }

    void stop() {
        // The acceptor lives on its own strand; close it there.
        asio::post(
            acceptor_.get_executor(),
            [this] {
                beast::error_code ec;
                acceptor_.close(ec);
            });

        // Close all connections
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, c] : connections_) {
            c->close();
        }
        connections_.clear();
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void set_on_request(OnRequest cb) { on_request_ = std::move(cb); }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket, ConnectionId id)
            : server_(server),
              id_(id),
              stream_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        void start() {
            asio::post(
                strand_,
                [self = shared_from_this()] { self->do_read(); });
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] { self->do_close(); });
        }

    private:
        void do_read() {
            req_ = {};
            stream_.expires_after(kIdleTimeout);

            http::async_read(
                stream_, buffer_, req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec == http::error::end_of_stream) return self->do_close();
                        if (ec) return self->on_close_or_fail("read", ec);

                        self->do_write(self->handle());
                    }));
        }

        http::response<http::string_body> handle() {
            Request request;
            request.method = req_.method();
            request.target = std::string(req_.target());
            request.authorization = std::string(req_[http::field::authorization]);
            request.body = std::move(req_.body());

            Response response;
            if (server_.on_request_) {
                try {
                    response = server_.on_request_(request);
                } catch (const std::exception& e) {
                    std::cerr << "[Connection " << id_ << "] handler: " << e.what() << "\n";
                    response.status = http::status::internal_server_error;
                    response.body = R"({"detail":"Internal server error"})";
                }
            } else {
                response.status = http::status::service_unavailable;
                response.body = R"({"detail":"No handler installed"})";
            }

            http::response<http::string_body> res{response.status, req_.version()};
            res.set(http::field::server, kServerName);
            res.set(http::field::access_control_allow_origin, "*");
            res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
            res.set(http::field::access_control_allow_headers, "Authorization, Content-Type");
            if (!response.body.empty()) {
                res.set(http::field::content_type, "application/json");
            }
            res.keep_alive(req_.keep_alive());
            res.body() = std::move(response.body);
            res.prepare_payload();
            return res;
        }

        void do_write(http::response<http::string_body> res) {
            // The message must outlive the async operation.
            auto msg = std::make_shared<http::response<http::string_body>>(std::move(res));

            http::async_write(
                stream_, *msg,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this(), msg](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail("write", ec);

                        if (msg->need_eof()) return self->do_close();
                        self->do_read();
                    }));
        }

        void do_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            stream_.close();
            server_.remove_connection(id_);
        }

        void on_close_or_fail(const char* what, beast::error_code ec) {
            // Idle keep-alive connections time out routinely; not worth a log line.
            if (ec != beast::error::timeout && ec != asio::error::operation_aborted) {
                std::cerr << "[Connection " << id_ << "] " << what << ": " << ec.message() << "\n";
            }
            do_close();
        }

        Impl& server_;
        ConnectionId id_;

        beast::tcp_stream stream_;
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        http::request<http::string_body> req_;
    };

    void do_accept() {
        acceptor_.async_accept(
            ioc_,
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    std::cerr << "[accept] " << ec.message() << "\n";
                    return do_accept();
                }

                auto id = next_connection_id_++;
                auto connection = std::make_shared<Connection>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    connections_[id] = connection;
                }

                connection->start();
                do_accept();
            });
    }

    void remove_connection(ConnectionId id) {
        std::lock_guard<std::mutex> lk(mu_);
        connections_.erase(id);
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    std::atomic<ConnectionId> next_connection_id_{1};

    std::mutex mu_;
    std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections_;

    OnRequest on_request_;
};

// ---- HttpServer wrapper ----

HttpServer::HttpServer(asio::io_context& ioc, const std::string& address, unsigned short port)
    : impl_(new Impl(ioc, address, port)) {}

void HttpServer::set_on_request(OnRequest cb) { impl_->set_on_request(std::move(cb)); }

void HttpServer::start() { impl_->start(); }
void HttpServer::stop() { impl_->stop(); }

unsigned short HttpServer::port() const { return impl_->port(); }

HttpServer::~HttpServer() = default;

} // namespace cloudclip::networking
