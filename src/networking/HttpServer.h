#pragma once

#include "networking/HttpMessage.hpp"

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cloudclip::networking {

using ConnectionId = std::uint64_t;

class HttpServer {
public:
    // Called on the connection's strand; may run on any io_context thread.
    using OnRequest = std::function<Response(const Request&)>;

    // Port 0 binds an ephemeral port, see port().
    HttpServer(boost::asio::io_context& ioc, const std::string& address, unsigned short port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void set_on_request(OnRequest cb);

    void start();  // start accepting
    void stop();   // stop accepting + close open connections

    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cloudclip::networking
