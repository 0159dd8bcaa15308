#pragma once

#include "networking/HttpMessage.hpp"

#include <chrono>
#include <string>

namespace cloudclip::networking {

// One-shot blocking HTTP/1.1 client. Every call opens a fresh connection and
// is bounded by `timeout` end to end.
//
// Throws ClientError: Unreachable when resolving or connecting fails,
// Timeout when the deadline expires, Protocol for anything else on the wire.
class HttpClient {
public:
    HttpClient(std::string host, std::string port,
               std::chrono::milliseconds timeout = std::chrono::seconds(5));

    // Accepts "http://host[:port][/]" or "host[:port]". Throws std::invalid_argument.
    static HttpClient from_url(const std::string& url,
                               std::chrono::milliseconds timeout = std::chrono::seconds(5));

    Response send(const Request& request) const;

    const std::string& host() const noexcept { return host_; }
    const std::string& port() const noexcept { return port_; }

private:
    std::string host_;
    std::string port_;
    std::chrono::milliseconds timeout_;
};

} // namespace cloudclip::networking
