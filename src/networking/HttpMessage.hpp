#pragma once

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include <string>

namespace cloudclip::networking {

// Transport-neutral view of one HTTP exchange, the only thing request
// handlers see.
struct Request {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    std::string target;         // path plus optional "?query"
    std::string authorization;  // raw Authorization header, may be empty
    std::string body;
};

struct Response {
    boost::beast::http::status status = boost::beast::http::status::ok;
    std::string body;           // JSON, empty for 204
};

} // namespace cloudclip::networking
