#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace cloudclip::api {

// Request target split into decoded path segments and query parameters.
// "/session/48%2091/status?hostname=a%20b" gives
// segments {"session", "48 91", "status"} and query {"hostname": "a b"}.
struct Target {
    std::vector<std::string> segments;
    std::unordered_map<std::string, std::string> query;

    // Empty string when the parameter is absent.
    std::string query_param(const std::string& name) const;
};

Target parse_target(const std::string& target);

// %XX and '+' decoding; malformed escapes are kept literally.
std::string percent_decode(const std::string& in, bool plus_as_space);

// Escapes everything outside the RFC 3986 unreserved set.
std::string percent_encode(const std::string& in);

} // namespace cloudclip::api
