#pragma once

#include "api/Target.h"
#include "networking/HttpMessage.hpp"
#include "store/SessionStore.h"

#include <functional>
#include <string>
#include <vector>

namespace cloudclip::api {

// Session id that the pre-session routes (/clipboard/...) operate on.
inline constexpr const char* kDefaultSessionId = "default";

// Maps HTTP requests onto SessionStore calls.
//
// Resolution order: path (404), method (405), bearer token (401), then the
// store. No store call happens for a request that fails any earlier step.
// Holds no state of its own; safe to call from any number of threads.
class RequestHandlers {
public:
    RequestHandlers(store::SessionStore& store, std::string api_key);

    networking::Response handle(const networking::Request& request) const;

    // Checks "Bearer <token>" against the configured key in constant time.
    bool authorized(const std::string& authorization) const;

private:
    using Handler = std::function<networking::Response(const RequestHandlers&,
                                                        const std::string& session_id,
                                                        const Target& target,
                                                        const networking::Request& request)>;

    struct Route {
        boost::beast::http::verb method;
        std::vector<std::string> pattern;  // "{id}" matches any single segment
        bool needs_auth;
        Handler handler;
    };

    static std::vector<Route> make_routes_();
    static bool match_(const std::vector<std::string>& pattern,
                       const std::vector<std::string>& segments,
                       std::string& session_id);

    networking::Response root_() const;
    networking::Response start_session_() const;
    networking::Response add_item_(const std::string& session_id, const networking::Request& request) const;
    networking::Response latest_(const std::string& session_id, const std::string& hostname) const;
    networking::Response history_(const std::string& session_id, const std::string& hostname) const;
    networking::Response end_session_(const std::string& session_id) const;
    networking::Response status_(const std::string& session_id) const;
    networking::Response list_active_() const;
    networking::Response clear_all_() const;

private:
    store::SessionStore& store_;
    std::string api_key_;
    std::vector<Route> routes_;
};

} // namespace cloudclip::api
