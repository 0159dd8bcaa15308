#include "api/RequestHandlers.h"
#include "api/JsonCodec.h"
#include "store/StoreError.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace cloudclip::api {

namespace http = boost::beast::http;
using networking::Request;
using networking::Response;

static Response reply(http::status status, const json::value& body) {
    Response res;
    res.status = status;
    res.body = json::serialize(body);
    return res;
}

static Response ok(const json::value& body) {
    return reply(http::status::ok, body);
}

static Response fail(http::status status, const std::string& text) {
    return reply(status, detail(text));
}

RequestHandlers::RequestHandlers(store::SessionStore& store, std::string api_key)
    : store_(store),
      api_key_(std::move(api_key)),
      routes_(make_routes_()) {}

std::vector<RequestHandlers::Route> RequestHandlers::make_routes_() {
    using V = http::verb;
    std::vector<Route> r;

    r.push_back({V::get, {}, false,
        [](const RequestHandlers& h, const std::string&, const Target&, const Request&) {
            return h.root_();
        }});

    r.push_back({V::post, {"session", "start"}, true,
        [](const RequestHandlers& h, const std::string&, const Target&, const Request&) {
            return h.start_session_();
        }});
    r.push_back({V::post, {"session", "{id}", "clipboard"}, true,
        [](const RequestHandlers& h, const std::string& id, const Target&, const Request& req) {
            return h.add_item_(id, req);
        }});
    r.push_back({V::get, {"session", "{id}", "clipboard", "latest"}, true,
        [](const RequestHandlers& h, const std::string& id, const Target& t, const Request&) {
            return h.latest_(id, t.query_param("hostname"));
        }});
    r.push_back({V::get, {"session", "{id}", "clipboard", "history"}, true,
        [](const RequestHandlers& h, const std::string& id, const Target& t, const Request&) {
            return h.history_(id, t.query_param("hostname"));
        }});
    r.push_back({V::delete_, {"session", "{id}", "end"}, true,
        [](const RequestHandlers& h, const std::string& id, const Target&, const Request&) {
            return h.end_session_(id);
        }});
    r.push_back({V::get, {"session", "{id}", "status"}, true,
        [](const RequestHandlers& h, const std::string& id, const Target&, const Request&) {
            return h.status_(id);
        }});

    r.push_back({V::get, {"sessions", "active"}, true,
        [](const RequestHandlers& h, const std::string&, const Target&, const Request&) {
            return h.list_active_();
        }});
    r.push_back({V::delete_, {"sessions", "clear"}, true,
        [](const RequestHandlers& h, const std::string&, const Target&, const Request&) {
            return h.clear_all_();
        }});

    // Routes from before sessions existed; all bound to the default session.
    r.push_back({V::post, {"clipboard"}, true,
        [](const RequestHandlers& h, const std::string&, const Target&, const Request& req) {
            return h.add_item_(kDefaultSessionId, req);
        }});
    r.push_back({V::get, {"clipboard", "latest"}, true,
        [](const RequestHandlers& h, const std::string&, const Target&, const Request&) {
            return h.latest_(kDefaultSessionId, {});
        }});
    r.push_back({V::get, {"clipboard", "history"}, true,
        [](const RequestHandlers& h, const std::string&, const Target&, const Request&) {
            return h.history_(kDefaultSessionId, {});
        }});
    r.push_back({V::delete_, {"clipboard", "clear"}, true,
        [](const RequestHandlers& h, const std::string&, const Target&, const Request&) {
            return h.end_session_(kDefaultSessionId);
        }});

    return r;
}

bool RequestHandlers::match_(const std::vector<std::string>& pattern,
                             const std::vector<std::string>& segments,
                             std::string& session_id) {
    if (pattern.size() != segments.size()) return false;

    std::string captured;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == "{id}") {
            captured = segments[i];
        } else if (pattern[i] != segments[i]) {
            return false;
        }
    }
    session_id = std::move(captured);
    return true;
}

Response RequestHandlers::handle(const Request& request) const {
    // CORS preflight
    if (request.method == http::verb::options) {
        Response res;
        res.status = http::status::no_content;
        return res;
    }

    const Target target = parse_target(request.target);

    bool path_known = false;
    for (const auto& route : routes_) {
        std::string session_id;
        if (!match_(route.pattern, target.segments, session_id)) continue;

        path_known = true;
        if (route.method != request.method) continue;

        if (route.needs_auth) {
            if (request.authorization.empty()) {
                return fail(http::status::unauthorized, "Not authenticated");
            }
            if (!authorized(request.authorization)) {
                return fail(http::status::unauthorized, "Invalid API key");
            }
        }

        try {
            return route.handler(*this, session_id, target, request);
        } catch (const store::NotFound& e) {
            return fail(http::status::not_found, e.what());
        } catch (const store::ExhaustedCodespace& e) {
            return fail(http::status::service_unavailable, e.what());
        } catch (const BadRequest& e) {
            return fail(http::status::unprocessable_entity, e.what());
        }
    }

    if (path_known) return fail(http::status::method_not_allowed, "Method Not Allowed");
    return fail(http::status::not_found, "Not Found");
}

bool RequestHandlers::authorized(const std::string& authorization) const {
    static const std::string kScheme = "bearer ";
    if (authorization.size() < kScheme.size()) return false;
    for (std::size_t i = 0; i < kScheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(authorization[i])) != kScheme[i]) return false;
    }

    const std::string token = authorization.substr(kScheme.size());

    // Touch every byte of the longer string so timing does not leak the
    // length of the matching prefix.
    const std::size_t n = std::max(token.size(), api_key_.size());
    unsigned char diff = token.size() == api_key_.size() ? 0 : 1;
    for (std::size_t i = 0; i < n; ++i) {
        const unsigned char a = i < token.size() ? static_cast<unsigned char>(token[i]) : 0;
        const unsigned char b = i < api_key_.size() ? static_cast<unsigned char>(api_key_[i]) : 0;
        diff |= static_cast<unsigned char>(a ^ b);
    }
    return diff == 0;
}

Response RequestHandlers::root_() const {
    return ok(message("CloudClip API is running"));
}

Response RequestHandlers::start_session_() const {
    return ok(json::object{{"session_id", store_.create_explicit()}});
}

Response RequestHandlers::add_item_(const std::string& session_id, const Request& request) const {
    AddItemBody body = parse_add_item(request.body);
    auto item = store_.add_item(session_id, std::move(body.content), body.hostname);
    return ok(to_json(item));
}

Response RequestHandlers::latest_(const std::string& session_id, const std::string& hostname) const {
    return ok(to_json(store_.latest(session_id, hostname)));
}

Response RequestHandlers::history_(const std::string& session_id, const std::string& hostname) const {
    return ok(to_json(store_.history(session_id, hostname)));
}

Response RequestHandlers::end_session_(const std::string& session_id) const {
    store_.end(session_id);
    return ok(message("Session " + session_id + " ended and data cleared"));
}

Response RequestHandlers::status_(const std::string& session_id) const {
    return ok(to_json(store_.status(session_id)));
}

Response RequestHandlers::list_active_() const {
    return ok(to_json(store_.list_active()));
}

Response RequestHandlers::clear_all_() const {
    const std::size_t count = store_.clear_all();
    return ok(message("Cleared " + std::to_string(count) + " sessions"));
}

} // namespace cloudclip::api
