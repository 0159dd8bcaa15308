#include "client/ClipboardClient.h"

#include "api/Target.h"
#include "networking/ClientError.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <utility>

namespace cloudclip::client {

namespace json = boost::json;
namespace http = boost::beast::http;
using networking::ClientError;
using networking::Request;
using networking::Response;

ClipboardClient::ClipboardClient(Transport transport,
                                 std::string api_key,
                                 std::string hostname,
                                 ClientState& state,
                                 Clipboard& clipboard,
                                 std::ostream& log)
    : transport_(std::move(transport)),
      authorization_("Bearer " + api_key),
      hostname_(std::move(hostname)),
      state_(state),
      clipboard_(clipboard),
      log_(log) {}

bool ClipboardClient::is_valid_code(const std::string& code) {
    return code.size() == 6 &&
           std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool ClipboardClient::start_session() {
    auto res = call_(http::verb::post, "/session/start");
    if (res.status != http::status::ok) return report_failure_("start", res);

    auto body = parse_(res);
    const auto* id = body.is_object() ? body.as_object().if_contains("session_id") : nullptr;
    if (!id || !id->is_string()) {
        throw ClientError(ClientError::Kind::Protocol, "start: response carries no session_id");
    }

    state_.set_session_id(json::value_to<std::string>(*id));
    state_.save();

    log_ << "Session " << state_.session_id() << " started\n"
         << "Share this code with the other machine: " << state_.session_id() << "\n";
    return true;
}

bool ClipboardClient::join_session(const std::string& code) {
    if (!is_valid_code(code)) {
        log_ << "Invalid session code (must be 6 digits)\n";
        return false;
    }

    auto res = call_(http::verb::get, "/sessions/active");
    if (res.status != http::status::ok) return report_failure_("join", res);

    auto body = parse_(res);
    bool exists = false;
    if (const auto* sessions = body.if_array()) {
        for (const auto& s : *sessions) {
            const auto* obj = s.if_object();
            if (!obj) continue;
            const auto* id = obj->if_contains("session_id");
            if (id && id->is_string() && json::value_to<std::string>(*id) == code) {
                exists = true;
                break;
            }
        }
    }

    if (!exists) {
        log_ << "Session " << code << " not found or expired\n";
        return false;
    }

    state_.set_session_id(code);
    state_.save();
    log_ << "Joined session " << code << " as " << hostname_ << "\n";
    return true;
}

bool ClipboardClient::send_clipboard() {
    if (!require_session_()) return false;

    std::string content = clipboard_.read();
    const bool blank = std::all_of(content.begin(), content.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        log_ << "Clipboard is empty\n";
        return false;
    }

    const std::size_t length = content.size();
    json::object body{{"content", std::move(content)}, {"hostname", hostname_}};

    auto res = call_(http::verb::post, session_path_("/clipboard"), json::serialize(body));
    if (res.status != http::status::ok) return report_failure_("send", res);

    log_ << "Sent " << length << " chars\n";
    return true;
}

bool ClipboardClient::get_clipboard() {
    if (!require_session_()) return false;

    auto res = call_(http::verb::get,
                     session_path_("/clipboard/latest?hostname=" + api::percent_encode(hostname_)));
    if (res.status == http::status::not_found) {
        log_ << "No clipboard items in session\n";
        return false;
    }
    if (res.status != http::status::ok) return report_failure_("get", res);

    auto body = parse_(res);
    const auto* obj = body.if_object();
    const auto* content = obj ? obj->if_contains("content") : nullptr;
    if (!content || !content->is_string()) {
        throw ClientError(ClientError::Kind::Protocol, "get: response carries no content");
    }

    const std::string text = json::value_to<std::string>(*content);
    std::string from = "unknown";
    if (const auto* host = obj->if_contains("hostname"); host && host->is_string()) {
        from = json::value_to<std::string>(*host);
    }

    clipboard_.write(text);
    log_ << "Got " << text.size() << " chars from " << from << "\n";
    return true;
}

bool ClipboardClient::show_history() {
    if (!require_session_()) return false;

    auto res = call_(http::verb::get,
                     session_path_("/clipboard/history?hostname=" + api::percent_encode(hostname_)));
    if (res.status != http::status::ok) return report_failure_("history", res);

    auto body = parse_(res);
    const auto* items = body.if_array();
    if (!items || items->empty()) {
        log_ << "No clipboard history found\n";
        return true;
    }

    log_ << "Clipboard history (" << items->size() << " items):\n";
    // newest first
    for (auto it = items->rbegin(); it != items->rend(); ++it) {
        const auto* obj = it->if_object();
        if (!obj) continue;

        std::string time, host, content;
        if (const auto* v = obj->if_contains("timestamp"); v && v->is_string()) {
            time = json::value_to<std::string>(*v);
            // "YYYY-MM-DDTHH:MM:SS..." -> "HH:MM:SS"
            if (time.size() >= 19) time = time.substr(11, 8);
        }
        if (const auto* v = obj->if_contains("hostname"); v && v->is_string()) {
            host = json::value_to<std::string>(*v);
        }
        if (const auto* v = obj->if_contains("content"); v && v->is_string()) {
            content = json::value_to<std::string>(*v);
        }
        log_ << "  " << time << " [" << host << "] " << preview_(content) << "\n";
    }
    return true;
}

bool ClipboardClient::show_status() {
    if (!require_session_()) return false;

    auto res = call_(http::verb::get, session_path_("/status"));
    if (res.status == http::status::not_found) {
        log_ << "Session " << state_.session_id() << " not found or expired\n";
        return false;
    }
    if (res.status != http::status::ok) return report_failure_("status", res);

    auto body = parse_(res);
    const auto* obj = body.if_object();
    if (!obj) throw ClientError(ClientError::Kind::Protocol, "status: response is not an object");

    log_ << "Session:  " << state_.session_id() << "\n";
    if (const auto* v = obj->if_contains("created_at"); v && v->is_string()) {
        log_ << "Created:  " << v->get_string().c_str() << "\n";
    }
    if (const auto* v = obj->if_contains("last_activity"); v && v->is_string()) {
        log_ << "Active:   " << v->get_string().c_str() << "\n";
    }
    if (const auto* v = obj->if_contains("item_count"); v && v->is_number()) {
        log_ << "Items:    " << json::value_to<std::uint64_t>(*v) << "\n";
    }
    if (const auto* v = obj->if_contains("hostnames"); v && v->is_array()) {
        log_ << "Hosts:   ";
        for (const auto& h : v->get_array()) {
            if (h.is_string()) log_ << " " << h.get_string().c_str();
        }
        log_ << "\n";
    }
    return true;
}

bool ClipboardClient::end_session() {
    if (!require_session_()) return false;

    auto res = call_(http::verb::delete_, session_path_("/end"));
    if (res.status != http::status::ok && res.status != http::status::not_found) {
        return report_failure_("end", res);
    }

    // A 404 means the server already forgot it; drop it locally as well.
    const std::string ended = state_.session_id();
    state_.clear();
    state_.save();

    log_ << "Session " << ended << " ended\n";
    return true;
}

bool ClipboardClient::list_sessions() {
    auto res = call_(http::verb::get, "/sessions/active");
    if (res.status != http::status::ok) return report_failure_("sessions", res);

    auto body = parse_(res);
    const auto* sessions = body.if_array();
    if (!sessions || sessions->empty()) {
        log_ << "No active sessions\n";
        return true;
    }

    for (const auto& s : *sessions) {
        const auto* obj = s.if_object();
        if (!obj) continue;
        const auto* id = obj->if_contains("session_id");
        const auto* count = obj->if_contains("item_count");
        const auto* hosts = obj->if_contains("hostnames");

        log_ << (id && id->is_string() ? id->get_string().c_str() : "?");
        if (count && count->is_number()) log_ << "  items=" << json::value_to<std::uint64_t>(*count);
        if (hosts && hosts->is_array()) log_ << "  hosts=" << hosts->get_array().size();
        log_ << "\n";
    }
    return true;
}

Response ClipboardClient::call_(http::verb method, const std::string& target, std::string body) const {
    Request req;
    req.method = method;
    req.target = target;
    req.authorization = authorization_;
    req.body = std::move(body);
    return transport_(req);
}

json::value ClipboardClient::parse_(const Response& res) const {
    boost::system::error_code ec;
    json::value v = json::parse(res.body, ec);
    if (ec) {
        throw ClientError(ClientError::Kind::Protocol, "malformed response body: " + ec.message());
    }
    return v;
}

bool ClipboardClient::require_session_() {
    if (state_.has_session()) return true;
    log_ << "No active session (run 'start' or 'join <code>' first)\n";
    return false;
}

bool ClipboardClient::report_failure_(const char* what, const Response& res) {
    std::string detail;
    boost::system::error_code ec;
    json::value v = json::parse(res.body, ec);
    if (!ec && v.is_object()) {
        if (const auto* d = v.as_object().if_contains("detail"); d && d->is_string()) {
            detail = json::value_to<std::string>(*d);
        }
    }

    log_ << what << " failed: " << static_cast<unsigned>(res.status);
    if (!detail.empty()) log_ << " - " << detail;
    log_ << "\n";
    return false;
}

std::string ClipboardClient::session_path_(const std::string& suffix) const {
    return "/session/" + api::percent_encode(state_.session_id()) + suffix;
}

std::string ClipboardClient::preview_(const std::string& text) {
    std::string out = text.substr(0, kPreviewLen);
    std::replace(out.begin(), out.end(), '\n', ' ');
    if (text.size() > kPreviewLen) out += "...";
    return out;
}

} // namespace cloudclip::client
