#pragma once

#include "client/ClientState.h"
#include "client/Clipboard.hpp"
#include "networking/HttpMessage.hpp"

#include <boost/json.hpp>

#include <functional>
#include <ostream>
#include <string>

namespace cloudclip::client {

// Command-side counterpart of the server: start/join/end a session and push
// or pull clipboard text. Every command reports one status line to `log`
// and returns false when the server refused it. Transport failures surface
// as networking::ClientError.
class ClipboardClient {
public:
    using Transport = std::function<networking::Response(const networking::Request&)>;

    static constexpr std::size_t kPreviewLen = 40;

    ClipboardClient(Transport transport,
                    std::string api_key,
                    std::string hostname,
                    ClientState& state,
                    Clipboard& clipboard,
                    std::ostream& log);

    bool start_session();
    bool join_session(const std::string& code);
    bool send_clipboard();
    bool get_clipboard();
    bool show_history();
    bool show_status();
    bool end_session();
    bool list_sessions();

    // Six ASCII digits.
    static bool is_valid_code(const std::string& code);

private:
    networking::Response call_(boost::beast::http::verb method,
                               const std::string& target,
                               std::string body = {}) const;
    boost::json::value parse_(const networking::Response& res) const;
    bool require_session_();
    bool report_failure_(const char* what, const networking::Response& res);
    std::string session_path_(const std::string& suffix) const;

    static std::string preview_(const std::string& text);

private:
    Transport transport_;
    std::string authorization_;
    std::string hostname_;
    ClientState& state_;
    Clipboard& clipboard_;
    std::ostream& log_;
};

} // namespace cloudclip::client
