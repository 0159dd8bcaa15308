#include "client/ClientState.h"
#include "client/Clipboard.hpp"
#include "client/ClipboardClient.h"
#include "config/Config.h"
#include "networking/ClientError.hpp"
#include "networking/HttpClient.h"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <command>\n"
              << "\nCommands:\n"
              << "  start         Start a new session and remember its code\n"
              << "  join CODE     Join an existing 6-digit session\n"
              << "  send          Push stdin to the session\n"
              << "  get           Pull the latest item to stdout\n"
              << "  history       Show the session's recent items\n"
              << "  status        Show the current session\n"
              << "  end           End the session and forget it\n"
              << "  sessions      List all active sessions\n"
              << "\nOptions:\n"
              << "  -u, --url URL        Server (default: http://localhost:8000, env CLOUDCLIP_URL)\n"
              << "  -k, --api-key KEY    Shared bearer token (env API_KEY)\n"
              << "  -s, --state FILE     Session file (default: ~/.cloudclip.json, env CLOUDCLIP_STATE)\n"
              << "  -n, --hostname NAME  Name reported to the session (default: this host)\n"
              << "      --timeout MS     Per-request timeout (default: 5000)\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    using namespace cloudclip;

    std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty() && (args[0] == "-h" || args[0] == "--help")) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        auto cfg = config::load_client_config(args, config::process_env());
        if (args.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        const auto http = networking::HttpClient::from_url(cfg.server_url, cfg.timeout);

        client::ClientState state(cfg.state_file);
        state.load();

        // Status lines go to stderr so `get` output can be piped.
        client::StreamClipboard clipboard(std::cin, std::cout);
        client::ClipboardClient cc(
            [&http](const networking::Request& req) { return http.send(req); },
            cfg.api_key, cfg.hostname, state, clipboard, std::cerr);

        const std::string& command = args[0];
        bool ok = false;

        if (command == "start") {
            ok = cc.start_session();
        } else if (command == "join" && args.size() == 2) {
            ok = cc.join_session(args[1]);
        } else if (command == "send") {
            ok = cc.send_clipboard();
        } else if (command == "get") {
            ok = cc.get_clipboard();
        } else if (command == "history") {
            ok = cc.show_history();
        } else if (command == "status") {
            ok = cc.show_status();
        } else if (command == "end") {
            ok = cc.end_session();
        } else if (command == "sessions") {
            ok = cc.list_sessions();
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            print_usage(argv[0]);
            return 1;
        }
        return ok ? 0 : 1;
    } catch (const networking::ClientError& e) {
        const char* kind = e.kind() == networking::ClientError::Kind::Timeout     ? "timeout"
                         : e.kind() == networking::ClientError::Kind::Unreachable ? "unreachable"
                                                                                 : "protocol error";
        std::cerr << "[cloudclip] " << kind << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[cloudclip] " << e.what() << "\n";
        return 2;
    }
}
