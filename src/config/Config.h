#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace cloudclip::config {

// Shared secret both sides fall back to when API_KEY is not set.
inline constexpr const char* kDefaultApiKey = "your-secret-api-key-change-this";

// Environment lookup, std::getenv by default; tests pass a map-backed one.
using EnvLookup = std::function<const char*(const char*)>;
EnvLookup process_env();

struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8000;
    std::size_t threads = 4;
    std::string api_key = kDefaultApiKey;
    bool verbose = false;   // log every request
    bool show_help = false;
};

struct ClientConfig {
    std::string server_url = "http://localhost:8000";
    std::string api_key = kDefaultApiKey;
    std::string state_file;             // remembers the current session id
    std::string hostname;               // sent with every push/pull
    std::chrono::milliseconds timeout{5000};
};

// Defaults, then API_KEY / CLOUDCLIP_HOST / CLOUDCLIP_PORT / CLOUDCLIP_THREADS,
// then flags. Throws std::invalid_argument on bad values or unknown flags.
ServerConfig load_server_config(int argc, const char* const argv[], const EnvLookup& env);

// Defaults, then CLOUDCLIP_URL / API_KEY / CLOUDCLIP_STATE, then leading
// flags. Consumed flags are removed from `args`, the rest is the command.
ClientConfig load_client_config(std::vector<std::string>& args, const EnvLookup& env);

void print_server_usage(const char* program);

} // namespace cloudclip::config
