#include "config/Config.h"

#include <unistd.h>

#include <climits>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace cloudclip::config {

EnvLookup process_env() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

static unsigned long parse_number(const std::string& what, const std::string& text,
                                  unsigned long min, unsigned long max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(what + " must be a number, got '" + text + "'");
    }
    unsigned long value = 0;
    try {
        value = std::stoul(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " out of range: " + text);
    }
    if (value < min || value > max) {
        throw std::invalid_argument(what + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max) + ", got " + text);
    }
    return value;
}

static void set_port(ServerConfig& config, const std::string& text) {
    config.port = static_cast<unsigned short>(parse_number("port", text, 0, 65535));
}

static void set_threads(ServerConfig& config, const std::string& text) {
    config.threads = parse_number("threads", text, 1, 256);
}

static void set_api_key(std::string& key, const std::string& text) {
    if (text.empty()) throw std::invalid_argument("api key must not be empty");
    key = text;
}

ServerConfig load_server_config(int argc, const char* const argv[], const EnvLookup& env) {
    ServerConfig config;

    if (const char* v = env("API_KEY")) set_api_key(config.api_key, v);
    if (const char* v = env("CLOUDCLIP_HOST")) config.address = v;
    if (const char* v = env("CLOUDCLIP_PORT")) set_port(config, v);
    if (const char* v = env("CLOUDCLIP_THREADS")) set_threads(config, v);

    for (int i = 1; i < argc; ++i) {
        const bool has_value = i + 1 < argc;

        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            config.show_help = true;
        }
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        }
        else if ((std::strcmp(argv[i], "-a") == 0 || std::strcmp(argv[i], "--address") == 0) && has_value) {
            config.address = argv[++i];
        }
        else if ((std::strcmp(argv[i], "-p") == 0 || std::strcmp(argv[i], "--port") == 0) && has_value) {
            set_port(config, argv[++i]);
        }
        else if ((std::strcmp(argv[i], "-t") == 0 || std::strcmp(argv[i], "--threads") == 0) && has_value) {
            set_threads(config, argv[++i]);
        }
        else if ((std::strcmp(argv[i], "-k") == 0 || std::strcmp(argv[i], "--api-key") == 0) && has_value) {
            set_api_key(config.api_key, argv[++i]);
        }
        else {
            throw std::invalid_argument(std::string("unknown or incomplete option: ") + argv[i]);
        }
    }
    return config;
}

static std::string local_hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') return "unknown";
    return buf;
}

ClientConfig load_client_config(std::vector<std::string>& args, const EnvLookup& env) {
    ClientConfig config;
    config.hostname = local_hostname();

    if (const char* home = env("HOME")) {
        config.state_file = std::string(home) + "/.cloudclip.json";
    } else {
        config.state_file = ".cloudclip.json";
    }

    if (const char* v = env("CLOUDCLIP_URL")) config.server_url = v;
    if (const char* v = env("API_KEY")) set_api_key(config.api_key, v);
    if (const char* v = env("CLOUDCLIP_STATE")) config.state_file = v;

    std::size_t i = 0;
    while (i < args.size() && args[i].rfind("-", 0) == 0) {
        const std::string& flag = args[i];
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("option " + flag + " needs a value");
        }
        const std::string& value = args[i + 1];

        if (flag == "-u" || flag == "--url") {
            config.server_url = value;
        } else if (flag == "-k" || flag == "--api-key") {
            set_api_key(config.api_key, value);
        } else if (flag == "-s" || flag == "--state") {
            config.state_file = value;
        } else if (flag == "-n" || flag == "--hostname") {
            config.hostname = value;
        } else if (flag == "--timeout") {
            config.timeout = std::chrono::milliseconds(parse_number("timeout", value, 1, 600000));
        } else {
            throw std::invalid_argument("unknown option: " + flag);
        }
        i += 2;
    }
    args.erase(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(i));
    return config;
}

void print_server_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -a, --address ADDR  Listen address (default: 0.0.0.0, env CLOUDCLIP_HOST)\n"
              << "  -p, --port N        Listen port (default: 8000, env CLOUDCLIP_PORT)\n"
              << "  -t, --threads N     Worker threads (default: 4, env CLOUDCLIP_THREADS)\n"
              << "  -k, --api-key KEY   Shared bearer token (env API_KEY)\n"
              << "  -v, --verbose       Log every request\n"
              << "  -h, --help          Show this help\n"
              << std::endl;
}

} // namespace cloudclip::config
