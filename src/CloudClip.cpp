#include "api/RequestHandlers.h"
#include "config/Config.h"
#include "networking/HttpServer.h"
#include "store/SessionStore.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/http/verb.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace cloudclip;

    config::ServerConfig cfg;
    try {
        cfg = config::load_server_config(argc, argv, config::process_env());
    } catch (const std::exception& e) {
        std::cerr << "[CloudClip] " << e.what() << "\n";
        config::print_server_usage(argv[0]);
        return 1;
    }
    if (cfg.show_help) {
        config::print_server_usage(argv[0]);
        return 0;
    }
    if (cfg.api_key == config::kDefaultApiKey) {
        std::cerr << "[CloudClip] warning: API_KEY not set, using the built-in default key\n";
    }

    boost::asio::io_context ioc{static_cast<int>(cfg.threads)};

    store::SessionStore sessions;
    api::RequestHandlers handlers(sessions, cfg.api_key);

    std::unique_ptr<networking::HttpServer> server;
    try {
        server = std::make_unique<networking::HttpServer>(ioc, cfg.address, cfg.port);
    } catch (const std::exception& e) {
        std::cerr << "[CloudClip] cannot listen on " << cfg.address << ":" << cfg.port
                  << ": " << e.what() << "\n";
        return 1;
    }

    const bool verbose = cfg.verbose;
    server->set_on_request([&handlers, verbose](const networking::Request& req) {
        auto res = handlers.handle(req);
        if (verbose) {
            std::cout << "[http] " << boost::beast::http::to_string(req.method) << " " << req.target
                      << " -> " << static_cast<unsigned>(res.status) << "\n";
        }
        return res;
    });

    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        std::cout << "\n[CloudClip] shutting down...\n";
        server->stop();
        ioc.stop();
    });

    std::cout << "[CloudClip] HTTP server running on " << cfg.address << ":" << server->port()
              << " with " << cfg.threads << " threads\n";

    std::vector<std::thread> workers;
    workers.reserve(cfg.threads - 1);
    for (std::size_t i = 1; i < cfg.threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    std::cout << "[CloudClip] exit.\n";
    return 0;
}
