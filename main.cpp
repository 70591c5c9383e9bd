#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "gateway_server.h"
#include "log_observer.h"
#include "logger.h"
#include "server_config.h"

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = parse_server_config(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ntc_gateway: " << e.what() << "\n" << usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    auto& log = Logger::instance();
    log.init(config.log_level, config.log_file);

    int status = 0;
    try {
        asio::io_context io_context;

        GatewayServer server(io_context, config, std::make_shared<LoggingSessionObserver>(),
                             std::make_shared<JsonLogSink>());

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](std::error_code ec, int signo) {
            if (ec) {
                return;
            }
            Log::info("Received signal {}, shutting down", signo);
            server.stop();
            io_context.stop();
        });

        std::vector<std::thread> workers;
        for (std::size_t i = 1; i < config.threads; ++i) {
            workers.emplace_back([&io_context] { io_context.run(); });
        }
        auto join_workers = [&workers] {
            for (auto& worker: workers) {
                worker.join();
            }
        };
        try {
            io_context.run();
        } catch (...) {
            io_context.stop();
            join_workers();
            throw;
        }
        join_workers();
    } catch (const std::system_error& e) {
        Log::error("Network or port error: {}", e.what());
        status = 1;
    } catch (const std::exception& e) {
        Log::error("ERR: {}", e.what());
        status = 1;
    }

    log.shutdown();
    return status;
}
