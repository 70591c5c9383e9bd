#pragma once

#include <cstddef>
#include <memory>

#include <asio.hpp>

#include "server_config.h"
#include "session.h"
#include "session_observer.h"

// Accepts device connections and gives each one its own Session.
// Throws std::system_error (ntc_errc::transport_error) when the listen
// address cannot be parsed or bound.
class GatewayServer {
public:
    GatewayServer(asio::io_context& io_context, const ServerConfig& config,
                  std::shared_ptr<SessionObserver> observer, std::shared_ptr<TelemetrySink> sink);

    GatewayServer(const GatewayServer&)            = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    // Actual bound endpoint, useful when the configured port is 0
    asio::ip::tcp::endpoint local_endpoint() const;

    // Stop accepting; sessions already running are left alone. Safe to call
    // from any thread, the close runs on the listener's strand.
    void stop();

    std::size_t sessions_started() const {
        return sessions_started_;
    }

private:
    void open_acceptor(const ServerConfig& config);
    void start_accept();

    asio::io_context&                io_context_;
    asio::ip::tcp::acceptor          acceptor_;
    std::shared_ptr<SessionObserver> observer_;
    std::shared_ptr<TelemetrySink>   sink_;
    SessionOptions                   session_options_;
    std::size_t                      sessions_started_ = 0;
};
