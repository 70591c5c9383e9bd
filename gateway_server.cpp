#include "gateway_server.h"

#include <string>
#include <utility>

#include "check.hpp"
#include "logger.h"
#include "ntc_error.h"

namespace {

// Log the socket-level cause, then surface it as a transport error
void fail_listen(const std::error_code& cause, const std::string& where) {
    if (cause) {
        Log::error("{}: {}", where, cause.message());
        throw_if_err(make_error_code(ntc_errc::transport_error), where + ": " + cause.message());
    }
}

}  // namespace

GatewayServer::GatewayServer(asio::io_context& io_context, const ServerConfig& config,
                             std::shared_ptr<SessionObserver> observer,
                             std::shared_ptr<TelemetrySink> sink)
    : io_context_(io_context),
      acceptor_(asio::make_strand(io_context)),
      observer_(std::move(observer)),
      sink_(std::move(sink)) {
    session_options_.verify_checksums = config.verify_checksums;
    session_options_.idle_timeout     = config.idle_timeout;

    open_acceptor(config);

    auto endpoint = local_endpoint();
    Log::info("NTC gateway listening on {}:{}", endpoint.address().to_string(), endpoint.port());
    if (!config.verify_checksums) {
        Log::warn("Handshake checksum verification is disabled");
    }

    start_accept();
}

void GatewayServer::open_acceptor(const ServerConfig& config) {
    const std::string where = "listen " + config.host + ":" + std::to_string(config.port);

    std::error_code ec;
    auto            address = asio::ip::make_address(config.host, ec);
    fail_listen(ec, where);

    asio::ip::tcp::endpoint endpoint(address, config.port);
    acceptor_.open(endpoint.protocol(), ec);
    fail_listen(ec, where);
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    fail_listen(ec, where);
    acceptor_.bind(endpoint, ec);
    fail_listen(ec, where);
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    fail_listen(ec, where);
}

asio::ip::tcp::endpoint GatewayServer::local_endpoint() const {
    std::error_code ec;
    auto            endpoint = acceptor_.local_endpoint(ec);
    throw_if_err(ec, "local_endpoint");
    return endpoint;
}

void GatewayServer::stop() {
    // The accept handler touches the acceptor on its strand, so close there too
    asio::dispatch(acceptor_.get_executor(), [this] {
        std::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            Log::error("Closing listener failed: {}", ec.message());
        }
    });
}

void GatewayServer::start_accept() {
    // Each session gets its own strand so handlers never overlap when the
    // io_context runs on several threads
    acceptor_.async_accept(asio::make_strand(io_context_),
                           [this](std::error_code ec, asio::ip::tcp::socket socket) {
                               if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                                   Log::info("Listener stopped");
                                   return;
                               }

                               if (!ec) {
                                   ++sessions_started_;
                                   std::make_shared<Session>(std::move(socket), observer_, sink_,
                                                             session_options_)
                                       ->start();
                               } else {
                                   Log::error("TCP accept error: {}", ec.message());
                               }

                               // Continue accepting new connections
                               start_accept();
                           });
}
