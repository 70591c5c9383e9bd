#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include <asio.hpp>

#include "frame_codec.h"
#include "server_config.h"
#include "session_observer.h"

struct SessionOptions {
    // Reject handshakes whose header or payload checksum does not match
    bool verify_checksums = true;

    // Close the session when a read or write stalls this long; 0 disables
    std::chrono::milliseconds idle_timeout = server_config::DEFAULT_IDLE_TIMEOUT;

    // Wall clock used by the current-year filter
    std::function<std::chrono::system_clock::time_point()> clock = [] {
        return std::chrono::system_clock::now();
    };
};

// One device connection: handshake exchange, then a telemetry read loop
// until the peer leaves or sends a frame that cannot be decoded.
//
// Each read is treated as exactly one frame. Bytes of a frame split across
// two reads are decoded separately and the short part ends the session.
class Session : public std::enable_shared_from_this<Session> {
public:
    enum class State { AwaitingHandshake, Streaming, Closed };

    Session(asio::ip::tcp::socket socket, std::shared_ptr<SessionObserver> observer,
            std::shared_ptr<TelemetrySink> sink, SessionOptions options = {});

    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;

    // Must be called on a shared_ptr-owned instance
    void start();

    State state() const {
        return state_;
    }

    const std::string& peer() const {
        return peer_;
    }

    const std::string& device_id() const {
        return identity_.device_id;
    }

    std::size_t records_published() const {
        return records_published_;
    }

private:
    void do_read_handshake();
    void on_handshake(std::error_code ec, std::size_t length);
    void on_reply_sent(std::error_code ec);

    void do_read_telemetry();
    void on_telemetry(std::error_code ec, std::size_t length);

    void handle_io_error(std::error_code ec);
    void arm_idle_timer();
    void close(std::error_code reason);

    asio::ip::tcp::socket            socket_;
    asio::steady_timer               idle_timer_;
    std::shared_ptr<SessionObserver> observer_;
    std::shared_ptr<TelemetrySink>   sink_;
    SessionOptions                   options_;

    State       state_     = State::AwaitingHandshake;
    bool        timed_out_ = false;
    std::string peer_;

    HandshakeInfo                                     identity_;
    std::array<uint8_t, server_config::RECV_BUF_SIZE> recv_buf_{};
    Bytes                                             reply_;
    std::size_t                                       records_published_ = 0;
};
