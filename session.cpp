#include "session.h"

#include <utility>

#include "ntc_error.h"
#include "protocol.h"
#include "telemetry_record.h"

namespace {

std::string describe_peer(const asio::ip::tcp::socket& socket) {
    std::error_code ec;
    auto            endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "<unknown peer>";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

}  // namespace

Session::Session(asio::ip::tcp::socket socket, std::shared_ptr<SessionObserver> observer,
                 std::shared_ptr<TelemetrySink> sink, SessionOptions options)
    : socket_(std::move(socket)),
      idle_timer_(socket_.get_executor()),
      observer_(std::move(observer)),
      sink_(std::move(sink)),
      options_(std::move(options)),
      peer_(describe_peer(socket_)) {}

void Session::start() {
    observer_->on_connection_opened(peer_);
    do_read_handshake();
}

void Session::do_read_handshake() {
    arm_idle_timer();
    socket_.async_read_some(asio::buffer(recv_buf_),
                            [self = shared_from_this()](std::error_code ec, std::size_t length) {
                                self->on_handshake(ec, length);
                            });
}

void Session::on_handshake(std::error_code ec, std::size_t length) {
    idle_timer_.cancel();
    if (ec || length == 0) {
        handle_io_error(ec);
        return;
    }

    const ByteView  frame(recv_buf_.data(), length);
    std::error_code decode_ec;
    HandshakeInfo   info = frame_codec::decode_handshake(frame, decode_ec);
    if (!decode_ec && options_.verify_checksums) {
        frame_codec::verify_handshake(frame, decode_ec);
    }
    if (decode_ec) {
        // No retry: a short or garbled handshake ends the connection
        observer_->on_handshake_rejected(peer_, decode_ec);
        close(decode_ec);
        return;
    }
    identity_ = std::move(info);

    // Server answers as the receiver, so the ids come back swapped
    std::error_code encode_ec;
    reply_ = frame_codec::encode_handshake(identity_.receiver_id, identity_.sender_id,
                                           frame_layout::HANDSHAKE_ACK, encode_ec);
    if (encode_ec) {
        observer_->on_handshake_rejected(peer_, encode_ec);
        close(encode_ec);
        return;
    }

    arm_idle_timer();
    asio::async_write(socket_, asio::buffer(reply_),
                      [self = shared_from_this()](std::error_code write_ec, std::size_t) {
                          self->on_reply_sent(write_ec);
                      });
}

void Session::on_reply_sent(std::error_code ec) {
    idle_timer_.cancel();
    if (ec) {
        handle_io_error(ec);
        return;
    }

    state_ = State::Streaming;
    observer_->on_handshake_accepted(peer_, identity_);
    do_read_telemetry();
}

void Session::do_read_telemetry() {
    arm_idle_timer();
    socket_.async_read_some(asio::buffer(recv_buf_),
                            [self = shared_from_this()](std::error_code ec, std::size_t length) {
                                self->on_telemetry(ec, length);
                            });
}

void Session::on_telemetry(std::error_code ec, std::size_t length) {
    idle_timer_.cancel();
    if (ec || length == 0) {
        handle_io_error(ec);
        return;
    }

    std::error_code decode_ec;
    auto fields = frame_codec::decode_telemetry(ByteView(recv_buf_.data(), length), decode_ec);
    if (decode_ec) {
        // Fail closed: after a bad frame the stream boundaries can't be trusted
        observer_->on_malformed_frame(peer_, decode_ec);
        close(decode_ec);
        return;
    }

    TelemetryRecord record = make_record(identity_.device_id, fields);
    if (is_current_year(record, options_.clock())) {
        ++records_published_;
        sink_->publish(record);
    } else {
        observer_->on_record_filtered(peer_, record);
    }

    do_read_telemetry();
}

void Session::handle_io_error(std::error_code ec) {
    if (timed_out_) {
        close(ntc_errc::idle_timeout);
    } else if (!ec || ec == asio::error::eof) {
        // Zero-length read or orderly shutdown from the device
        close(ntc_errc::peer_disconnected);
    } else {
        observer_->on_transport_error(peer_, ec);
        close(ntc_errc::transport_error);
    }
}

void Session::arm_idle_timer() {
    if (options_.idle_timeout <= std::chrono::milliseconds::zero()) {
        return;
    }

    idle_timer_.expires_after(options_.idle_timeout);
    idle_timer_.async_wait([self = shared_from_this()](std::error_code ec) {
        if (ec || self->state_ == State::Closed) {
            return;  // cancelled by a completed operation
        }
        // Re-armed since this wait was queued
        if (self->idle_timer_.expiry() > asio::steady_timer::clock_type::now()) {
            return;
        }

        // Abort the pending operation; its handler closes the session
        self->timed_out_ = true;
        std::error_code cancel_ec;
        self->socket_.cancel(cancel_ec);
        if (cancel_ec) {
            self->observer_->on_transport_error(self->peer_, cancel_ec);
            self->close(ntc_errc::idle_timeout);
        }
    });
}

void Session::close(std::error_code reason) {
    if (state_ == State::Closed) {
        return;
    }
    state_ = State::Closed;
    idle_timer_.cancel();

    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected) {
        observer_->on_transport_error(peer_, ec);
    }
    socket_.close(ec);
    if (ec) {
        observer_->on_transport_error(peer_, ec);
    }

    observer_->on_session_closed(peer_, reason);
}
