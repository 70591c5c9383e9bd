#pragma once

#include <string>
#include <system_error>

#include "frame_codec.h"
#include "telemetry_record.h"

// Lifecycle hooks a Session reports through. `peer` is "address:port".
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void on_connection_opened(const std::string& peer) = 0;
    virtual void on_handshake_accepted(const std::string& peer, const HandshakeInfo& info) = 0;
    virtual void on_handshake_rejected(const std::string& peer, std::error_code reason) = 0;
    virtual void on_malformed_frame(const std::string& peer, std::error_code reason) = 0;
    virtual void on_record_filtered(const std::string& peer, const TelemetryRecord& record) = 0;
    // Raw socket failure, before it is folded into a close reason
    virtual void on_transport_error(const std::string& peer, std::error_code cause) = 0;
    // Fired exactly once per session; peer_disconnected is a normal close
    virtual void on_session_closed(const std::string& peer, std::error_code reason) = 0;
};

// Consumer of decoded records
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    virtual void publish(const TelemetryRecord& record) = 0;
};
