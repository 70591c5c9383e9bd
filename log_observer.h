#pragma once

#include "session_observer.h"

// Default observer: one log line per session event
class LoggingSessionObserver final : public SessionObserver {
public:
    void on_connection_opened(const std::string& peer) override;
    void on_handshake_accepted(const std::string& peer, const HandshakeInfo& info) override;
    void on_handshake_rejected(const std::string& peer, std::error_code reason) override;
    void on_malformed_frame(const std::string& peer, std::error_code reason) override;
    void on_record_filtered(const std::string& peer, const TelemetryRecord& record) override;
    void on_transport_error(const std::string& peer, std::error_code cause) override;
    void on_session_closed(const std::string& peer, std::error_code reason) override;
};

// Default sink: pretty-printed JSON into the log stream
class JsonLogSink final : public TelemetrySink {
public:
    void publish(const TelemetryRecord& record) override;
};
