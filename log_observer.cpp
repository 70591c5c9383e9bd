#include "log_observer.h"

#include <spdlog/fmt/bin_to_hex.h>

#include "logger.h"
#include "ntc_error.h"

void LoggingSessionObserver::on_connection_opened(const std::string& peer) {
    Log::info("New connection from {}", peer);
}

void LoggingSessionObserver::on_handshake_accepted(const std::string& peer, const HandshakeInfo& info) {
    Log::info("Handshake good: device '{}' at {} (object {:spn}, dc {:spn})", info.device_id, peer,
              spdlog::to_hex(info.sender_id.begin(), info.sender_id.end()),
              spdlog::to_hex(info.receiver_id.begin(), info.receiver_id.end()));
}

void LoggingSessionObserver::on_handshake_rejected(const std::string& peer, std::error_code reason) {
    Log::warn("Handshake from {} rejected: {}", peer, reason.message());
}

void LoggingSessionObserver::on_malformed_frame(const std::string& peer, std::error_code reason) {
    Log::error("Client {} sent broken data: {}", peer, reason.message());
}

void LoggingSessionObserver::on_record_filtered(const std::string& peer, const TelemetryRecord& record) {
    Log::warn("Dropping record from {} (device '{}'): timestamp {} is outside the current year", peer,
              record.device_id, format_timestamp(record.timestamp));
}

void LoggingSessionObserver::on_transport_error(const std::string& peer, std::error_code cause) {
    Log::error("Socket error on {}: {}", peer, cause.message());
}

void LoggingSessionObserver::on_session_closed(const std::string& peer, std::error_code reason) {
    if (reason == ntc_errc::peer_disconnected) {
        Log::info("Client {} disconnected", peer);
    } else {
        Log::warn("Session {} closed: {}", peer, reason.message());
    }
}

void JsonLogSink::publish(const TelemetryRecord& record) {
    nlohmann::ordered_json j = record;
    Log::info("{}", j.dump(4));
}
