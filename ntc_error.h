#pragma once

#include <system_error>

// Error conditions raised by the @NTC frame codec and session layer
enum class ntc_errc {
    truncated = 1,      // fewer bytes than the field being read needs
    bad_magic,          // handshake does not start with "@NTC"
    missing_device_id,  // "S:" marker absent from the handshake
    encoding_error,     // non-ASCII byte in the device identifier
    malformed_frame,    // telemetry field could not be unpacked
    bad_checksum,       // header or payload XOR does not match
    invalid_argument,   // encoder input out of range
    peer_disconnected,  // clean EOF from the device
    transport_error,    // socket or listener failure
    idle_timeout,       // peer stayed silent past the configured timeout
};

const std::error_category& ntc_category() noexcept;

std::error_code make_error_code(ntc_errc e) noexcept;

namespace std {
template <>
struct is_error_code_enum<ntc_errc> : true_type {};
}  // namespace std
