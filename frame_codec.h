#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <vector>

using Bytes    = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;
using RawId    = std::array<uint8_t, 4>;

// Identity fields carried by an inbound handshake
struct HandshakeInfo {
    RawId       sender_id{};    // device object id
    RawId       receiver_id{};  // data-center / sub id
    uint16_t    payload_len      = 0;
    uint8_t     payload_checksum = 0;
    uint8_t     header_checksum  = 0;
    std::string device_id;
};

// Raw telemetry values as they appear on the wire
struct TelemetryFields {
    uint32_t timestamp_epoch = 0;
    uint32_t latitude_raw    = 0;
    uint32_t longitude_raw   = 0;
    uint32_t speed           = 0;
};

// Pure encode/decode helpers for @NTC frames. Functions taking an
// error_code never throw; on failure they set it and return an empty value.
namespace frame_codec {

// Running XOR of every byte, 0 for an empty span
uint8_t checksum(ByteView bytes);

// Build a handshake frame: 16-byte header followed by the payload.
// Fails with invalid_argument if an id is not 4 bytes or the payload
// does not fit the 16-bit length field.
Bytes encode_handshake(ByteView sender_id, ByteView receiver_id, ByteView payload,
                       std::error_code& ec);

// Throwing variant, raises std::system_error
Bytes encode_handshake(ByteView sender_id, ByteView receiver_id, ByteView payload);

// Parse an inbound handshake. The device id is every byte after the first
// "S:" up to the end of the read, NULs included. Fails with encoding_error
// when the payload holds a non-ASCII byte. Checksums are not checked here,
// see verify_handshake.
HandshakeInfo decode_handshake(ByteView raw, std::error_code& ec);

// Check both handshake checksums against the declared payload length
void verify_handshake(ByteView raw, std::error_code& ec);

// Unpack the fixed-offset telemetry fields. Frames shorter than the layout
// fail with truncated; malformed_frame is reserved for a field read that
// would still run past the buffer, which the layout asserts rule out.
TelemetryFields decode_telemetry(ByteView raw, std::error_code& ec);

}  // namespace frame_codec
