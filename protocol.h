#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

// @NTC wire layout. Every byte offset used by the codec lives here.

namespace frame_layout {

// Fixed-offset span inside a frame
struct Field {
    std::size_t offset;
    std::size_t size;

    constexpr std::size_t end() const {
        return offset + size;
    }
};

constexpr std::array<uint8_t, 4> MAGIC = {'@', 'N', 'T', 'C'};

// Marker preceding the ASCII device identifier inside the handshake
constexpr std::string_view DEVICE_ID_MARKER = "S:";

namespace handshake {
constexpr Field MAGIC_FIELD      = {0, 4};
constexpr Field SENDER_ID        = {4, 4};
constexpr Field RECEIVER_ID      = {8, 4};
constexpr Field PAYLOAD_LEN      = {12, 2};  // little-endian u16
constexpr Field PAYLOAD_CHECKSUM = {14, 1};
constexpr Field HEADER_CHECKSUM  = {15, 1};

constexpr std::size_t HEADER_SIZE      = 16;
constexpr std::size_t MAX_PAYLOAD_SIZE = 0xFFFF;

// Header checksum covers bytes [0, HEADER_CHECKSUM.offset)
constexpr Field CHECKSUMMED_HEADER = {0, HEADER_CHECKSUM.offset};

static_assert(HEADER_CHECKSUM.end() == HEADER_SIZE);
}  // namespace handshake

namespace telemetry {
// All fields are little-endian u32; bytes outside these spans are unused
constexpr Field TIMESTAMP = {8, 4};  // Unix epoch seconds
constexpr Field LATITUDE  = {20, 4};  // degrees * COORDINATE_SCALE
constexpr Field LONGITUDE = {24, 4};  // degrees * COORDINATE_SCALE
constexpr Field SPEED     = {28, 4};

constexpr std::size_t MIN_FRAME_SIZE   = SPEED.end();
constexpr double      COORDINATE_SCALE = 1'000'000.0;

static_assert(MIN_FRAME_SIZE == 32);
static_assert(TIMESTAMP.end() <= MIN_FRAME_SIZE && LATITUDE.end() <= MIN_FRAME_SIZE &&
              LONGITUDE.end() <= MIN_FRAME_SIZE);
}  // namespace telemetry

// Payload the server sends back in its handshake reply
constexpr std::array<uint8_t, 3> HANDSHAKE_ACK = {'*', '<', 'S'};

}  // namespace frame_layout
