#include "frame_codec.h"

#include <algorithm>

#include "check.hpp"
#include "ntc_error.h"
#include "protocol.h"

using frame_layout::Field;

namespace {

bool fits(ByteView raw, const Field& field) {
    return raw.size() >= field.end();
}

ByteView slice(ByteView raw, const Field& field) {
    return raw.subspan(field.offset, field.size);
}

void place(std::span<uint8_t> dst, const Field& field, ByteView src) {
    std::copy_n(src.begin(), field.size, dst.begin() + static_cast<std::ptrdiff_t>(field.offset));
}

RawId read_id(ByteView raw, const Field& field) {
    RawId id{};
    auto  src = slice(raw, field);
    std::copy(src.begin(), src.end(), id.begin());
    return id;
}

uint16_t read_u16_le(ByteView raw, const Field& field) {
    auto src = slice(raw, field);
    return static_cast<uint16_t>(src[0] | (src[1] << 8));
}

// Unpack a little-endian u32, reporting malformed_frame instead of reading
// past the end of the buffer
uint32_t read_u32_le(ByteView raw, const Field& field, std::error_code& ec) {
    if (field.size != sizeof(uint32_t) || !fits(raw, field)) {
        ec = ntc_errc::malformed_frame;
        return 0;
    }
    auto src = slice(raw, field);
    return static_cast<uint32_t>(src[0]) | (static_cast<uint32_t>(src[1]) << 8) |
           (static_cast<uint32_t>(src[2]) << 16) | (static_cast<uint32_t>(src[3]) << 24);
}

bool is_ascii(ByteView bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b < 0x80; });
}

}  // namespace

namespace frame_codec {

uint8_t checksum(ByteView bytes) {
    uint8_t sum = 0;
    for (uint8_t b: bytes) {
        sum ^= b;
    }
    return sum;
}

Bytes encode_handshake(ByteView sender_id, ByteView receiver_id, ByteView payload,
                       std::error_code& ec) {
    namespace hs = frame_layout::handshake;

    ec.clear();
    if (sender_id.size() != hs::SENDER_ID.size || receiver_id.size() != hs::RECEIVER_ID.size ||
        payload.size() > hs::MAX_PAYLOAD_SIZE) {
        ec = ntc_errc::invalid_argument;
        return {};
    }

    std::array<uint8_t, hs::HEADER_SIZE> header{};
    const auto len = static_cast<uint16_t>(payload.size());
    const std::array<uint8_t, 2> len_le = {static_cast<uint8_t>(len & 0xFF),
                                           static_cast<uint8_t>(len >> 8)};

    place(header, hs::MAGIC_FIELD, frame_layout::MAGIC);
    place(header, hs::SENDER_ID, sender_id);
    place(header, hs::RECEIVER_ID, receiver_id);
    place(header, hs::PAYLOAD_LEN, len_le);
    header[hs::PAYLOAD_CHECKSUM.offset] = checksum(payload);
    header[hs::HEADER_CHECKSUM.offset]  = checksum(slice(header, hs::CHECKSUMMED_HEADER));

    Bytes frame;
    frame.reserve(header.size() + payload.size());
    frame.insert(frame.end(), header.begin(), header.end());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

Bytes encode_handshake(ByteView sender_id, ByteView receiver_id, ByteView payload) {
    std::error_code ec;
    Bytes           frame = encode_handshake(sender_id, receiver_id, payload, ec);
    throw_if_err(ec, "encode_handshake");
    return frame;
}

HandshakeInfo decode_handshake(ByteView raw, std::error_code& ec) {
    namespace hs = frame_layout::handshake;

    ec.clear();
    if (raw.size() < hs::HEADER_SIZE) {
        ec = ntc_errc::truncated;
        return {};
    }

    auto magic = slice(raw, hs::MAGIC_FIELD);
    if (!std::equal(magic.begin(), magic.end(), frame_layout::MAGIC.begin())) {
        ec = ntc_errc::bad_magic;
        return {};
    }

    HandshakeInfo info;
    info.sender_id        = read_id(raw, hs::SENDER_ID);
    info.receiver_id      = read_id(raw, hs::RECEIVER_ID);
    info.payload_len      = read_u16_le(raw, hs::PAYLOAD_LEN);
    info.payload_checksum = raw[hs::PAYLOAD_CHECKSUM.offset];
    info.header_checksum  = raw[hs::HEADER_CHECKSUM.offset];

    // The identifier runs from the first marker to the end of the read
    const auto& marker = frame_layout::DEVICE_ID_MARKER;
    auto        found  = std::search(raw.begin(), raw.end(), marker.begin(), marker.end());
    if (found == raw.end()) {
        ec = ntc_errc::missing_device_id;
        return {};
    }

    // Binary ids and checksums live in the header; the payload and the
    // identifier must be ASCII
    ByteView id_bytes(found + static_cast<std::ptrdiff_t>(marker.size()), raw.end());
    if (!is_ascii(raw.subspan(hs::HEADER_SIZE)) || !is_ascii(id_bytes)) {
        ec = ntc_errc::encoding_error;
        return {};
    }

    info.device_id.assign(id_bytes.begin(), id_bytes.end());
    return info;
}

void verify_handshake(ByteView raw, std::error_code& ec) {
    namespace hs = frame_layout::handshake;

    ec.clear();
    if (raw.size() < hs::HEADER_SIZE) {
        ec = ntc_errc::truncated;
        return;
    }

    if (checksum(slice(raw, hs::CHECKSUMMED_HEADER)) != raw[hs::HEADER_CHECKSUM.offset]) {
        ec = ntc_errc::bad_checksum;
        return;
    }

    const std::size_t payload_len = read_u16_le(raw, hs::PAYLOAD_LEN);
    if (raw.size() < hs::HEADER_SIZE + payload_len) {
        ec = ntc_errc::truncated;
        return;
    }

    if (checksum(raw.subspan(hs::HEADER_SIZE, payload_len)) != raw[hs::PAYLOAD_CHECKSUM.offset]) {
        ec = ntc_errc::bad_checksum;
    }
}

TelemetryFields decode_telemetry(ByteView raw, std::error_code& ec) {
    namespace tl = frame_layout::telemetry;

    ec.clear();
    if (raw.size() < tl::MIN_FRAME_SIZE) {
        ec = ntc_errc::truncated;
        return {};
    }

    TelemetryFields fields;
    fields.timestamp_epoch = read_u32_le(raw, tl::TIMESTAMP, ec);
    if (!ec) fields.latitude_raw = read_u32_le(raw, tl::LATITUDE, ec);
    if (!ec) fields.longitude_raw = read_u32_le(raw, tl::LONGITUDE, ec);
    if (!ec) fields.speed = read_u32_le(raw, tl::SPEED, ec);
    if (ec) {
        return {};
    }
    return fields;
}

}  // namespace frame_codec
