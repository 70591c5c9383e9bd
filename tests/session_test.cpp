#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <string>
#include <thread>

#include <asio.hpp>

#include "frame_codec.h"
#include "ntc_error.h"
#include "protocol.h"
#include "session.h"
#include "test_support.h"

using namespace test_support;

namespace hs = frame_layout::handshake;

namespace {

const RawId OBJECT_ID = {'A', 'A', 'A', 'A'};
const RawId DC_ID     = {'B', 'B', 'B', 'B'};

Bytes device_handshake() {
    return frame_codec::encode_handshake(OBJECT_ID, DC_ID, to_bytes("S:DEV001"));
}

// 20 bytes: header declaring an 8-byte payload, followed by only "S:DE"
Bytes short_payload_handshake() {
    Bytes frame = device_handshake();
    frame.resize(hs::HEADER_SIZE + 4);
    return frame;
}

}  // namespace

class SessionTest : public ::testing::Test {
protected:
    void start(SessionOptions options = {}) {
        options.clock = fixed_now;
        session_ = std::make_shared<Session>(std::move(pair_.server), observer_, sink_, options);
        session_->start();
        io_thread_ = std::thread([this] { pair_.io.run(); });
    }

    void send(const Bytes& bytes) {
        asio::write(pair_.client, asio::buffer(bytes));
    }

    Bytes read_reply() {
        Bytes reply(hs::HEADER_SIZE + frame_layout::HANDSHAKE_ACK.size());
        asio::read(pair_.client, asio::buffer(reply));
        return reply;
    }

    void complete_handshake() {
        send(device_handshake());
        read_reply();
    }

    // Client half-close, the device's orderly goodbye
    void hang_up() {
        pair_.client.shutdown(asio::ip::tcp::socket::shutdown_send);
    }

    bool client_sees_eof() {
        std::array<uint8_t, 64> buf{};
        std::error_code         ec;
        pair_.client.read_some(asio::buffer(buf), ec);
        return ec == asio::error::eof;
    }

    void join() {
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    void TearDown() override {
        std::error_code ec;
        pair_.client.close(ec);
        join();
    }

    LoopbackPair                       pair_;
    std::shared_ptr<RecordingObserver> observer_ = std::make_shared<RecordingObserver>();
    std::shared_ptr<RecordingSink>     sink_     = std::make_shared<RecordingSink>();
    std::shared_ptr<Session>           session_;
    std::thread                        io_thread_;
};

TEST_F(SessionTest, RepliesWithSwappedIdsAndAck) {
    start();
    send(device_handshake());
    const Bytes reply = read_reply();

    ASSERT_EQ(reply.size(), 19u);
    std::error_code ec;

    EXPECT_EQ(std::string(reply.begin(), reply.begin() + 4), "@NTC");
    EXPECT_EQ(std::string(reply.begin() + 4, reply.begin() + 8), "BBBB");
    EXPECT_EQ(std::string(reply.begin() + 8, reply.begin() + 12), "AAAA");
    EXPECT_EQ(reply[hs::PAYLOAD_LEN.offset], 3);
    EXPECT_EQ(std::string(reply.begin() + 16, reply.end()), "*<S");
    frame_codec::verify_handshake(reply, ec);
    EXPECT_FALSE(ec) << ec.message();

    hang_up();
    ASSERT_TRUE(observer_->wait_closed());
    join();

    ASSERT_EQ(observer_->opened.size(), 1u);
    ASSERT_EQ(observer_->accepted.size(), 1u);
    EXPECT_EQ(observer_->accepted[0].device_id, "DEV001");
    EXPECT_EQ(observer_->accepted[0].sender_id, OBJECT_ID);
    EXPECT_EQ(observer_->accepted[0].receiver_id, DC_ID);
    ASSERT_EQ(observer_->closed.size(), 1u);
    EXPECT_EQ(observer_->closed[0], ntc_errc::peer_disconnected);
    EXPECT_EQ(session_->state(), Session::State::Closed);
    EXPECT_EQ(session_->device_id(), "DEV001");
}

TEST_F(SessionTest, PublishesCurrentYearRecords) {
    start();
    complete_handshake();

    send(make_telemetry_frame(NOW_EPOCH, 55751244, 37618423, 60));
    ASSERT_TRUE(sink_->wait_records(1));
    send(make_telemetry_frame(NOW_EPOCH + 10, 55751300, 37618500, 62));
    ASSERT_TRUE(sink_->wait_records(2));

    hang_up();
    ASSERT_TRUE(observer_->wait_closed());
    join();

    ASSERT_EQ(sink_->records.size(), 2u);
    EXPECT_EQ(sink_->records[0].device_id, "DEV001");
    EXPECT_EQ(format_timestamp(sink_->records[0].timestamp), "2026-05-28 20:26:40");
    EXPECT_NEAR(sink_->records[0].latitude, 55.751244, 1e-9);
    EXPECT_NEAR(sink_->records[0].longitude, 37.618423, 1e-9);
    EXPECT_EQ(sink_->records[0].speed, 60u);
    EXPECT_EQ(sink_->records[1].speed, 62u);
    EXPECT_EQ(session_->records_published(), 2u);
    EXPECT_TRUE(observer_->malformed.empty());
    EXPECT_EQ(observer_->closed[0], ntc_errc::peer_disconnected);
}

TEST_F(SessionTest, FiltersRecordsOutsideCurrentYear) {
    start();
    complete_handshake();

    send(make_telemetry_frame(0, 64, 42, 5));
    ASSERT_TRUE(observer_->wait_until([this] { return !observer_->filtered.empty(); }));

    hang_up();
    ASSERT_TRUE(observer_->wait_closed());
    join();

    EXPECT_TRUE(sink_->records.empty());
    ASSERT_EQ(observer_->filtered.size(), 1u);
    EXPECT_EQ(observer_->filtered[0].speed, 5u);
    EXPECT_TRUE(observer_->malformed.empty());
    EXPECT_EQ(observer_->closed[0], ntc_errc::peer_disconnected);
}

TEST_F(SessionTest, ShortTelemetryFrameEndsSession) {
    start();
    complete_handshake();

    send(make_telemetry_frame(NOW_EPOCH, 1, 2, 3, 31));
    ASSERT_TRUE(observer_->wait_closed());
    EXPECT_TRUE(client_sees_eof());
    join();

    ASSERT_EQ(observer_->malformed.size(), 1u);
    EXPECT_EQ(observer_->malformed[0], ntc_errc::truncated);
    EXPECT_TRUE(sink_->records.empty());
    ASSERT_EQ(observer_->closed.size(), 1u);
    EXPECT_EQ(observer_->closed[0], ntc_errc::truncated);
}

TEST_F(SessionTest, DisconnectBeforeHandshake) {
    start();
    hang_up();
    ASSERT_TRUE(observer_->wait_closed());
    join();

    EXPECT_TRUE(observer_->accepted.empty());
    EXPECT_TRUE(observer_->rejected.empty());
    EXPECT_TRUE(observer_->transport_errors.empty());
    EXPECT_EQ(observer_->closed[0], ntc_errc::peer_disconnected);
}

TEST_F(SessionTest, BadMagicClosesWithoutReply) {
    start();
    Bytes frame = device_handshake();
    frame[0]    = 'X';
    send(frame);

    ASSERT_TRUE(observer_->wait_closed());
    EXPECT_TRUE(client_sees_eof());
    join();

    ASSERT_EQ(observer_->rejected.size(), 1u);
    EXPECT_EQ(observer_->rejected[0], ntc_errc::bad_magic);
    EXPECT_EQ(observer_->closed[0], ntc_errc::bad_magic);
    EXPECT_TRUE(observer_->accepted.empty());
}

TEST_F(SessionTest, CorruptChecksumIsRejected) {
    start();
    Bytes frame = device_handshake();
    frame[hs::HEADER_SIZE + 3] ^= 0x01;
    send(frame);

    ASSERT_TRUE(observer_->wait_closed());
    join();

    ASSERT_EQ(observer_->rejected.size(), 1u);
    EXPECT_EQ(observer_->rejected[0], ntc_errc::bad_checksum);
}

TEST_F(SessionTest, MissingDeviceIdIsRejected) {
    start();
    send(frame_codec::encode_handshake(OBJECT_ID, DC_ID, to_bytes("DEV01")));

    ASSERT_TRUE(observer_->wait_closed());
    join();

    ASSERT_EQ(observer_->rejected.size(), 1u);
    EXPECT_EQ(observer_->rejected[0], ntc_errc::missing_device_id);
}

TEST_F(SessionTest, PayloadShorterThanDeclaredIsRejected) {
    start();
    send(short_payload_handshake());

    ASSERT_TRUE(observer_->wait_closed());
    join();

    ASSERT_EQ(observer_->rejected.size(), 1u);
    EXPECT_EQ(observer_->rejected[0], ntc_errc::truncated);
}

TEST_F(SessionTest, LenientModeTrustsUnverifiedHandshake) {
    SessionOptions options;
    options.verify_checksums = false;
    start(options);

    const Bytes frame = short_payload_handshake();
    ASSERT_EQ(frame.size(), 20u);
    send(frame);
    EXPECT_EQ(read_reply().size(), 19u);

    hang_up();
    ASSERT_TRUE(observer_->wait_closed());
    join();

    ASSERT_EQ(observer_->accepted.size(), 1u);
    EXPECT_EQ(observer_->accepted[0].device_id, "DE");
    EXPECT_TRUE(observer_->rejected.empty());
}

TEST_F(SessionTest, SplitHandshakeIsNotReassembled) {
    start();
    const Bytes frame = device_handshake();
    send(Bytes(frame.begin(), frame.begin() + 10));

    ASSERT_TRUE(observer_->wait_closed());
    join();

    ASSERT_EQ(observer_->rejected.size(), 1u);
    EXPECT_EQ(observer_->rejected[0], ntc_errc::truncated);
}

TEST_F(SessionTest, IdleTimeoutClosesSilentPeer) {
    SessionOptions options;
    options.idle_timeout = std::chrono::milliseconds(100);
    start(options);

    ASSERT_TRUE(observer_->wait_closed());
    EXPECT_TRUE(client_sees_eof());
    join();

    EXPECT_EQ(observer_->closed[0], ntc_errc::idle_timeout);
    EXPECT_TRUE(observer_->transport_errors.empty());
}

TEST_F(SessionTest, IdleTimeoutIsRearmedByTraffic) {
    SessionOptions options;
    options.idle_timeout = std::chrono::milliseconds(300);
    start(options);

    complete_handshake();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    send(make_telemetry_frame(NOW_EPOCH, 1, 2, 3));
    ASSERT_TRUE(sink_->wait_records(1));

    ASSERT_TRUE(observer_->wait_closed());
    join();

    EXPECT_EQ(sink_->records.size(), 1u);
    EXPECT_EQ(observer_->closed[0], ntc_errc::idle_timeout);
}
