#include "mock/mock_device.hpp"

#include <busq++/connection.hpp>
#include <busq++/property_list_service.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace Busq;
using namespace BusqTest;

namespace {

// Swallows whatever the host sends
class SilentEndpoint : public Endpoint {
  public:
    std::vector<uint8_t> on_data(const uint8_t*, size_t) override { return {}; }
};

// Answers every chunk with the same bytes
class EchoEndpoint : public Endpoint {
  public:
    std::vector<uint8_t> on_data(const uint8_t* data, size_t len) override {
        return std::vector<uint8_t>(data, data + len);
    }
};

struct Wired {
    std::shared_ptr<Pipe> pipe;
    Connection            conn;
};

Wired wire(std::shared_ptr<Endpoint> endpoint, std::unique_ptr<SecureChannel> security = nullptr) {
    auto pipe = std::make_shared<Pipe>(std::move(endpoint));
    auto conn = Connection::adopt(std::make_unique<MockStream>(pipe), std::move(security));
    return Wired{pipe, std::move(conn)};
}

} // namespace

TEST(ConnectionTest, ReceiveWithTimeoutReturnsNothingOnSilence) {
    auto w = wire(std::make_shared<SilentEndpoint>());
    auto r = w.conn.receive(16, 20);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.unwrap().empty());
}

TEST(ConnectionTest, ReceiveExactDistinguishesTimeoutFromShortRead) {
    auto w = wire(std::make_shared<SilentEndpoint>());

    auto nothing = w.conn.receive_exact(4, 20);
    ASSERT_TRUE(nothing.is_err());
    EXPECT_TRUE(nothing.unwrap_err().is(MobileDeviceError::Timeout));

    w.pipe->push(std::string("ab"));
    auto partial = w.conn.receive_exact(4, 20);
    ASSERT_TRUE(partial.is_err());
    EXPECT_TRUE(partial.unwrap_err().is(MobileDeviceError::NotEnoughData));
}

TEST(ConnectionTest, ReceiveExactAssemblesChunks) {
    auto w = wire(std::make_shared<SilentEndpoint>());
    w.pipe->push(std::string("he"));
    w.pipe->push(std::string("llo"));
    auto r = w.conn.receive_exact(5, 100);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(std::string(r.unwrap().begin(), r.unwrap().end()), "hello");
}

TEST(ConnectionTest, SendReachesThePeer) {
    auto                 w       = wire(std::make_shared<EchoEndpoint>());
    std::vector<uint8_t> payload = {1, 2, 3};
    ASSERT_TRUE(w.conn.send_all(payload).is_ok());
    EXPECT_EQ(w.pipe->written(), payload);
    EXPECT_EQ(w.conn.receive_exact(3, 100).unwrap(), payload);
}

TEST(ConnectionTest, DisconnectIsTerminal) {
    auto w = wire(std::make_shared<EchoEndpoint>());
    w.conn.disconnect();
    EXPECT_FALSE(w.conn.connected());
    EXPECT_TRUE(w.pipe->closed());

    uint8_t byte = 0;
    auto    sent = w.conn.send(&byte, 1);
    ASSERT_TRUE(sent.is_err());
    EXPECT_TRUE(sent.unwrap_err().is(MobileDeviceError::Disconnected));
    EXPECT_TRUE(w.conn.receive(1).unwrap_err().is(MobileDeviceError::Disconnected));
    EXPECT_TRUE(w.conn.fd().is_err());
}

TEST(ConnectionTest, PeerCloseSurfacesAsDisconnected) {
    auto w = wire(std::make_shared<SilentEndpoint>());
    w.pipe->close();
    auto r = w.conn.receive(8, 20);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(MobileDeviceError::Disconnected));
}

TEST(ConnectionTest, SecurityNeedsAChannel) {
    auto w = wire(std::make_shared<EchoEndpoint>());
    auto r = w.conn.enable_security();
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(MobileDeviceError::SslError));
    EXPECT_FALSE(w.conn.security_enabled());
}

TEST(ConnectionTest, SecureChannelCarriesTraffic) {
    auto w = wire(std::make_shared<EchoEndpoint>(), std::make_unique<PassthroughChannel>());
    ASSERT_TRUE(w.conn.enable_security().is_ok());
    EXPECT_TRUE(w.conn.security_enabled());

    std::vector<uint8_t> payload = {9, 8, 7};
    ASSERT_TRUE(w.conn.send_all(payload).is_ok());
    EXPECT_EQ(w.conn.receive_exact(3, 100).unwrap(), payload);

    ASSERT_TRUE(w.conn.disable_security().is_ok());
    EXPECT_FALSE(w.conn.security_enabled());
}

TEST(PropertyListServiceTest, FramesWithBigEndianLength) {
    auto                w = wire(std::make_shared<SilentEndpoint>());
    PropertyListService service(std::move(w.conn));

    Value message = Value::new_dict();
    message.set("Request", Value::from_string("QueryType")).unwrap();
    ASSERT_TRUE(service.send(message, Format::Binary).is_ok());

    auto bytes = w.pipe->written();
    ASSERT_GT(bytes.size(), 4u);
    uint32_t n = (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16) |
                 (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]);
    EXPECT_EQ(n + 4, bytes.size());
    EXPECT_TRUE(Value::is_binary(bytes.data() + 4, n));
}

TEST(PropertyListServiceTest, ReceivesEitherEncoding) {
    auto                w = wire(std::make_shared<SilentEndpoint>());
    PropertyListService service(std::move(w.conn));

    Value message = Value::new_dict();
    message.set("Status", Value::from_string("Complete")).unwrap();
    w.pipe->push(PlistEndpoint::frame(message, Format::Xml));
    w.pipe->push(PlistEndpoint::frame(message, Format::Binary));

    EXPECT_TRUE(service.receive(100).expect("xml") == message);
    EXPECT_TRUE(service.receive(100).expect("binary") == message);
}

TEST(PropertyListServiceTest, RejectsZeroAndOversizedLengths) {
    auto                w = wire(std::make_shared<SilentEndpoint>());
    PropertyListService service(std::move(w.conn));

    w.pipe->push(std::vector<uint8_t>{0, 0, 0, 0});
    auto empty = service.receive(100);
    ASSERT_TRUE(empty.is_err());
    EXPECT_TRUE(empty.unwrap_err().is(PlistError::FormatError));

    w.pipe->push(std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF});
    auto huge = service.receive(100);
    ASSERT_TRUE(huge.is_err());
    EXPECT_TRUE(huge.unwrap_err().is(PlistError::FormatError));
}

TEST(PropertyListServiceTest, TimeoutOnlyCoversTheStartOfAMessage) {
    auto                w = wire(std::make_shared<SilentEndpoint>());
    PropertyListService service(std::move(w.conn));

    auto nothing = service.receive(50);
    ASSERT_TRUE(nothing.is_err());
    EXPECT_TRUE(nothing.unwrap_err().is(MobileDeviceError::Timeout));

    Value message = Value::new_dict();
    message.set("Status", Value::from_string("Complete")).unwrap();
    auto frame = PlistEndpoint::frame(message, Format::Xml);
    auto pipe  = w.pipe;
    w.pipe->push(std::vector<uint8_t>(frame.begin(), frame.begin() + 4));
    std::thread late([pipe, frame] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        pipe->push(std::vector<uint8_t>(frame.begin() + 4, frame.end()));
    });
    auto received = service.receive(50);
    late.join();
    ASSERT_TRUE(received.is_ok());
    EXPECT_TRUE(received.unwrap() == message);

    // Nothing was left behind to be misread as the next prefix
    auto after = service.receive(50);
    ASSERT_TRUE(after.is_err());
    EXPECT_TRUE(after.unwrap_err().is(MobileDeviceError::Timeout));
}

TEST(PropertyListServiceTest, HangupMidBodyIsDisconnected) {
    auto                w = wire(std::make_shared<SilentEndpoint>());
    PropertyListService service(std::move(w.conn));

    w.pipe->push(std::vector<uint8_t>{0, 0, 0, 10, '<', '?'});
    w.pipe->close();
    auto r = service.receive(50);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(MobileDeviceError::Disconnected));
}
