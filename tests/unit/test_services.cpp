#include "mock/mock_device.hpp"

#include <busq++/file_relay.hpp>
#include <busq++/screenshot.hpp>
#include <busq++/springboard.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace Busq;
using namespace BusqTest;

namespace {

const std::vector<uint8_t> kPng = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a};

Value dl(const char* name) {
    Value message = Value::new_array();
    message.append(Value::from_string(name)).unwrap();
    return message;
}

// screenshotr: greets with its DeviceLink version, answers ScreenShotRequest
class MockScreenshotr : public PlistEndpoint {
  public:
    explicit MockScreenshotr(uint64_t major = 300, uint64_t minor = 0) : major_(major), minor_(minor) {
        reply_format_ = Format::Binary;
    }

    std::vector<std::string> received;

  protected:
    std::vector<Value> greeting() override {
        Value hello = dl("DLMessageVersionExchange");
        hello.append(Value::from_uint(major_)).unwrap();
        hello.append(Value::from_uint(minor_)).unwrap();
        std::vector<Value> out;
        out.push_back(std::move(hello));
        return out;
    }

    std::vector<Value> handle(ValueRef request) override {
        std::string        name = request[0].as_string().value_or("");
        std::vector<Value> out;
        received.push_back(name);
        if (name == "DLMessageVersionExchange" &&
            request[1].as_string() == std::optional<std::string>("DLVersionsOk")) {
            out.push_back(dl("DLMessageDeviceReady"));
        } else if (name == "DLMessageProcessMessage") {
            Value body = Value::new_dict();
            body.set("MessageType", Value::from_string("ScreenShotReply")).unwrap();
            body.set("ScreenShotData", Value::from_data(kPng)).unwrap();
            Value reply = dl("DLMessageProcessMessage");
            reply.append(std::move(body)).unwrap();
            out.push_back(std::move(reply));
        }
        return out;
    }

  private:
    uint64_t major_;
    uint64_t minor_;
};

// springboardservices
class MockSpringboard : public PlistEndpoint {
  public:
    uint64_t orientation = 3;

  protected:
    std::vector<Value> handle(ValueRef request) override {
        std::string        command = request["command"].as_string().value_or("");
        Value              reply   = Value::new_dict();
        std::vector<Value> out;
        if (command == "getIconPNGData") {
            if (request["bundleId"].as_string() == std::optional<std::string>("com.apple.Preferences")) {
                reply.set("pngData", Value::from_data(kPng)).unwrap();
            }
        } else if (command == "getHomeScreenWallpaperPNGData") {
            reply.set("pngData", Value::from_data(kPng)).unwrap();
        } else if (command == "getInterfaceOrientation") {
            reply.set("interfaceOrientation", Value::from_uint(orientation)).unwrap();
        } else if (command == "getIconState") {
            Value page = Value::new_array();
            Value icon = Value::new_dict();
            icon.set("bundleIdentifier", Value::from_string("com.apple.mobilesafari")).unwrap();
            page.append(std::move(icon)).unwrap();
            Value pages = Value::new_array();
            pages.append(std::move(page)).unwrap();
            out.push_back(std::move(pages));
            return out;
        }
        out.push_back(std::move(reply));
        return out;
    }
};

// file_relay: acknowledges known sources, refuses the rest
class MockFileRelay : public PlistEndpoint {
  public:
    std::vector<std::string> requested;

  protected:
    std::vector<Value> handle(ValueRef request) override {
        Value              reply = Value::new_dict();
        std::vector<Value> out;
        ValueRef           sources = request["Sources"];
        for (size_t i = 0; i < sources.size(); ++i) {
            requested.push_back(sources[i].as_string().value_or(""));
        }
        if (std::find(requested.begin(), requested.end(), "VPN") != requested.end()) {
            reply.set("Error", Value::from_string("PermissionDenied")).unwrap();
        } else if (std::find(requested.begin(), requested.end(), "tmp") != requested.end()) {
            reply.set("Error", Value::from_string("StagingEmpty")).unwrap();
        } else {
            reply.set("Status", Value::from_string("Acknowledged")).unwrap();
        }
        out.push_back(std::move(reply));
        return out;
    }
};

template <typename E> std::shared_ptr<Pipe> pipe_to(std::shared_ptr<E> endpoint) {
    return std::make_shared<Pipe>(std::move(endpoint));
}

Connection conn_over(const std::shared_ptr<Pipe>& pipe) {
    return Connection::adopt(std::make_unique<MockStream>(pipe));
}

} // namespace

// -------- screenshotr --------

TEST(ScreenshotTest, VersionExchangeThenCapture) {
    auto endpoint = std::make_shared<MockScreenshotr>();
    auto pipe     = pipe_to(endpoint);

    auto client = ScreenshotClient::from_connection(conn_over(pipe));
    ASSERT_TRUE(client.is_ok());
    ASSERT_EQ(endpoint->received.size(), 1u);
    EXPECT_EQ(endpoint->received[0], "DLMessageVersionExchange");

    auto image = client.unwrap().take_screenshot();
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(image.unwrap(), kPng);

    client.unwrap().free();
    EXPECT_TRUE(client.unwrap().released());
    EXPECT_EQ(endpoint->received.back(), "DLMessageDisconnect");
    EXPECT_TRUE(pipe->closed());
}

TEST(ScreenshotTest, NewerDeviceLinkIsRejected) {
    auto pipe   = pipe_to(std::make_shared<MockScreenshotr>(301, 0));
    auto client = ScreenshotClient::from_connection(conn_over(pipe));
    ASSERT_TRUE(client.is_err());
    EXPECT_TRUE(client.unwrap_err().is(ScreenshotError::BadVersion));
    EXPECT_TRUE(pipe->closed());
}

TEST(ScreenshotTest, ReleasedClientRefusesWork) {
    auto client = ScreenshotClient::from_connection(conn_over(pipe_to(std::make_shared<MockScreenshotr>())))
                      .expect("screenshotr");
    client.free();
    EXPECT_TRUE(client.take_screenshot().unwrap_err().is(ScreenshotError::DeallocatedService));
}

TEST(ScreenshotTest, StartThroughLockdown) {
    auto env = MockEnvironment::create();
    env.add_service(ScreenshotClient::kServiceName, std::make_shared<MockScreenshotr>());
    auto device = env.device();

    auto client = ScreenshotClient::start(device, "busq-tests");
    ASSERT_TRUE(client.is_ok());
    EXPECT_EQ(client.unwrap().take_screenshot().unwrap().size(), kPng.size());
}

// -------- springboardservices --------

TEST(SpringboardTest, IconAndWallpaperData) {
    auto board = SpringboardClient::adopt(conn_over(pipe_to(std::make_shared<MockSpringboard>())));

    auto icon = board.get_icon_png_data("com.apple.Preferences");
    ASSERT_TRUE(icon.is_ok());
    EXPECT_EQ(icon.unwrap(), kPng);

    auto missing = board.get_icon_png_data("com.example.gone");
    ASSERT_TRUE(missing.is_err());
    EXPECT_TRUE(missing.unwrap_err().is(SpringboardError::Unknown));

    EXPECT_TRUE(board.get_icon_png_data("").unwrap_err().is(SpringboardError::InvalidArgument));
    EXPECT_EQ(board.get_home_screen_wallpaper_png_data().unwrap(), kPng);
}

TEST(SpringboardTest, InterfaceOrientation) {
    auto endpoint = std::make_shared<MockSpringboard>();
    auto board    = SpringboardClient::adopt(conn_over(pipe_to(endpoint)));

    auto orientation = board.get_interface_orientation();
    ASSERT_TRUE(orientation.is_ok());
    EXPECT_EQ(orientation.unwrap(), InterfaceOrientation::LandscapeRight);
    EXPECT_STREQ(to_string(orientation.unwrap()), "LandscapeRight");

    endpoint->orientation = 9;
    EXPECT_EQ(board.get_interface_orientation().unwrap(), InterfaceOrientation::Unknown);
}

TEST(SpringboardTest, IconStateAndRelease) {
    auto board = SpringboardClient::adopt(conn_over(pipe_to(std::make_shared<MockSpringboard>())));

    auto state = board.get_icon_state();
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.unwrap()[0][0]["bundleIdentifier"].as_string(),
              std::optional<std::string>("com.apple.mobilesafari"));

    board.free();
    EXPECT_TRUE(board.released());
    EXPECT_TRUE(board.get_interface_orientation().unwrap_err().is(SpringboardError::DeallocatedService));
}

// -------- file_relay --------

TEST(FileRelayTest, AcknowledgedRequestHandsOverTheStream) {
    auto endpoint = std::make_shared<MockFileRelay>();
    auto pipe     = pipe_to(endpoint);
    auto relay    = FileRelayClient::adopt(conn_over(pipe));

    auto archive = relay.request_sources({FileRelaySource::CrashReporter, FileRelaySource::SystemConfiguration});
    ASSERT_TRUE(archive.is_ok());
    EXPECT_TRUE(relay.released());
    EXPECT_EQ(endpoint->requested, (std::vector<std::string>{"CrashReporter", "SystemConfiguration"}));

    // The archive bytes follow on the same connection
    pipe->push(std::vector<uint8_t>{0x1f, 0x8b, 0x08, 0x00});
    auto magic = archive.unwrap().receive_exact(4, 1000);
    ASSERT_TRUE(magic.is_ok());
    EXPECT_EQ(magic.unwrap()[0], 0x1f);
    EXPECT_EQ(magic.unwrap()[1], 0x8b);

    EXPECT_TRUE(relay.request_sources({FileRelaySource::Tmp}).unwrap_err().is(FileRelayError::DeallocatedClient));
}

TEST(FileRelayTest, DeviceRefusalsMapToKinds) {
    {
        auto relay  = FileRelayClient::adopt(conn_over(pipe_to(std::make_shared<MockFileRelay>())));
        auto denied = relay.request_sources({FileRelaySource::Vpn});
        ASSERT_TRUE(denied.is_err());
        EXPECT_TRUE(denied.unwrap_err().is(FileRelayError::PermissionDenied));
        EXPECT_FALSE(relay.released());
    }
    {
        auto relay = FileRelayClient::adopt(conn_over(pipe_to(std::make_shared<MockFileRelay>())));
        EXPECT_TRUE(relay.request_sources({FileRelaySource::Tmp}).unwrap_err().is(FileRelayError::StagingEmpty));
    }
}

TEST(FileRelayTest, NeedsAtLeastOneSource) {
    auto relay = FileRelayClient::adopt(conn_over(pipe_to(std::make_shared<MockFileRelay>())));
    EXPECT_TRUE(relay.request_sources({}).unwrap_err().is(FileRelayError::InvalidArgument));
    EXPECT_STREQ(to_string(FileRelaySource::Vpn), "VPN");
    EXPECT_STREQ(to_string(FileRelaySource::Tmp), "tmp");
}
