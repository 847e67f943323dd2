#include "mock/mock_device.hpp"

#include <busq++/device.hpp>
#include <busq++/lockdown.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace Busq;
using namespace BusqTest;

namespace {

std::shared_ptr<MockProvider> dual_homed() {
    auto provider = std::make_shared<MockProvider>();
    provider->add_device(DeviceInfo{kMockUdid, ConnectionType::Value::Network, 30});
    provider->add_device(DeviceInfo{kMockUdid, ConnectionType::Value::Usb, 7});
    provider->add_device(DeviceInfo{"OTHER", ConnectionType::Value::Network, 31});
    return provider;
}

} // namespace

TEST(DeviceTest, CreateFindsListedDevice) {
    auto env    = MockEnvironment::create();
    auto device = Device::create(env.provider, kMockUdid);
    ASSERT_TRUE(device.is_ok());
    EXPECT_EQ(device.unwrap().udid().unwrap(), kMockUdid);
    EXPECT_EQ(device.unwrap().handle().unwrap(), 7u);
    EXPECT_TRUE(device.unwrap().connection_type().unwrap() == ConnectionType::Value::Usb);
}

TEST(DeviceTest, CreateRejectsUnknownAndEmptyIdentifiers) {
    auto env     = MockEnvironment::create();
    auto missing = Device::create(env.provider, "NOPE");
    ASSERT_TRUE(missing.is_err());
    EXPECT_TRUE(missing.unwrap_err().is(MobileDeviceError::NoDevice));

    auto empty = Device::create(env.provider, "");
    ASSERT_TRUE(empty.is_err());
    EXPECT_TRUE(empty.unwrap_err().is(MobileDeviceError::InvalidArgument));

    auto no_provider = Device::create(nullptr, kMockUdid);
    ASSERT_TRUE(no_provider.is_err());
    EXPECT_TRUE(no_provider.unwrap_err().is(MobileDeviceError::InvalidArgument));
}

TEST(DeviceTest, UsbWinsUnlessNetworkIsPreferred) {
    auto provider = dual_homed();

    auto any = Device::create(provider, kMockUdid).expect("usb");
    EXPECT_TRUE(any.connection_type().unwrap() == ConnectionType::Value::Usb);

    auto preferred = Device::create(provider, kMockUdid, LookupOptions::Usbmux | LookupOptions::PreferNetwork)
                         .expect("network");
    EXPECT_TRUE(preferred.connection_type().unwrap() == ConnectionType::Value::Network);
    EXPECT_EQ(preferred.handle().unwrap(), 30u);
}

TEST(DeviceTest, LookupOptionsRestrictTransports) {
    auto provider = dual_homed();

    auto usb_only = Device::create(provider, "OTHER", LookupOptions::Usbmux);
    ASSERT_TRUE(usb_only.is_err());
    EXPECT_TRUE(usb_only.unwrap_err().is(MobileDeviceError::NoDevice));

    auto network = Device::create(provider, "OTHER", LookupOptions::Network);
    ASSERT_TRUE(network.is_ok());
    EXPECT_EQ(network.unwrap().handle().unwrap(), 31u);
}

TEST(DeviceTest, ConnectOpensARawStream) {
    auto env    = MockEnvironment::create();
    auto device = env.device();
    auto conn   = device.connect(Lockdown::kPort);
    ASSERT_TRUE(conn.is_ok());
    EXPECT_FALSE(conn.unwrap().security_enabled());
    EXPECT_EQ(env.provider->connects, 1u);

    auto refused = device.connect(1);
    ASSERT_TRUE(refused.is_err());
    EXPECT_TRUE(refused.unwrap_err().in(ErrorDomain::MobileDevice));
}

TEST(DeviceTest, ReleaseIsTerminal) {
    auto env    = MockEnvironment::create();
    auto device = env.device();
    device.release();
    EXPECT_TRUE(device.released());

    EXPECT_TRUE(device.udid().unwrap_err().is(MobileDeviceError::DeallocatedDevice));
    EXPECT_TRUE(device.handle().unwrap_err().is(MobileDeviceError::DeallocatedDevice));
    EXPECT_TRUE(device.provider().unwrap_err().is(MobileDeviceError::DeallocatedDevice));
    EXPECT_TRUE(device.connect(Lockdown::kPort).unwrap_err().is(MobileDeviceError::DeallocatedDevice));

    // Twice is harmless
    device.release();
    EXPECT_TRUE(device.released());
}

TEST(DeviceTest, AdoptWrapsKnownInfo) {
    auto env    = MockEnvironment::create();
    auto device = Device::adopt(env.provider, DeviceInfo{kMockUdid, ConnectionType::Value::Usb, 7});
    ASSERT_TRUE(device.is_ok());
    EXPECT_EQ(device.unwrap().info().unwrap().handle, 7u);
    EXPECT_TRUE(Device::adopt(nullptr, DeviceInfo{}).is_err());
}

TEST(DeviceTest, ListReportsEveryAttachment) {
    auto provider = dual_homed();
    auto devices  = Device::list(*provider);
    ASSERT_TRUE(devices.is_ok());
    EXPECT_EQ(devices.unwrap().size(), 3u);
}

TEST(DeviceTest, SubscriptionDeliversUntilDisposed) {
    auto                     env = MockEnvironment::create();
    std::vector<DeviceEvent> seen;

    auto token = Device::subscribe(*env.provider, [&seen](const DeviceEvent& e) { seen.push_back(e); });
    ASSERT_TRUE(token.is_ok());
    EXPECT_EQ(env.provider->subscribers(), 1u);

    env.provider->emit(DeviceEvent{DeviceEventType::Add, DeviceInfo{"NEW", ConnectionType::Value::Usb, 9}});
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].type, DeviceEventType::Add);
    EXPECT_EQ(seen[0].device.udid, "NEW");

    token.unwrap().dispose();
    EXPECT_TRUE(token.unwrap().disposed());
    EXPECT_EQ(env.provider->subscribers(), 0u);

    env.provider->emit(DeviceEvent{DeviceEventType::Remove, DeviceInfo{"NEW", ConnectionType::Value::Usb, 9}});
    EXPECT_EQ(seen.size(), 1u);
}

TEST(DeviceTest, DroppingTheTokenUnsubscribes) {
    auto env = MockEnvironment::create();
    {
        auto token = Device::subscribe(*env.provider, [](const DeviceEvent&) {}).expect("subscribe");
        EXPECT_EQ(env.provider->subscribers(), 1u);
    }
    EXPECT_EQ(env.provider->subscribers(), 0u);
}

TEST(DeviceTest, SubscribeNeedsACallback) {
    auto env   = MockEnvironment::create();
    auto token = Device::subscribe(*env.provider, nullptr);
    ASSERT_TRUE(token.is_err());
    EXPECT_TRUE(token.unwrap_err().is(MobileDeviceError::InvalidArgument));
}
