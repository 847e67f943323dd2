#include "mock/afc_emulator.hpp"
#include "mock/mock_device.hpp"

#include <busq++/afc.hpp>
#include <busq++/installation_proxy.hpp>
#include <busq++/lockdown.hpp>
#include <busq++/syslog_relay.hpp>

#include <gtest/gtest.h>

using namespace Busq;
using namespace BusqTest;

namespace {

class QuietEndpoint : public Endpoint {
  public:
    std::vector<uint8_t> on_data(const uint8_t*, size_t) override { return {}; }
};

} // namespace

// A host session as a tool would run it: find the device, identify it, then
// talk to several services in turn over fresh lockdown sessions.
TEST(EndToEndTest, InspectDeviceThenUseServices) {
    auto env = MockEnvironment::create();
    env.add_service(InstallationProxy::kServiceName, std::make_shared<MockInstallationProxy>());
    auto afc_side = std::make_shared<AfcEmulator>();
    afc_side->put_dir("/Downloads");
    env.add_service(AfcClient::kServiceName, afc_side);
    auto syslog_port = env.add_service(SyslogRelayClient::kServiceName, std::make_shared<QuietEndpoint>());

    auto devices = Device::list(*env.provider);
    ASSERT_TRUE(devices.is_ok());
    ASSERT_EQ(devices.unwrap().size(), 1u);
    auto device = Device::create(env.provider, devices.unwrap()[0].udid).expect("device");

    {
        auto lockdown = Lockdown::connect_with_handshake(device, "busq-tests");
        ASSERT_TRUE(lockdown.is_ok());
        EXPECT_EQ(lockdown.unwrap().device_name().unwrap(), "Mock iPhone");
        EXPECT_EQ(lockdown.unwrap().product_version().unwrap(), "17.0");

        auto name = lockdown.unwrap().get_value(std::nullopt, std::string("DeviceName"));
        ASSERT_TRUE(name.is_ok());
        EXPECT_EQ(name.unwrap().type(), ValueType::String);
    }

    {
        auto proxy = InstallationProxy::start(device, "busq-tests");
        ASSERT_TRUE(proxy.is_ok());
        ClientOptions options;
        options.application_type(ApplicationType::User).return_attributes({"CFBundleIdentifier"});
        auto apps = proxy.unwrap().browse(options);
        ASSERT_TRUE(apps.is_ok());
        ASSERT_EQ(apps.unwrap().size(), 3u);
        EXPECT_EQ(apps.unwrap()[0]["CFBundleIdentifier"].as_string(), std::optional<std::string>("com.example.notes"));
    }

    {
        auto afc = AfcClient::start(device, "busq-tests");
        ASSERT_TRUE(afc.is_ok());
        auto handle = afc.unwrap().open("/Downloads/report.txt", AfcFileMode::WriteTruncate);
        ASSERT_TRUE(handle.is_ok());
        std::string text = "all systems nominal";
        ASSERT_TRUE(afc.unwrap().write(handle.unwrap(), std::vector<uint8_t>(text.begin(), text.end())).is_ok());
        ASSERT_TRUE(afc.unwrap().close(handle.unwrap()).is_ok());
        EXPECT_EQ(afc_side->contents("/Downloads/report.txt"), std::optional<std::string>(text));
    }

    {
        auto relay = SyslogRelayClient::start(device, "busq-tests");
        ASSERT_TRUE(relay.is_ok());
        env.provider->last_pipe(syslog_port)
            ->push(std::string("Oct 18 09:41:07 Mock-iPhone backboardd[64] <Notice>: display on\n"));
        auto text = relay.unwrap().receive(500);
        ASSERT_TRUE(text.is_ok());
        SyslogLineAssembler assembler;
        auto                lines = assembler.feed(text.unwrap());
        ASSERT_EQ(lines.size(), 1u);
        EXPECT_EQ(lines[0].process, std::optional<std::string>("backboardd"));
        EXPECT_EQ(lines[0].message, "display on");
    }

    device.release();
    EXPECT_TRUE(Lockdown::connect(device).unwrap_err().is(MobileDeviceError::DeallocatedDevice));
}
