#include <busq++/usbmuxd.hpp>

#include <gtest/gtest.h>

using namespace Busq;

TEST(UsbmuxdAddrTest, ParsesUnixSocketAddress) {
    auto addr = UsbmuxdAddr::parse("UNIX:/tmp/usbmuxd.sock");
    ASSERT_TRUE(addr.is_ok());
    EXPECT_EQ(addr.unwrap().to_string(), "UNIX:/tmp/usbmuxd.sock");
}

TEST(UsbmuxdAddrTest, ParsesHostAndPort) {
    auto addr = UsbmuxdAddr::parse("127.0.0.1:27015");
    ASSERT_TRUE(addr.is_ok());
    EXPECT_EQ(addr.unwrap().to_string(), "127.0.0.1:27015");
}

TEST(UsbmuxdAddrTest, RejectsMalformedAddresses) {
    for (const char* address : {"UNIX:", "localhost", ":27015", "localhost:", "localhost:99999", "host:12ab"}) {
        auto addr = UsbmuxdAddr::parse(address);
        ASSERT_TRUE(addr.is_err()) << address;
        EXPECT_TRUE(addr.unwrap_err().is(MobileDeviceError::InvalidArgument)) << address;
    }
}

TEST(UsbmuxdRecordTest, ReadsUsbAttachment) {
    Value props = Value::new_dict();
    props.set("SerialNumber", Value::from_string("00008101-000A")).unwrap();
    props.set("ConnectionType", Value::from_string("USB")).unwrap();
    Value record = Value::new_dict();
    record.set("DeviceID", Value::from_uint(12)).unwrap();
    record.set("Properties", std::move(props)).unwrap();

    auto info = device_info_from_record(record);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->udid, "00008101-000A");
    EXPECT_EQ(info->handle, 12u);
    EXPECT_TRUE(info->type == ConnectionType::Value::Usb);
}

TEST(UsbmuxdRecordTest, NetworkDeviceIdMayLiveInProperties) {
    Value props = Value::new_dict();
    props.set("SerialNumber", Value::from_string("net-device")).unwrap();
    props.set("ConnectionType", Value::from_string("Network")).unwrap();
    props.set("DeviceID", Value::from_uint(40)).unwrap();
    Value record = Value::new_dict();
    record.set("Properties", std::move(props)).unwrap();

    auto info = device_info_from_record(record);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->handle, 40u);
    EXPECT_TRUE(info->type == ConnectionType::Value::Network);
}

TEST(UsbmuxdRecordTest, IncompleteRecordsAreSkipped) {
    Value record = Value::new_dict();
    record.set("DeviceID", Value::from_uint(3)).unwrap();
    EXPECT_FALSE(device_info_from_record(record).has_value());

    Value props = Value::new_dict();
    props.set("SerialNumber", Value::from_string("x")).unwrap();
    props.set("ConnectionType", Value::from_string("Carrier Pigeon")).unwrap();
    Value odd = Value::new_dict();
    odd.set("DeviceID", Value::from_uint(4)).unwrap();
    odd.set("Properties", std::move(props)).unwrap();
    auto info = device_info_from_record(odd);
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->type == ConnectionType::Value::Unknown);
}
