#include <busq++/device.hpp>
#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>
#include <busq++/usbmuxd.hpp>
#include <cstring>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    // Usage:
    //   ideviceinfo [-d] [-q domain] [-k key] [udid]
    std::optional<std::string> domain;
    std::optional<std::string> key;
    std::string                udid;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-d") == 0) {
            Busq::set_debug_level(2);
        } else if (std::strcmp(argv[i], "-q") == 0 && i + 1 < argc) {
            domain = argv[++i];
        } else if (std::strcmp(argv[i], "-k") == 0 && i + 1 < argc) {
            key = argv[++i];
        } else {
            udid = argv[i];
        }
    }

    auto provider = std::make_shared<Busq::UsbmuxdProvider>();
    if (udid.empty()) {
        auto devices = Busq::Device::list(*provider).expect("failed to get devices from usbmuxd");
        if (devices.empty()) {
            std::cerr << "no devices connected\n";
            return 1;
        }
        udid = devices[0].udid;
    }

    auto device   = Busq::Device::create(provider, udid).expect("device not found");
    auto lockdown = Busq::Lockdown::connect_with_handshake(device, "ideviceinfo")
                        .expect("lockdown handshake failed");

    auto values   = lockdown.get_value(domain, key);
    match_result(
        values,
        ok_val,
        {
            auto xml = ok_val.to_xml();
            if (xml.is_ok()) {
                std::cout << xml.unwrap();
            }
        },
        e,
        {
            std::cerr << "get values failed: " << e.to_string() << "\n";
            return 1;
        });
    return 0;
}
