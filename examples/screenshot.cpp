#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <busq++/device.hpp>
#include <busq++/log.hpp>
#include <busq++/screenshot.hpp>
#include <busq++/usbmuxd.hpp>

using namespace Busq;

[[noreturn]]
static void die(const char* msg, const Error& e) {
    std::cerr << msg << ": " << e.to_string() << "\n";
    std::exit(1);
}

static Device pick_device(const std::shared_ptr<UsbmuxdProvider>& provider, const std::string& udid,
                          LookupOptions options) {
    if (!udid.empty()) {
        return Device::create(provider, udid, options).unwrap_or_else([](Error e) -> Device {
            die("device not found", e);
        });
    }
    auto devices = Device::list(*provider).unwrap_or_else(
        [](Error e) -> std::vector<DeviceInfo> { die("failed to list devices", e); });
    if (devices.empty()) {
        std::cerr << "no devices connected\n";
        std::exit(1);
    }
    return Device::adopt(provider, devices[0]).expect("failed to adopt device");
}

int main(int argc, char** argv) {
    std::string   udid;
    std::string   out_path;
    LookupOptions options = LookupOptions::Usbmux | LookupOptions::Network;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-u") == 0 && i + 1 < argc) {
            udid = argv[++i];
        } else if (std::strcmp(argv[i], "-n") == 0) {
            options = options | LookupOptions::PreferNetwork;
        } else if (std::strcmp(argv[i], "-d") == 0) {
            set_debug_level(2);
        } else if (out_path.empty()) {
            out_path = argv[i];
        } else {
            out_path.clear();
            break;
        }
    }
    if (out_path.empty()) {
        std::cerr << "Usage: " << argv[0] << " [-u UDID] [-n] [-d] <output.png>\n";
        return 2;
    }

    auto provider = std::make_shared<UsbmuxdProvider>();
    auto device   = pick_device(provider, udid, options);

    // screenshotr is only present with a developer disk image mounted
    auto shooter  = ScreenshotClient::start(device, "screenshot").unwrap_or_else(
        [](Error e) -> ScreenshotClient { die("failed to start screenshotr", e); });
    auto image    = shooter.take_screenshot().unwrap_or_else(
        [](Error e) -> std::vector<uint8_t> { die("failed to capture screenshot", e); });

    std::ofstream file(out_path, std::ios::binary);
    if (!file) {
        std::cerr << "cannot write " << out_path << "\n";
        return 1;
    }
    file.write(reinterpret_cast<const char*>(image.data()), static_cast<std::streamsize>(image.size()));
    std::cout << out_path << ": " << image.size() << " bytes\n";
    return 0;
}
