#include <busq++/afc.hpp>
#include <busq++/device.hpp>
#include <busq++/usbmuxd.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace Busq;

[[noreturn]]
static void die(const char* msg, const Error& e) {
    std::cerr << msg << ": " << e.to_string() << "\n";
    std::exit(1);
}

static void usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " ls <path>\n"
              << "  " << argv0 << " info <path>\n"
              << "  " << argv0 << " get <remote> <local>\n"
              << "  " << argv0 << " put <local> <remote>\n"
              << "  " << argv0 << " mkdir <path>\n"
              << "  " << argv0 << " rm <path>\n"
              << "  " << argv0 << " devinfo\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }
    std::string cmd      = argv[1];

    auto        provider = std::make_shared<UsbmuxdProvider>();
    auto        devices  = Device::list(*provider).expect("failed to list devices");
    if (devices.empty()) {
        std::cerr << "no devices connected\n";
        return 1;
    }
    auto device = Device::adopt(provider, devices[0]).expect("failed to adopt device");
    auto afc    = AfcClient::start(device, "afc-client").unwrap_or_else(
        [](Error e) -> AfcClient { die("failed to start AFC", e); });

    if (cmd == "ls" && argc == 3) {
        auto entries = afc.read_directory(argv[2]).unwrap_or_else(
            [](Error e) -> std::vector<std::string> { die("read_directory failed", e); });
        for (const auto& name : entries) {
            std::cout << name << "\n";
        }
    } else if ((cmd == "info" && argc == 3) || (cmd == "devinfo" && argc == 2)) {
        auto info = (cmd == "info" ? afc.get_file_info(argv[2]) : afc.get_device_info())
                        .unwrap_or_else([](Error e) -> AfcInfo { die("info failed", e); });
        for (const auto& kv : info) {
            std::cout << kv.first << ": " << kv.second << "\n";
        }
    } else if (cmd == "get" && argc == 4) {
        afc.download(argv[2], argv[3]).expect("download failed");
    } else if (cmd == "put" && argc == 4) {
        afc.upload(argv[2], argv[3], [](double done) {
               std::cerr << "\r" << static_cast<int>(done * 100) << "%";
           })
            .expect("upload failed");
        std::cerr << "\n";
    } else if (cmd == "mkdir" && argc == 3) {
        afc.make_directory(argv[2]).expect("mkdir failed");
    } else if (cmd == "rm" && argc == 3) {
        afc.remove_recursive(argv[2]).expect("remove failed");
    } else {
        usage(argv[0]);
        return 2;
    }
    return 0;
}
